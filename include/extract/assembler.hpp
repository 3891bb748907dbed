//! # Contract Assembler
//!
//! Runs every extractor over one source and packages the results into a
//! `Contract`:
//!
//! 1. Extract docstring, enums, structs, events, constants, variables and
//!    functions from the same immutable text
//! 2. Order functions external first, each group in source order
//! 3. Bind `DynArray` bounds naming a constant to that constant's value
//! 4. Collect diagnostics of declarations that produced no entity
//!
//! A bound naming no extracted constant stays unresolved. Forward and
//! imported constants are legal, so this is not a diagnostic.

#ifndef VYDOC_EXTRACT_ASSEMBLER_HPP
#define VYDOC_EXTRACT_ASSEMBLER_HPP

#include "model/contract.hpp"
#include "source/source.hpp"
#include "types/resolver.hpp"

#include <string_view>
#include <vector>

namespace vydoc::extract {

/// Builds the Contract for one file.
///
/// `relative_path` is recorded as given; the contract name is its stem. An
/// empty file yields a Contract with every list empty.
[[nodiscard]] auto assemble(const source::Source& source, std::string_view relative_path,
                            const types::TypeResolver& resolver) -> model::Contract;

/// Returns `type` with every constant bound matched against `constants`.
[[nodiscard]] auto bind_constant_bounds(const types::Type& type,
                                        const std::vector<model::Constant>& constants)
    -> types::Type;

} // namespace vydoc::extract

#endif // VYDOC_EXTRACT_ASSEMBLER_HPP
