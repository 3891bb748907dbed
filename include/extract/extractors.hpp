//! # Entity Extractors
//!
//! One recognizer per entity kind. Each reads the whole `Source` and
//! returns the entities it found in declaration order. Extractors share no
//! mutable state and may run in any order.
//!
//! ## Recognized Forms
//!
//! ```text
//! """Contract docstring"""             first statement of the file
//! enum Status:                         also `flag`, or `enum Status { A, B }`
//!     PENDING
//! MAX_SUPPLY: constant(uint256) = 10   any indentation
//! struct Point:                        or `struct Point { x: int128, y: int128 }`
//!     x: int128
//! event Transfer:                      `indexed(T)` marks indexed fields
//!     sender: indexed(address)
//! @external                            visibility comes from the decorator run
//! def transfer(to: address) -> bool:
//!     """Docstring."""
//! ```
//!
//! Storage variables are read by the scope filter (`extract/scope_filter.hpp`).

#ifndef VYDOC_EXTRACT_EXTRACTORS_HPP
#define VYDOC_EXTRACT_EXTRACTORS_HPP

#include "model/contract.hpp"
#include "source/source.hpp"
#include "types/resolver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vydoc::extract {

/// Entities from one extractor, plus diagnostics for declarations that were
/// recognized but produced no entity (e.g. an unterminated brace body).
template <typename T> struct Extracted {
    std::vector<T> items;
    std::vector<model::Diagnostic> diagnostics;
};

/// Functions split by visibility, each group in source order.
struct FunctionGroups {
    std::vector<model::Function> external;
    std::vector<model::Function> internal;
    std::vector<model::Diagnostic> diagnostics;
};

/// The triple-quoted block forming the first statement of the file.
///
/// Blank lines and `#` comment lines (version pragmas) may precede it.
[[nodiscard]] auto extract_docstring(const source::Source& source) -> std::optional<std::string>;

[[nodiscard]] auto extract_enums(const source::Source& source) -> Extracted<model::Enum>;

[[nodiscard]] auto extract_constants(const source::Source& source,
                                     const types::TypeResolver& resolver)
    -> Extracted<model::Constant>;

[[nodiscard]] auto extract_structs(const source::Source& source,
                                   const types::TypeResolver& resolver)
    -> Extracted<model::Struct>;

[[nodiscard]] auto extract_events(const source::Source& source,
                                  const types::TypeResolver& resolver)
    -> Extracted<model::Event>;

/// Functions with an `@external` or `@internal` decorator.
///
/// A `def` carrying neither (interface signatures, `@deploy` constructors)
/// is skipped.
[[nodiscard]] auto extract_functions(const source::Source& source,
                                     const types::TypeResolver& resolver) -> FunctionGroups;

} // namespace vydoc::extract

#endif // VYDOC_EXTRACT_EXTRACTORS_HPP
