//! # Type Resolver
//!
//! Turns a type expression string into a `Type`, in two phases:
//!
//! 1. **Parse**: structural recognition of scalars, parenthesized tuples and
//!    `DynArray[T, N]`. Unbalanced or unsplittable bracket syntax is a hard
//!    error: the field holding it cannot be rendered at all.
//! 2. **Validate**: every scalar name is checked against the vocabulary.
//!    Unknown names are warnings, never errors, so newer language types pass
//!    through unchanged.
//!
//! ## Example
//!
//! ```cpp
//! TypeResolver resolver;
//! auto result = resolver.resolve("DynArray[uint256, MAX_OWNERS]");
//! if (is_ok(result)) {
//!     const auto& array = unwrap(result).type.as<DynArrayType>();
//!     // array.bound holds ConstantBound{"MAX_OWNERS"}
//! }
//! ```

#ifndef VYDOC_TYPES_RESOLVER_HPP
#define VYDOC_TYPES_RESOLVER_HPP

#include "common.hpp"
#include "types/type.hpp"
#include "types/vocabulary.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vydoc::types {

/// A type expression that could not be parsed.
struct TypeError {
    std::string message;
};

/// A parsed type plus the validation warnings raised against it.
struct ResolvedType {
    Type type;
    std::vector<std::string> warnings; ///< One per non-conforming scalar name.

    [[nodiscard]] auto is_conforming() const -> bool {
        return warnings.empty();
    }
};

class TypeResolver {
public:
    explicit TypeResolver(TypeVocabulary vocabulary = TypeVocabulary::standard());

    /// Phase 1: structural parse, no vocabulary check.
    [[nodiscard]] auto parse(std::string_view expression) const -> Result<Type, TypeError>;

    /// Phase 2: one warning per scalar name outside the vocabulary.
    [[nodiscard]] auto validate(const Type& type) const -> std::vector<std::string>;

    /// Parse, then validate.
    [[nodiscard]] auto resolve(std::string_view expression) const
        -> Result<ResolvedType, TypeError>;

    /// Serializes with this resolver's dynamic array tag.
    [[nodiscard]] auto to_string(const Type& type) const -> std::string;

    [[nodiscard]] auto vocabulary() const -> const TypeVocabulary& {
        return vocabulary_;
    }

private:
    TypeVocabulary vocabulary_;

    [[nodiscard]] auto parse_tuple(std::string_view text) const -> Result<Type, TypeError>;
    [[nodiscard]] auto parse_dyn_array(std::string_view text, size_t open) const
        -> Result<Type, TypeError>;
    [[nodiscard]] auto parse_bound(std::string_view text) const -> Result<ArrayBound, TypeError>;
    void collect_warnings(const Type& type, std::vector<std::string>& warnings) const;
};

} // namespace vydoc::types

#endif // VYDOC_TYPES_RESOLVER_HPP
