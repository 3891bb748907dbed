//! # Scalar Type Vocabulary
//!
//! The fixed set of scalar type names a contract may use, plus the tag
//! that introduces a bounded dynamic array. The vocabulary is an immutable
//! value handed to the `TypeResolver`, so tests can resolve against an
//! alternate vocabulary without touching process-wide state.

#ifndef VYDOC_TYPES_VOCABULARY_HPP
#define VYDOC_TYPES_VOCABULARY_HPP

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace vydoc::types {

class TypeVocabulary {
public:
    /// Builds a vocabulary from explicit scalar names.
    TypeVocabulary(std::vector<std::string> scalar_names, std::string dynamic_array_tag);

    /// int8..int256 and uint8..uint256 in steps of 8, address, bool, Bytes, String;
    /// dynamic arrays are tagged `DynArray`.
    [[nodiscard]] static auto standard() -> const TypeVocabulary&;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    [[nodiscard]] auto dynamic_array_tag() const -> const std::string& {
        return dynamic_array_tag_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return names_.size();
    }

    /// Scalar names in the order they were given.
    [[nodiscard]] auto names() const -> const std::vector<std::string>& {
        return names_;
    }

private:
    std::vector<std::string> names_;
    std::unordered_set<std::string> lookup_;
    std::string dynamic_array_tag_;
};

} // namespace vydoc::types

#endif // VYDOC_TYPES_VOCABULARY_HPP
