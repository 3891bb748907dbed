//! # Type Model
//!
//! The resolved form of a type expression written in contract source:
//!
//! - `ScalarType`: an atomic name (`uint256`, `address`, or anything unknown)
//! - `TupleType`: `(T1, T2, ...)`, zero or more members
//! - `DynArrayType`: `DynArray[T, N]`, a scalar element with an upper bound
//!   that is either an integer literal or the name of a constant
//!
//! Types are plain values: copyable, comparable, and never mutated after
//! construction.

#ifndef VYDOC_TYPES_TYPE_HPP
#define VYDOC_TYPES_TYPE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vydoc::types {

struct Type;

/// An atomic type name.
struct ScalarType {
    std::string name;

    bool operator==(const ScalarType&) const = default;
};

/// Dynamic array bound written as a decimal literal.
struct IntegerBound {
    uint64_t value;

    bool operator==(const IntegerBound&) const = default;
};

/// Dynamic array bound written as the name of a module-level constant.
///
/// `value` holds the constant's literal once the contract assembler has
/// matched the name; it stays empty for forward or external constants.
struct ConstantBound {
    std::string name;
    std::optional<std::string> value;

    [[nodiscard]] auto is_resolved() const -> bool {
        return value.has_value();
    }

    bool operator==(const ConstantBound&) const = default;
};

using ArrayBound = std::variant<IntegerBound, ConstantBound>;

/// A fixed-arity ordered grouping of types.
struct TupleType {
    std::vector<Type> elements;

    [[nodiscard]] auto size() const -> size_t;
};

/// A variable-length sequence of a scalar type with a static upper bound.
struct DynArrayType {
    ScalarType element;
    ArrayBound bound;

    bool operator==(const DynArrayType&) const = default;
};

/// A resolved type expression.
struct Type {
    std::variant<ScalarType, TupleType, DynArrayType> kind;

    [[nodiscard]] static auto scalar(std::string name) -> Type;
    [[nodiscard]] static auto tuple(std::vector<Type> elements) -> Type;
    [[nodiscard]] static auto dyn_array(std::string element, ArrayBound bound) -> Type;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

auto operator==(const TupleType& lhs, const TupleType& rhs) -> bool;
auto operator==(const Type& lhs, const Type& rhs) -> bool;

/// Serializes a type back to source form: `uint256`, `(a, b)`, `DynArray[T, N]`.
///
/// Constant bounds are written by name whether or not they are resolved, so
/// the text always re-resolves to the unresolved form of the same type.
[[nodiscard]] auto type_to_string(const Type& type, std::string_view array_tag = "DynArray")
    -> std::string;

/// Serializes an array bound: the literal, or the constant's name.
[[nodiscard]] auto bound_to_string(const ArrayBound& bound) -> std::string;

} // namespace vydoc::types

#endif // VYDOC_TYPES_TYPE_HPP
