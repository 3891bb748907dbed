#include "types/type.hpp"

namespace vydoc::types {

auto TupleType::size() const -> size_t {
    return elements.size();
}

auto Type::scalar(std::string name) -> Type {
    return Type{ScalarType{std::move(name)}};
}

auto Type::tuple(std::vector<Type> elements) -> Type {
    return Type{TupleType{std::move(elements)}};
}

auto Type::dyn_array(std::string element, ArrayBound bound) -> Type {
    return Type{DynArrayType{ScalarType{std::move(element)}, std::move(bound)}};
}

auto operator==(const TupleType& lhs, const TupleType& rhs) -> bool {
    return lhs.elements == rhs.elements;
}

auto operator==(const Type& lhs, const Type& rhs) -> bool {
    return lhs.kind == rhs.kind;
}

auto bound_to_string(const ArrayBound& bound) -> std::string {
    if (const auto* literal = std::get_if<IntegerBound>(&bound)) {
        return std::to_string(literal->value);
    }
    return std::get<ConstantBound>(bound).name;
}

auto type_to_string(const Type& type, std::string_view array_tag) -> std::string {
    if (type.is<ScalarType>()) {
        return type.as<ScalarType>().name;
    }

    if (type.is<TupleType>()) {
        std::string out = "(";
        const auto& elements = type.as<TupleType>().elements;
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += type_to_string(elements[i], array_tag);
        }
        out += ")";
        return out;
    }

    const auto& array = type.as<DynArrayType>();
    std::string out(array_tag);
    out += "[";
    out += array.element.name;
    out += ", ";
    out += bound_to_string(array.bound);
    out += "]";
    return out;
}

} // namespace vydoc::types
