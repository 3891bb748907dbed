//! # Type Resolver Implementation

#include "types/resolver.hpp"

#include "source/scanner.hpp"

#include <charconv>

namespace vydoc::types {

using source::find_matching;
using source::split_top_level;
using source::trim;

TypeResolver::TypeResolver(TypeVocabulary vocabulary) : vocabulary_(std::move(vocabulary)) {}

auto TypeResolver::parse(std::string_view expression) const -> Result<Type, TypeError> {
    auto text = trim(expression);
    if (text.empty()) {
        return TypeError{"empty type expression"};
    }
    if (!source::is_balanced(text)) {
        return TypeError{"unbalanced brackets in type expression '" + std::string(text) + "'"};
    }

    if (text.front() == '(') {
        return parse_tuple(text);
    }

    const auto& tag = vocabulary_.dynamic_array_tag();
    if (text.starts_with(tag)) {
        auto open = text.find_first_not_of(" \t", tag.size());
        if (open != std::string_view::npos && text[open] == '[') {
            return parse_dyn_array(text, open);
        }
    }

    return Type::scalar(std::string(text));
}

auto TypeResolver::parse_tuple(std::string_view text) const -> Result<Type, TypeError> {
    auto close = find_matching(text, 0);
    if (close != text.size() - 1) {
        return TypeError{"unexpected text after tuple in '" + std::string(text) + "'"};
    }

    std::vector<Type> elements;
    for (auto member : split_top_level(text.substr(1, close - 1))) {
        auto parsed = parse(member);
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        elements.push_back(std::move(unwrap(parsed)));
    }
    return Type::tuple(std::move(elements));
}

auto TypeResolver::parse_dyn_array(std::string_view text, size_t open) const
    -> Result<Type, TypeError> {
    auto close = find_matching(text, open);
    if (close != text.size() - 1) {
        return TypeError{"unexpected text after dynamic array in '" + std::string(text) + "'"};
    }

    auto parts = split_top_level(text.substr(open + 1, close - open - 1));
    if (parts.size() != 2) {
        return TypeError{"dynamic array '" + std::string(text) +
                         "' needs an element type and a bound"};
    }

    auto element = parse(parts[0]);
    if (is_err(element)) {
        return unwrap_err(element);
    }
    if (!unwrap(element).is<ScalarType>()) {
        return TypeError{"dynamic array element '" + std::string(parts[0]) +
                         "' must be a scalar type"};
    }

    auto bound = parse_bound(parts[1]);
    if (is_err(bound)) {
        return unwrap_err(bound);
    }

    return Type::dyn_array(unwrap(element).as<ScalarType>().name, std::move(unwrap(bound)));
}

auto TypeResolver::parse_bound(std::string_view text) const -> Result<ArrayBound, TypeError> {
    if (source::is_decimal(text)) {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return TypeError{"dynamic array bound '" + std::string(text) + "' is out of range"};
        }
        return ArrayBound{IntegerBound{value}};
    }
    if (source::is_identifier(text)) {
        return ArrayBound{ConstantBound{std::string(text), std::nullopt}};
    }
    return TypeError{"dynamic array bound '" + std::string(text) +
                     "' is neither an integer nor a constant name"};
}

auto TypeResolver::validate(const Type& type) const -> std::vector<std::string> {
    std::vector<std::string> warnings;
    collect_warnings(type, warnings);
    return warnings;
}

void TypeResolver::collect_warnings(const Type& type, std::vector<std::string>& warnings) const {
    if (type.is<TupleType>()) {
        for (const auto& element : type.as<TupleType>().elements) {
            collect_warnings(element, warnings);
        }
        return;
    }

    const auto& name = type.is<ScalarType>() ? type.as<ScalarType>().name
                                             : type.as<DynArrayType>().element.name;
    if (!vocabulary_.contains(name)) {
        warnings.push_back("'" + name + "' is not a valid type");
    }
}

auto TypeResolver::resolve(std::string_view expression) const -> Result<ResolvedType, TypeError> {
    auto parsed = parse(expression);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    auto warnings = validate(unwrap(parsed));
    return ResolvedType{std::move(unwrap(parsed)), std::move(warnings)};
}

auto TypeResolver::to_string(const Type& type) const -> std::string {
    return type_to_string(type, vocabulary_.dynamic_array_tag());
}

} // namespace vydoc::types
