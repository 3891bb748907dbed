#include "types/vocabulary.hpp"

namespace vydoc::types {

TypeVocabulary::TypeVocabulary(std::vector<std::string> scalar_names, std::string dynamic_array_tag)
    : names_(std::move(scalar_names)), dynamic_array_tag_(std::move(dynamic_array_tag)) {
    lookup_.insert(names_.begin(), names_.end());
}

auto TypeVocabulary::standard() -> const TypeVocabulary& {
    static const TypeVocabulary vocabulary = [] {
        std::vector<std::string> names;
        for (int bits = 8; bits <= 256; bits += 8) {
            names.push_back("int" + std::to_string(bits));
        }
        for (int bits = 8; bits <= 256; bits += 8) {
            names.push_back("uint" + std::to_string(bits));
        }
        names.insert(names.end(), {"address", "bool", "Bytes", "String"});
        return TypeVocabulary(std::move(names), "DynArray");
    }();
    return vocabulary;
}

auto TypeVocabulary::contains(std::string_view name) const -> bool {
    return lookup_.contains(std::string(name));
}

} // namespace vydoc::types
