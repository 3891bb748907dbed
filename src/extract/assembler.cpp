#include "extract/assembler.hpp"

#include "extract/extractors.hpp"
#include "extract/scope_filter.hpp"
#include "log/log.hpp"

#include <filesystem>

namespace vydoc::extract {

using model::Contract;
using types::Type;

namespace {

template <typename T>
void take(Extracted<T>&& extracted, std::vector<T>& items,
          std::vector<model::Diagnostic>& orphans) {
    items = std::move(extracted.items);
    orphans.insert(orphans.end(), extracted.diagnostics.begin(), extracted.diagnostics.end());
}

void bind_parameters(std::vector<model::Parameter>& params,
                     const std::vector<model::Constant>& constants) {
    for (auto& param : params) {
        param.type = bind_constant_bounds(param.type, constants);
    }
}

void bind_all(Contract& contract) {
    const auto& constants = contract.constants;

    for (auto& st : contract.structs) {
        bind_parameters(st.fields, constants);
    }
    for (auto& var : contract.variables) {
        var.type = bind_constant_bounds(var.type, constants);
    }
    for (auto& func : contract.functions) {
        bind_parameters(func.params, constants);
        if (func.return_type) {
            func.return_type = bind_constant_bounds(*func.return_type, constants);
        }
    }

    // A constant's own type may name another constant; bind against a snapshot.
    auto snapshot = contract.constants;
    for (auto& constant : contract.constants) {
        constant.type = bind_constant_bounds(constant.type, snapshot);
    }
}

auto contract_name(std::string_view relative_path, std::string_view filename) -> std::string {
    std::filesystem::path path(relative_path.empty() ? filename : relative_path);
    return path.stem().string();
}

} // namespace

auto bind_constant_bounds(const Type& type, const std::vector<model::Constant>& constants)
    -> Type {
    if (type.is<types::TupleType>()) {
        std::vector<Type> elements;
        for (const auto& element : type.as<types::TupleType>().elements) {
            elements.push_back(bind_constant_bounds(element, constants));
        }
        return Type::tuple(std::move(elements));
    }

    if (type.is<types::DynArrayType>()) {
        const auto& array = type.as<types::DynArrayType>();
        if (const auto* bound = std::get_if<types::ConstantBound>(&array.bound)) {
            for (const auto& constant : constants) {
                if (constant.name == bound->name) {
                    return Type::dyn_array(array.element.name,
                                           types::ConstantBound{bound->name, constant.value});
                }
            }
        }
    }
    return type;
}

auto assemble(const source::Source& source, std::string_view relative_path,
              const types::TypeResolver& resolver) -> Contract {
    Contract contract;
    contract.name = contract_name(relative_path, source.filename());
    contract.relative_path = std::string(relative_path);
    contract.docstring = extract_docstring(source);

    take(extract_enums(source), contract.enums, contract.diagnostics);
    take(extract_structs(source, resolver), contract.structs, contract.diagnostics);
    take(extract_events(source, resolver), contract.events, contract.diagnostics);
    take(extract_constants(source, resolver), contract.constants, contract.diagnostics);
    take(extract_variables(source, resolver), contract.variables, contract.diagnostics);

    auto groups = extract_functions(source, resolver);
    contract.functions = std::move(groups.external);
    for (auto& func : groups.internal) {
        contract.functions.push_back(std::move(func));
    }
    contract.diagnostics.insert(contract.diagnostics.end(), groups.diagnostics.begin(),
                                groups.diagnostics.end());

    bind_all(contract);

    for (const auto& diag : contract.all_diagnostics()) {
        VYDOC_LOG_WARN("extract", source.filename() << ":" << diag.line << ": " << diag.code << " "
                                                    << diag.message);
    }
    VYDOC_LOG_DEBUG("extract", contract.name << ": " << contract.functions.size()
                                             << " functions, " << contract.variables.size()
                                             << " variables, " << contract.constants.size()
                                             << " constants");
    return contract;
}

} // namespace vydoc::extract
