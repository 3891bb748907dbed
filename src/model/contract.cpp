#include "model/contract.hpp"

#include <algorithm>

namespace vydoc::model {

auto severity_to_string(Severity severity) -> std::string_view {
    switch (severity) {
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    }
    return "unknown";
}

auto variable_visibility_to_string(VariableVisibility vis) -> std::string_view {
    switch (vis) {
    case VariableVisibility::Public:
        return "public";
    case VariableVisibility::Private:
        return "private";
    }
    return "unknown";
}

auto function_visibility_to_string(FunctionVisibility vis) -> std::string_view {
    switch (vis) {
    case FunctionVisibility::External:
        return "external";
    case FunctionVisibility::Internal:
        return "internal";
    }
    return "unknown";
}

namespace {

auto functions_with(const std::vector<Function>& functions, FunctionVisibility vis)
    -> std::vector<const Function*> {
    std::vector<const Function*> result;
    for (const auto& func : functions) {
        if (func.visibility == vis) {
            result.push_back(&func);
        }
    }
    return result;
}

template <typename Entity>
void append_diagnostics(const std::vector<Entity>& entities, std::vector<Diagnostic>& out) {
    for (const auto& entity : entities) {
        out.insert(out.end(), entity.diagnostics.begin(), entity.diagnostics.end());
    }
}

} // namespace

auto Contract::external_functions() const -> std::vector<const Function*> {
    return functions_with(functions, FunctionVisibility::External);
}

auto Contract::internal_functions() const -> std::vector<const Function*> {
    return functions_with(functions, FunctionVisibility::Internal);
}

auto Contract::find_constant(std::string_view name) const -> const Constant* {
    auto it = std::find_if(constants.begin(), constants.end(),
                           [&](const Constant& constant) { return constant.name == name; });
    return it != constants.end() ? &*it : nullptr;
}

auto Contract::all_diagnostics() const -> std::vector<Diagnostic> {
    std::vector<Diagnostic> result = diagnostics;
    append_diagnostics(enums, result);
    append_diagnostics(structs, result);
    append_diagnostics(events, result);
    append_diagnostics(constants, result);
    append_diagnostics(variables, result);
    append_diagnostics(functions, result);
    return result;
}

auto Contract::has_errors() const -> bool {
    auto all = all_diagnostics();
    return std::any_of(all.begin(), all.end(),
                       [](const Diagnostic& diag) { return diag.severity == Severity::Error; });
}

} // namespace vydoc::model
