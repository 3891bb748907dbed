#include "extract/scope_filter.hpp"

#include "extract/members.hpp"
#include "source/scanner.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>

namespace vydoc::extract {

using source::Line;
using source::Source;

namespace {

constexpr std::array<std::string_view, 5> DECLARATION_KEYWORDS = {"struct", "event", "enum",
                                                                  "flag", "interface"};

constexpr std::array<std::string_view, 4> DIRECTIVES = {"implements", "uses", "initializes",
                                                        "exports"};

constexpr std::array<std::string_view, 2> STORAGE_LOCATIONS = {"immutable", "transient"};

auto starts_declaration(std::string_view stripped) -> bool {
    return std::any_of(DECLARATION_KEYWORDS.begin(), DECLARATION_KEYWORDS.end(),
                       [&](std::string_view keyword) {
                           return source::starts_with_keyword(stripped, keyword);
                       });
}

/// Inner text of `wrapper(...)` when it spans the whole of `text`.
auto unwrap_call(std::string_view text, std::string_view wrapper)
    -> std::optional<std::string_view> {
    if (!source::starts_with_keyword(text, wrapper)) {
        return std::nullopt;
    }
    auto open = text.find_first_not_of(" \t", wrapper.size());
    if (open == std::string_view::npos || text[open] != '(') {
        return std::nullopt;
    }
    if (source::find_matching(text, open) != text.size() - 1) {
        return std::nullopt;
    }
    return source::trim(text.substr(open + 1, text.size() - open - 2));
}

} // namespace

auto scope_state_to_string(ScopeState state) -> std::string_view {
    switch (state) {
    case ScopeState::OutsideFunction:
        return "outside-function";
    case ScopeState::InsideFunction:
        return "inside-function";
    case ScopeState::InsideDeclaration:
        return "inside-declaration";
    }
    return "unknown";
}

// ============================================================================
// ScopeFilter
// ============================================================================

void ScopeFilter::transition(ScopeState to, ScopeTrigger trigger) {
    state_ = to;
    last_trigger_ = trigger;
}

void ScopeFilter::reset() {
    state_ = ScopeState::OutsideFunction;
    last_trigger_ = ScopeTrigger::None;
    declaration_indent_ = 0;
}

auto ScopeFilter::feed(const Line& line) -> bool {
    last_trigger_ = ScopeTrigger::None;

    // Blank lines inside a docstring do not end a block.
    if (line.in_string) {
        return false;
    }
    if (line.is_blank()) {
        if (state_ != ScopeState::OutsideFunction) {
            transition(ScopeState::OutsideFunction, ScopeTrigger::BlankLine);
        }
        return false;
    }

    if (!line.is_code()) {
        return state_ == ScopeState::OutsideFunction;
    }

    if (state_ == ScopeState::InsideDeclaration && line.indent <= declaration_indent_) {
        transition(ScopeState::OutsideFunction, ScopeTrigger::Dedent);
    }

    auto stripped = line.stripped();
    if (state_ != ScopeState::InsideDeclaration &&
        (stripped.front() == '@' || source::starts_with_keyword(stripped, "def"))) {
        transition(ScopeState::InsideFunction, ScopeTrigger::FunctionStart);
        return false;
    }
    if (state_ == ScopeState::OutsideFunction && starts_declaration(stripped)) {
        transition(ScopeState::InsideDeclaration, ScopeTrigger::DeclarationStart);
        declaration_indent_ = line.indent;
        return false;
    }

    return state_ == ScopeState::OutsideFunction;
}

auto module_level_lines(const Source& source) -> std::vector<const Line*> {
    std::vector<const Line*> kept;
    ScopeFilter filter;
    for (const auto& line : source.lines()) {
        if (filter.feed(line)) {
            kept.push_back(&line);
        }
    }
    return kept;
}

// ============================================================================
// Variable Matcher
// ============================================================================

auto extract_variables(const Source& source, const types::TypeResolver& resolver)
    -> Extracted<model::Variable> {
    Extracted<model::Variable> result;
    const Line* first_line = source.lines().data();
    size_t consumed_until = 0;

    for (const Line* line : module_level_lines(source)) {
        auto index = static_cast<size_t>(line - first_line);
        if (!line->is_code() || index < consumed_until) {
            continue;
        }

        // A declaration may continue over lines until its brackets close.
        std::string text;
        auto statement = detail::read_statement(source, index);
        if (source::is_balanced(statement)) {
            text = detail::join_statement(statement);
            auto last = static_cast<size_t>(statement.data() - source.content().data()) +
                        statement.size() - 1;
            consumed_until = source.line_of(last);
        } else {
            text = std::string(source::trim(detail::strip_comment(line->stripped())));
        }

        size_t pos = 0;
        auto name = source::read_identifier(text, pos);
        if (name.empty() ||
            std::find(DIRECTIVES.begin(), DIRECTIVES.end(), name) != DIRECTIVES.end()) {
            continue;
        }
        auto rest = source::trim(std::string_view(text).substr(pos));
        if (rest.empty() || rest.front() != ':') {
            continue;
        }

        auto type_text = detail::strip_default(rest.substr(1));
        if (type_text.empty() || source::starts_with_keyword(type_text, "constant")) {
            continue;
        }

        auto visibility = model::VariableVisibility::Private;
        if (auto inner = unwrap_call(type_text, "public")) {
            visibility = model::VariableVisibility::Public;
            type_text = *inner;
        }
        for (auto location : STORAGE_LOCATIONS) {
            if (auto inner = unwrap_call(type_text, location)) {
                type_text = *inner;
                break;
            }
        }

        std::vector<model::Diagnostic> diagnostics;
        auto type = detail::resolve_member_type(resolver, type_text, std::string(name),
                                                line->number, diagnostics);
        if (!type) {
            result.diagnostics.insert(result.diagnostics.end(), diagnostics.begin(),
                                      diagnostics.end());
            continue;
        }
        result.items.push_back(model::Variable{std::string(name), std::move(*type), visibility,
                                               line->number, std::move(diagnostics)});
    }
    return result;
}

} // namespace vydoc::extract
