//! # Declaration Extractors
//!
//! Docstring, enum, constant, struct and event recognition. Bodies are read
//! by `detail::read_body`; this file only interprets the members.

#include "extract/extractors.hpp"
#include "extract/members.hpp"
#include "source/scanner.hpp"

#include <algorithm>

namespace vydoc::extract {

using detail::make_diagnostic;
using model::Diagnostic;
using model::Severity;
using source::Source;
namespace codes = model::codes;

namespace {

auto unterminated(const detail::DeclarationSite& site, uint32_t line) -> Diagnostic {
    return make_diagnostic(Severity::Error, codes::MALFORMED_DECLARATION,
                           std::string(site.keyword) + " '" + std::string(site.name) +
                               "' has an unterminated body",
                           line);
}

auto unreadable_member(std::string_view owner, std::string_view text, uint32_t line)
    -> Diagnostic {
    return make_diagnostic(Severity::Error, codes::MALFORMED_DECLARATION,
                           std::string(owner) + ": cannot read member '" + std::string(text) + "'",
                           line);
}

/// Strips an `indexed(...)` wrapper, reporting whether one was present.
auto unwrap_indexed(std::string_view type_text, bool& indexed) -> std::string_view {
    indexed = false;
    if (!source::starts_with_keyword(type_text, "indexed")) {
        return type_text;
    }
    auto open = type_text.find_first_not_of(" \t", 7);
    if (open == std::string_view::npos || type_text[open] != '(') {
        return type_text;
    }
    auto close = source::find_matching(type_text, open);
    if (close != type_text.size() - 1) {
        return type_text;
    }
    indexed = true;
    return source::trim(type_text.substr(open + 1, close - open - 1));
}

} // namespace

// ============================================================================
// Docstring
// ============================================================================

auto extract_docstring(const Source& source) -> std::optional<std::string> {
    auto content = source.content();
    for (const auto& line : source.lines()) {
        if (line.is_blank()) {
            continue;
        }
        auto stripped = line.stripped();
        if (!line.in_string && stripped.front() == '#') {
            continue;
        }
        if (stripped.starts_with("\"\"\"") || stripped.starts_with("'''")) {
            auto delimiter = stripped.substr(0, 3);
            auto start = static_cast<size_t>(stripped.data() - content.data()) + 3;
            auto end = content.find(delimiter, start);
            if (end == std::string_view::npos) {
                return std::nullopt;
            }
            return source::clean_docstring(content.substr(start, end - start));
        }
        return std::nullopt;
    }
    return std::nullopt;
}

// ============================================================================
// Enums
// ============================================================================

auto extract_enums(const Source& source) -> Extracted<model::Enum> {
    Extracted<model::Enum> result;
    const auto& lines = source.lines();

    for (const auto& site : detail::find_declarations(source, {"enum", "flag"})) {
        uint32_t line = lines[site.line_index].number;
        auto body = detail::read_body(source, site);
        if (!body.terminated) {
            result.diagnostics.push_back(unterminated(site, line));
            continue;
        }

        model::Enum entity;
        entity.name = std::string(site.name);
        entity.line = line;

        for (const auto& member : body.members) {
            if (!source::is_identifier(member.text)) {
                entity.diagnostics.push_back(
                    unreadable_member(entity.name, member.text, member.line));
                continue;
            }
            std::string value(member.text);
            if (std::find(entity.values.begin(), entity.values.end(), value) !=
                entity.values.end()) {
                entity.diagnostics.push_back(
                    make_diagnostic(Severity::Warning, codes::DUPLICATE_ENUM_VALUE,
                                    entity.name + ": duplicate value '" + value + "'",
                                    member.line));
                continue;
            }
            entity.values.push_back(std::move(value));
        }
        result.items.push_back(std::move(entity));
    }
    return result;
}

// ============================================================================
// Constants
// ============================================================================

auto extract_constants(const Source& source, const types::TypeResolver& resolver)
    -> Extracted<model::Constant> {
    Extracted<model::Constant> result;
    const auto& lines = source.lines();

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (!line.is_code()) {
            continue;
        }

        // NAME: constant(TYPE) = VALUE
        auto stripped = line.stripped();
        size_t pos = 0;
        auto name = source::read_identifier(stripped, pos);
        if (name.empty()) {
            continue;
        }
        auto rest = source::trim(stripped.substr(pos));
        if (rest.empty() || rest.front() != ':') {
            continue;
        }
        rest = source::trim(rest.substr(1));
        if (!source::starts_with_keyword(rest, "constant")) {
            continue;
        }

        auto statement = detail::read_statement(source, i);
        auto open = statement.find('(', statement.find(':'));
        auto close = open == std::string_view::npos ? std::string_view::npos
                                                    : source::find_matching(statement, open);
        if (close == std::string_view::npos) {
            result.diagnostics.push_back(make_diagnostic(
                Severity::Error, codes::MALFORMED_DECLARATION,
                "constant '" + std::string(name) + "' has an unclosed type", line.number));
            continue;
        }

        auto after = source::trim(detail::strip_comment(statement.substr(close + 1)));
        if (after.empty() || after.front() != '=' || source::trim(after.substr(1)).empty()) {
            result.diagnostics.push_back(make_diagnostic(
                Severity::Error, codes::MALFORMED_DECLARATION,
                "constant '" + std::string(name) + "' has no value", line.number));
            continue;
        }

        std::vector<Diagnostic> diagnostics;
        auto type = detail::resolve_member_type(
            resolver, statement.substr(open + 1, close - open - 1), std::string(name),
            line.number, diagnostics);
        if (!type) {
            result.diagnostics.insert(result.diagnostics.end(), diagnostics.begin(),
                                      diagnostics.end());
            continue;
        }

        result.items.push_back(model::Constant{std::string(name), std::move(*type),
                                               std::string(source::trim(after.substr(1))),
                                               line.number, std::move(diagnostics)});
    }
    return result;
}

// ============================================================================
// Structs
// ============================================================================

auto extract_structs(const Source& source, const types::TypeResolver& resolver)
    -> Extracted<model::Struct> {
    Extracted<model::Struct> result;
    const auto& lines = source.lines();

    for (const auto& site : detail::find_declarations(source, {"struct"})) {
        uint32_t line = lines[site.line_index].number;
        auto body = detail::read_body(source, site);
        if (!body.terminated) {
            result.diagnostics.push_back(unterminated(site, line));
            continue;
        }

        model::Struct entity;
        entity.name = std::string(site.name);
        entity.line = line;

        for (const auto& member : body.members) {
            auto decl = detail::split_declaration(member.text);
            if (!decl) {
                entity.diagnostics.push_back(
                    unreadable_member(entity.name, member.text, member.line));
                continue;
            }
            auto type = detail::resolve_member_type(
                resolver, decl->second, entity.name + "." + std::string(decl->first),
                member.line, entity.diagnostics);
            if (type) {
                entity.fields.push_back(model::Parameter{std::string(decl->first), *type});
            }
        }
        result.items.push_back(std::move(entity));
    }
    return result;
}

// ============================================================================
// Events
// ============================================================================

auto extract_events(const Source& source, const types::TypeResolver& resolver)
    -> Extracted<model::Event> {
    Extracted<model::Event> result;
    const auto& lines = source.lines();

    for (const auto& site : detail::find_declarations(source, {"event"})) {
        uint32_t line = lines[site.line_index].number;
        auto body = detail::read_body(source, site);
        if (!body.terminated) {
            result.diagnostics.push_back(unterminated(site, line));
            continue;
        }

        model::Event entity;
        entity.name = std::string(site.name);
        entity.line = line;

        for (const auto& member : body.members) {
            auto decl = detail::split_declaration(member.text);
            if (!decl) {
                entity.diagnostics.push_back(
                    unreadable_member(entity.name, member.text, member.line));
                continue;
            }

            bool indexed = false;
            auto type_text = unwrap_indexed(decl->second, indexed);
            auto subject = entity.name + "." + std::string(decl->first);
            auto type = detail::resolve_member_type(resolver, type_text, subject, member.line,
                                                    entity.diagnostics);
            if (!type) {
                continue;
            }

            // Event fields are scalar; a structured type keeps its text as the name.
            types::ScalarType scalar{std::string(type_text)};
            if (type->is<types::ScalarType>()) {
                scalar = type->as<types::ScalarType>();
            } else {
                entity.diagnostics.push_back(make_diagnostic(
                    Severity::Warning, codes::NONCONFORMING_TYPE,
                    subject + ": '" + scalar.name + "' is not a scalar type", member.line));
            }
            entity.fields.push_back(
                model::EventField{std::string(decl->first), std::move(scalar), indexed});
        }
        result.items.push_back(std::move(entity));
    }
    return result;
}

} // namespace vydoc::extract
