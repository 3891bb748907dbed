//! # Function Extractor
//!
//! Reads `def` signatures preceded by a decorator run. The parameter list
//! is taken from the raw content, so signatures may span several lines.

#include "extract/extractors.hpp"
#include "extract/members.hpp"
#include "source/scanner.hpp"

namespace vydoc::extract {

using detail::make_diagnostic;
using model::Severity;
using source::Source;
namespace codes = model::codes;

namespace {

/// Visibility named by the decorator run above line `def_index`.
auto decorator_visibility(const Source& source, size_t def_index)
    -> std::optional<model::FunctionVisibility> {
    const auto& lines = source.lines();
    std::optional<model::FunctionVisibility> visibility;

    for (size_t j = def_index; j > 0; --j) {
        const auto& line = lines[j - 1];
        if (line.is_blank() || line.in_string) {
            break;
        }
        auto stripped = line.stripped();
        if (stripped.front() == '#') {
            continue;
        }
        if (stripped.front() != '@') {
            break;
        }
        size_t pos = 1;
        auto name = source::read_identifier(stripped, pos);
        if (name == "external") {
            visibility = model::FunctionVisibility::External;
        } else if (name == "internal" && !visibility) {
            visibility = model::FunctionVisibility::Internal;
        }
    }
    return visibility;
}

/// Copy of `text` with `# comments` blanked out, keeping every offset.
auto blank_comments(std::string_view text) -> std::string {
    std::string result(text);
    size_t start = 0;
    while (start < result.size()) {
        size_t end = result.find('\n', start);
        if (end == std::string::npos) {
            end = result.size();
        }
        auto line = std::string_view(result).substr(start, end - start);
        auto kept = detail::strip_comment(line);
        for (size_t i = start + kept.size(); i < end; ++i) {
            result[i] = ' ';
        }
        start = end + 1;
    }
    return result;
}

auto skip_space(std::string_view content, size_t pos) -> size_t {
    while (pos < content.size() &&
           (content[pos] == ' ' || content[pos] == '\t' || content[pos] == '\r' ||
            content[pos] == '\n' || content[pos] == '\\')) {
        ++pos;
    }
    return pos;
}

/// Position of the first `:` at bracket depth zero, or npos.
auto find_body_colon(std::string_view content, size_t pos) -> size_t {
    int depth = 0;
    for (size_t i = pos; i < content.size(); ++i) {
        char c = content[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --depth;
        } else if (c == ':' && depth == 0) {
            return i;
        } else if (c == '\n' && depth == 0) {
            return std::string_view::npos;
        }
    }
    return std::string_view::npos;
}

/// The triple-quoted block that opens the body after `colon`, if any.
auto read_function_docstring(std::string_view content, size_t colon)
    -> std::optional<std::string> {
    auto start = skip_space(content, colon + 1);
    auto opening = content.substr(start, 3);
    if (opening != "\"\"\"" && opening != "'''") {
        return std::nullopt;
    }
    auto end = content.find(opening, start + 3);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return source::clean_docstring(content.substr(start + 3, end - start - 3));
}

void read_params(const Source& source, const types::TypeResolver& resolver, size_t open,
                 size_t close, model::Function& function) {
    auto content = source.content();
    auto text = blank_comments(content.substr(open + 1, close - open - 1));

    for (auto segment : source::split_top_level(text)) {
        auto offset = open + 1 + static_cast<size_t>(segment.data() - text.data());
        auto line = source.line_of(offset);

        auto decl = detail::split_declaration(segment);
        if (!decl) {
            function.diagnostics.push_back(make_diagnostic(
                Severity::Error, codes::MALFORMED_DECLARATION,
                function.name + ": cannot read parameter '" + std::string(segment) + "'", line));
            continue;
        }

        auto type = detail::resolve_member_type(resolver, detail::strip_default(decl->second),
                                                function.name + "." + std::string(decl->first),
                                                line, function.diagnostics);
        if (type) {
            function.params.push_back(model::Parameter{std::string(decl->first), *type});
        }
    }
}

} // namespace

auto extract_functions(const Source& source, const types::TypeResolver& resolver)
    -> FunctionGroups {
    FunctionGroups groups;
    const auto& lines = source.lines();
    auto content = source.content();

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (!line.is_code() || !source::starts_with_keyword(line.stripped(), "def")) {
            continue;
        }

        auto visibility = decorator_visibility(source, i);
        if (!visibility) {
            continue;
        }

        auto stripped = line.stripped();
        size_t pos = 3;
        auto name = source::read_identifier(stripped, pos);
        auto stripped_offset = static_cast<size_t>(stripped.data() - content.data());
        auto open = skip_space(content, stripped_offset + pos);
        if (name.empty() || open >= content.size() || content[open] != '(') {
            groups.diagnostics.push_back(make_diagnostic(Severity::Error,
                                                         codes::MALFORMED_DECLARATION,
                                                         "cannot read function signature",
                                                         line.number));
            continue;
        }

        auto close = source::find_matching(content, open);
        if (close == std::string_view::npos) {
            groups.diagnostics.push_back(make_diagnostic(
                Severity::Error, codes::MALFORMED_DECLARATION,
                "function '" + std::string(name) + "' has an unclosed parameter list",
                line.number));
            continue;
        }

        model::Function function;
        function.name = std::string(name);
        function.visibility = *visibility;
        function.line = line.number;
        read_params(source, resolver, open, close, function);

        auto after = skip_space(content, close + 1);
        auto colon = find_body_colon(content, after);
        if (content.substr(after, 2) == "->" && colon != std::string_view::npos) {
            auto return_text = content.substr(after + 2, colon - after - 2);
            function.return_type = detail::resolve_member_type(
                resolver, return_text, function.name + " return", source.line_of(after),
                function.diagnostics);
        }
        if (colon != std::string_view::npos) {
            function.docstring = read_function_docstring(content, colon);
        }

        if (function.visibility == model::FunctionVisibility::External) {
            groups.external.push_back(std::move(function));
        } else {
            groups.internal.push_back(std::move(function));
        }
    }
    return groups;
}

} // namespace vydoc::extract
