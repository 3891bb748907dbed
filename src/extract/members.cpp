#include "extract/members.hpp"

#include "source/scanner.hpp"

namespace vydoc::extract::detail {

using source::Line;
using source::Source;

namespace {

auto split_members(const Source& source, size_t begin, size_t end) -> std::vector<Member> {
    std::vector<Member> members;
    auto content = source.content();
    size_t pos = begin;

    while (pos < end) {
        size_t line_end = content.find('\n', pos);
        if (line_end == std::string_view::npos || line_end > end) {
            line_end = end;
        }
        uint32_t line_number = source.line_of(pos);
        const Line& line = source.lines()[line_number - 1];
        auto text = content.substr(pos, line_end - pos);
        pos = line_end + 1;

        // A body line that opens inside a docstring is prose, not members.
        if (line.in_string) {
            continue;
        }

        for (auto segment : source::split_top_level(strip_comment(text))) {
            if (segment == "pass" || segment.front() == '"' || segment.front() == '\'') {
                continue;
            }
            auto offset = static_cast<size_t>(segment.data() - content.data());
            members.push_back(Member{segment, source.line_of(offset)});
        }
    }
    return members;
}

} // namespace

auto find_declarations(const Source& source, std::initializer_list<std::string_view> keywords)
    -> std::vector<DeclarationSite> {
    std::vector<DeclarationSite> sites;
    const auto& lines = source.lines();

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (!line.is_code()) {
            continue;
        }
        auto stripped = line.stripped();
        for (auto keyword : keywords) {
            if (!source::starts_with_keyword(stripped, keyword)) {
                continue;
            }
            size_t pos = keyword.size();
            auto name = source::read_identifier(stripped, pos);
            if (name.empty()) {
                break;
            }
            auto stripped_offset = static_cast<size_t>(stripped.data() - source.content().data());
            sites.push_back(DeclarationSite{keyword, name, i, stripped_offset + pos});
            break;
        }
    }
    return sites;
}

auto read_body(const Source& source, const DeclarationSite& site) -> Body {
    auto content = source.content();
    const auto& lines = source.lines();
    const auto& header = lines[site.line_index];

    size_t pos = site.after_name;
    while (pos < content.size() && (content[pos] == ' ' || content[pos] == '\t')) {
        ++pos;
    }
    if (pos >= content.size()) {
        return Body{{}, false};
    }

    char opener = content[pos];
    if (opener == '{' || opener == '(') {
        auto close = source::find_matching(content, pos);
        if (close == std::string_view::npos) {
            return Body{{}, false};
        }
        return Body{split_members(source, pos + 1, close), true};
    }

    if (opener != ':') {
        return Body{{}, false};
    }

    size_t end = header.offset + header.text.size();
    for (size_t j = site.line_index + 1; j < lines.size(); ++j) {
        const auto& line = lines[j];
        if (line.is_blank()) {
            continue;
        }
        if (!line.in_string && line.indent <= header.indent) {
            break;
        }
        end = line.offset + line.text.size();
    }
    return Body{split_members(source, pos + 1, end), true};
}

auto read_statement(const Source& source, size_t line_index) -> std::string_view {
    const auto& lines = source.lines();
    auto content = source.content();
    auto begin = static_cast<size_t>(lines[line_index].stripped().data() - content.data());
    size_t end = lines[line_index].offset + lines[line_index].text.size();

    for (size_t j = line_index + 1; j < lines.size(); ++j) {
        if (source::is_balanced(content.substr(begin, end - begin))) {
            break;
        }
        end = lines[j].offset + lines[j].text.size();
    }
    return content.substr(begin, end - begin);
}

auto join_statement(std::string_view statement) -> std::string {
    std::string joined;
    size_t start = 0;
    while (start <= statement.size()) {
        size_t end = statement.find('\n', start);
        if (end == std::string_view::npos) {
            end = statement.size();
        }
        auto piece = source::trim(strip_comment(statement.substr(start, end - start)));
        start = end + 1;
        if (piece.empty()) {
            continue;
        }
        bool tight = joined.empty() || joined.back() == '(' || joined.back() == '[' ||
                     piece.front() == ')' || piece.front() == ']';
        if (!tight) {
            joined += ' ';
        }
        joined += piece;
    }
    return joined;
}

auto strip_comment(std::string_view text) -> std::string_view {
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote != 0) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return text.substr(0, i);
        }
    }
    return text;
}

auto split_declaration(std::string_view member)
    -> std::optional<std::pair<std::string_view, std::string_view>> {
    auto colon = member.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto name = source::trim(member.substr(0, colon));
    auto type = source::trim(member.substr(colon + 1));
    if (!source::is_identifier(name) || type.empty()) {
        return std::nullopt;
    }
    return std::make_pair(name, type);
}

auto strip_default(std::string_view text) -> std::string_view {
    int depth = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --depth;
        } else if (c == '=' && depth == 0) {
            return source::trim(text.substr(0, i));
        }
    }
    return source::trim(text);
}

auto resolve_member_type(const types::TypeResolver& resolver, std::string_view type_text,
                         const std::string& subject, uint32_t line,
                         std::vector<model::Diagnostic>& diagnostics)
    -> std::optional<types::Type> {
    auto resolved = resolver.resolve(type_text);
    if (is_err(resolved)) {
        auto message = subject + ": " + unwrap_err(resolved).message;
        diagnostics.push_back(
            make_diagnostic(model::Severity::Error, model::codes::MALFORMED_TYPE, message, line));
        return std::nullopt;
    }

    auto& value = unwrap(resolved);
    for (const auto& warning : value.warnings) {
        auto message = subject + ": " + warning;
        diagnostics.push_back(make_diagnostic(model::Severity::Warning,
                                              model::codes::NONCONFORMING_TYPE, message, line));
    }
    return std::move(value.type);
}

auto make_diagnostic(model::Severity severity, const char* code, std::string message,
                     uint32_t line) -> model::Diagnostic {
    return model::Diagnostic{severity, code, std::move(message), line};
}

} // namespace vydoc::extract::detail
