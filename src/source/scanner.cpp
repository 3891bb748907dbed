#include "source/scanner.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

namespace vydoc::source {

namespace {

auto closer_for(char open) -> char {
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    case '{':
        return '}';
    default:
        return '\0';
    }
}

auto is_opener(char c) -> bool {
    return c == '(' || c == '[' || c == '{';
}

auto is_closer(char c) -> bool {
    return c == ')' || c == ']' || c == '}';
}

auto starts_literal(char c) -> bool {
    return c == '#' || c == '"' || c == '\'';
}

/// Index just past the comment or quoted literal starting at `pos`.
///
/// Comments run to the end of the line. Single-quoted literals stop at a
/// newline; triple-quoted ones run to their closing triple.
auto literal_end(std::string_view text, size_t pos) -> size_t {
    char c = text[pos];
    if (c == '#') {
        auto end = text.find('\n', pos);
        return end == std::string_view::npos ? text.size() : end;
    }
    if (text.substr(pos, 3) == std::string(3, c)) {
        auto end = text.find(std::string(3, c), pos + 3);
        return end == std::string_view::npos ? text.size() : end + 3;
    }
    for (size_t i = pos + 1; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        } else if (text[i] == c) {
            return i + 1;
        } else if (text[i] == '\n') {
            return i;
        }
    }
    return text.size();
}

auto is_ident_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

auto trim(std::string_view text) -> std::string_view {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

auto is_identifier(std::string_view text) -> bool {
    if (text.empty() || !is_ident_start(text.front())) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), is_ident_char);
}

auto is_decimal(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

auto is_balanced(std::string_view text) -> bool {
    std::string stack;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (starts_literal(c)) {
            i = literal_end(text, i) - 1;
        } else if (is_opener(c)) {
            stack.push_back(closer_for(c));
        } else if (is_closer(c)) {
            if (stack.empty() || stack.back() != c) {
                return false;
            }
            stack.pop_back();
        }
    }
    return stack.empty();
}

auto split_top_level(std::string_view text, char separator) -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    int depth = 0;
    size_t start = 0;

    auto push_segment = [&](size_t end) {
        auto segment = trim(text.substr(start, end - start));
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (starts_literal(c)) {
            i = literal_end(text, i) - 1;
        } else if (is_opener(c)) {
            ++depth;
        } else if (is_closer(c)) {
            depth = std::max(0, depth - 1);
        } else if (c == separator && depth == 0) {
            push_segment(i);
            start = i + 1;
        }
    }
    push_segment(text.size());
    return segments;
}

auto find_matching(std::string_view text, size_t open_pos) -> size_t {
    if (open_pos >= text.size() || !is_opener(text[open_pos])) {
        return std::string_view::npos;
    }
    char open = text[open_pos];
    char close = closer_for(open);
    int depth = 0;
    for (size_t i = open_pos; i < text.size(); ++i) {
        if (starts_literal(text[i])) {
            i = literal_end(text, i) - 1;
        } else if (text[i] == open) {
            ++depth;
        } else if (text[i] == close) {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string_view::npos;
}

auto starts_with_keyword(std::string_view stripped, std::string_view keyword) -> bool {
    if (!stripped.starts_with(keyword)) {
        return false;
    }
    if (stripped.size() == keyword.size()) {
        return true;
    }
    char next = stripped[keyword.size()];
    return next == ' ' || next == '\t' || next == '(' || next == '[' || next == '{' || next == ':';
}

auto read_identifier(std::string_view text, size_t& pos) -> std::string_view {
    size_t i = pos;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) {
        ++i;
    }
    if (i >= text.size() || !is_ident_start(text[i])) {
        return {};
    }
    size_t start = i;
    while (i < text.size() && is_ident_char(text[i])) {
        ++i;
    }
    pos = i;
    return text.substr(start, i - start);
}

auto clean_docstring(std::string_view raw) -> std::string {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find('\n', start);
        if (end == std::string_view::npos) {
            end = raw.size();
        }
        auto line = raw.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }

    // Common indentation of continuation lines.
    size_t margin = std::numeric_limits<size_t>::max();
    for (size_t i = 1; i < lines.size(); ++i) {
        auto indent = lines[i].find_first_not_of(" \t");
        if (indent != std::string_view::npos) {
            margin = std::min(margin, indent);
        }
    }

    std::vector<std::string> cleaned;
    cleaned.emplace_back(trim(lines.front()));
    for (size_t i = 1; i < lines.size(); ++i) {
        auto line = lines[i];
        if (margin != std::numeric_limits<size_t>::max() && line.size() >= margin) {
            line.remove_prefix(margin);
        } else {
            line = trim(line);
        }
        auto last = line.find_last_not_of(" \t");
        cleaned.emplace_back(last == std::string_view::npos ? std::string_view{}
                                                            : line.substr(0, last + 1));
    }

    while (!cleaned.empty() && cleaned.front().empty()) {
        cleaned.erase(cleaned.begin());
    }
    while (!cleaned.empty() && cleaned.back().empty()) {
        cleaned.pop_back();
    }

    std::string result;
    for (size_t i = 0; i < cleaned.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += cleaned[i];
    }
    return result;
}

} // namespace vydoc::source
