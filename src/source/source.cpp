#include "source/source.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace vydoc::source {

// ============================================================================
// Line
// ============================================================================

auto Line::is_blank() const -> bool {
    return text.find_first_not_of(" \t\r\f\v") == std::string_view::npos;
}

auto Line::stripped() const -> std::string_view {
    auto start = text.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

auto Line::is_code() const -> bool {
    if (in_string || is_blank()) {
        return false;
    }
    return stripped().front() != '#';
}

// ============================================================================
// Source
// ============================================================================

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    build_line_index();
}

// Lines view into content_, whose buffer may move with small-string storage.
Source::Source(Source&& other) noexcept
    : filename_(std::move(other.filename_)), content_(std::move(other.content_)) {
    build_line_index();
    other.lines_.clear();
}

Source& Source::operator=(Source&& other) noexcept {
    if (this != &other) {
        filename_ = std::move(other.filename_);
        content_ = std::move(other.content_);
        build_line_index();
        other.lines_.clear();
    }
    return *this;
}

void Source::build_line_index() {
    lines_.clear();

    // Quote delimiter of the triple-quoted string we are inside, or 0.
    char open_triple = 0;
    size_t line_start = 0;
    uint32_t number = 1;

    while (line_start <= content_.size()) {
        size_t line_end = content_.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = content_.size();
        }
        std::string_view text(content_.data() + line_start, line_end - line_start);
        if (!text.empty() && text.back() == '\r') {
            text.remove_suffix(1);
        }

        Line line{};
        line.text = text;
        line.offset = line_start;
        line.number = number;
        line.in_string = open_triple != 0;
        line.indent = static_cast<uint32_t>(std::min(text.find_first_not_of(" \t"), text.size()));

        // Advance the string state across this line.
        size_t i = 0;
        while (i < text.size()) {
            char c = text[i];
            bool triple = (c == '"' || c == '\'') && text.substr(i, 3) == std::string(3, c);
            if (open_triple != 0) {
                if (c == '\\') {
                    i += 2;
                } else if (c == open_triple && triple) {
                    open_triple = 0;
                    i += 3;
                } else {
                    ++i;
                }
                continue;
            }
            if (c == '#') {
                break;
            }
            if (triple) {
                open_triple = c;
                i += 3;
            } else if (c == '"' || c == '\'') {
                // Single-line literal: skip to the matching quote.
                size_t j = i + 1;
                while (j < text.size() && text[j] != c) {
                    j += text[j] == '\\' ? 2 : 1;
                }
                i = j + 1;
            } else {
                ++i;
            }
        }

        lines_.push_back(line);
        if (line_end == content_.size()) {
            break;
        }
        line_start = line_end + 1;
        ++number;
    }
}

auto Source::line_of(size_t offset) const -> uint32_t {
    auto it = std::upper_bound(lines_.begin(), lines_.end(), offset,
                               [](size_t value, const Line& line) { return value < line.offset; });
    if (it == lines_.begin()) {
        return 1;
    }
    return std::prev(it)->number;
}

auto Source::base_indent() const -> uint32_t {
    uint32_t base = std::numeric_limits<uint32_t>::max();
    for (const auto& line : lines_) {
        if (line.is_code()) {
            base = std::min(base, line.indent);
        }
    }
    return base == std::numeric_limits<uint32_t>::max() ? 0 : base;
}

auto Source::from_file(const std::string& path) -> Result<Source, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "failed to open file: " + path;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        return "failed to read file: " + path;
    }

    return Source(path, buffer.str());
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace vydoc::source
