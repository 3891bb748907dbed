//! # Contract Source Text
//!
//! Owns the text of one contract file and exposes it as a sequence of
//! classified lines. Every extractor reads the same immutable `Source`.
//!
//! ## Line Classification
//!
//! Each line records its indentation and whether it begins inside a
//! triple-quoted string. Keyword recognition only looks at lines that start
//! outside strings, so docstring prose such as "struct of balances:" never
//! becomes a declaration.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("owner: public(address)\n", "token.vy");
//! for (const auto& line : source.lines()) {
//!     if (line.is_code()) { ... }
//! }
//! ```

#ifndef VYDOC_SOURCE_SOURCE_HPP
#define VYDOC_SOURCE_SOURCE_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vydoc::source {

/// One physical line of a source file.
struct Line {
    std::string_view text; ///< Line text without the trailing newline.
    size_t offset;         ///< Byte offset of the first character.
    uint32_t number;       ///< 1-based line number.
    uint32_t indent;       ///< Leading whitespace width (tab counts as one).
    bool in_string;        ///< Line starts inside a triple-quoted string.

    /// True when the line holds only whitespace.
    [[nodiscard]] auto is_blank() const -> bool;

    /// Text after the indentation.
    [[nodiscard]] auto stripped() const -> std::string_view;

    /// True when the line is outside strings, not blank and not a comment.
    [[nodiscard]] auto is_code() const -> bool;
};

/// The text of a contract file with a line index.
///
/// String views returned by `content()` and `lines()` point into this
/// object. Moving rebuilds the line index against the new owner.
class Source {
public:
    Source(std::string filename, std::string content);

    Source(const Source&) = delete;
    Source& operator=(const Source&) = delete;
    Source(Source&& other) noexcept;
    Source& operator=(Source&& other) noexcept;

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto lines() const -> const std::vector<Line>& {
        return lines_;
    }

    /// Returns the 1-based line number containing `offset`.
    [[nodiscard]] auto line_of(size_t offset) const -> uint32_t;

    /// Smallest indentation among code lines (0 for an empty file).
    ///
    /// Lets snippets indented as a whole be read as if flush-left.
    [[nodiscard]] auto base_indent() const -> uint32_t;

    /// Loads a source file from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<Line> lines_;

    void build_line_index();
};

} // namespace vydoc::source

#endif // VYDOC_SOURCE_SOURCE_HPP
