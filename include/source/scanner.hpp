//! # Scanner Primitives
//!
//! Small text routines shared by the type resolver and the entity
//! extractors. All of them track bracket depth explicitly, so a comma inside
//! `DynArray[uint256, 10]` is never mistaken for a separator. Brackets and
//! separators inside `# comments` and quoted literals are not counted.

#ifndef VYDOC_SOURCE_SCANNER_HPP
#define VYDOC_SOURCE_SCANNER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace vydoc::source {

/// Trims spaces, tabs, carriage returns and newlines from both ends.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/// True for `[A-Za-z_][A-Za-z0-9_]*`.
[[nodiscard]] auto is_identifier(std::string_view text) -> bool;

/// True when `text` is non-empty and made only of decimal digits.
[[nodiscard]] auto is_decimal(std::string_view text) -> bool;

/// True when `()`, `[]` and `{}` in `text` are balanced and properly nested.
[[nodiscard]] auto is_balanced(std::string_view text) -> bool;

/// Splits on `separator` where it occurs outside any bracket pair.
///
/// Segments are trimmed and empty segments are dropped, so "a, b," yields
/// two segments. Depth never drops below zero: a stray closer stays in its
/// segment for the caller to reject.
[[nodiscard]] auto split_top_level(std::string_view text, char separator = ',')
    -> std::vector<std::string_view>;

/// Returns the index of the bracket closing the one at `open_pos`.
///
/// Only the bracket kind found at `open_pos` is counted. Returns npos when
/// the bracket is never closed.
[[nodiscard]] auto find_matching(std::string_view text, size_t open_pos) -> size_t;

/// True when `stripped` begins with `keyword` followed by whitespace,
/// the end of text, or one of `(`, `[`, `{`, `:`.
[[nodiscard]] auto starts_with_keyword(std::string_view stripped, std::string_view keyword)
    -> bool;

/// Reads the identifier starting at `pos` (after skipping blanks).
///
/// On success `pos` is left just past the identifier.
[[nodiscard]] auto read_identifier(std::string_view text, size_t& pos) -> std::string_view;

/// Normalizes a docstring body: drops leading and trailing blank lines and
/// removes the indentation common to every non-blank line after the first.
[[nodiscard]] auto clean_docstring(std::string_view raw) -> std::string;

} // namespace vydoc::source

#endif // VYDOC_SOURCE_SCANNER_HPP
