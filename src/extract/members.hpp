//! # Extractor Internals
//!
//! Declaration discovery and body reading shared by the extractors.
//! Not part of the public interface.

#ifndef VYDOC_EXTRACT_MEMBERS_HPP
#define VYDOC_EXTRACT_MEMBERS_HPP

#include "model/contract.hpp"
#include "source/source.hpp"
#include "types/resolver.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vydoc::extract::detail {

/// One comma- or newline-separated entry of a declaration body.
struct Member {
    std::string_view text;
    uint32_t line;
};

/// A line introducing a declaration: `<keyword> <name>`.
struct DeclarationSite {
    std::string_view keyword;
    std::string_view name;
    size_t line_index; ///< Index into Source::lines().
    size_t after_name; ///< Content offset just past the name.
};

/// A declaration body, brace or indentation delimited.
struct Body {
    std::vector<Member> members;
    bool terminated = true; ///< False when a brace body never closes.
};

/// Code lines starting with one of `keywords` followed by an identifier.
[[nodiscard]] auto find_declarations(const source::Source& source,
                                     std::initializer_list<std::string_view> keywords)
    -> std::vector<DeclarationSite>;

/// Reads the body after a declaration name.
///
/// `{ ... }` and `( ... )` bodies run to the matching closer. A `:` body is
/// the rest of the header line plus every following line indented deeper
/// than the header. Members are split on newlines and top-level commas;
/// comments, `pass` and string lines are dropped.
[[nodiscard]] auto read_body(const source::Source& source, const DeclarationSite& site) -> Body;

/// Extends the statement starting on `line_index` over following lines
/// until its brackets balance. Runs to the end of the file otherwise.
[[nodiscard]] auto read_statement(const source::Source& source, size_t line_index)
    -> std::string_view;

/// Joins the lines of a statement into one, dropping comments and the
/// breaks inside brackets: "HashMap[\n    address, uint256]" becomes
/// "HashMap[address, uint256]".
[[nodiscard]] auto join_statement(std::string_view statement) -> std::string;

/// Cuts a trailing `# comment` that is not inside a quoted literal.
[[nodiscard]] auto strip_comment(std::string_view text) -> std::string_view;

/// Splits `name: type` at the first top-level colon.
///
/// Returns nullopt unless the name is an identifier and the type is non-empty.
[[nodiscard]] auto split_declaration(std::string_view member)
    -> std::optional<std::pair<std::string_view, std::string_view>>;

/// Drops a top-level `= default` suffix from a type or value position.
[[nodiscard]] auto strip_default(std::string_view text) -> std::string_view;

/// Resolves a member type, recording T001 warnings and a T002 error.
///
/// `subject` names the member in messages ("MyStruct.owner"). Returns
/// nullopt on a hard failure.
[[nodiscard]] auto resolve_member_type(const types::TypeResolver& resolver,
                                       std::string_view type_text, const std::string& subject,
                                       uint32_t line, std::vector<model::Diagnostic>& diagnostics)
    -> std::optional<types::Type>;

[[nodiscard]] auto make_diagnostic(model::Severity severity, const char* code,
                                   std::string message, uint32_t line) -> model::Diagnostic;

} // namespace vydoc::extract::detail

#endif // VYDOC_EXTRACT_MEMBERS_HPP
