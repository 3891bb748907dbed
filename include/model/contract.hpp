//! # Contract Model
//!
//! The entities extracted from one contract source file. A `Contract` is
//! the unit handed to the renderers: one per `.vy` file.
//!
//! ## Architecture
//!
//! - `Enum`, `Constant`, `Variable`, `Struct`, `Event`, `Function`: one
//!   declaration each, with the line it starts on and the diagnostics
//!   raised while reading it
//! - `Contract`: every entity of a file, functions ordered external first
//!
//! Entities are values built once by the extractors and never updated in
//! place. Re-extracting the same text yields equal entities.

#ifndef VYDOC_MODEL_CONTRACT_HPP
#define VYDOC_MODEL_CONTRACT_HPP

#include "types/type.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vydoc::model {

// ============================================================================
// Diagnostics
// ============================================================================

enum class Severity {
    Warning, ///< Entity extracted; something in it is non-conforming.
    Error,   ///< A member could not be extracted; its siblings were.
};

[[nodiscard]] auto severity_to_string(Severity severity) -> std::string_view;

/// Diagnostic codes.
///
/// | Code | Severity | Meaning                                     |
/// |------|----------|---------------------------------------------|
/// | T001 | Warning  | Scalar type name outside the vocabulary     |
/// | T002 | Error    | Malformed bracketed type expression         |
/// | D001 | Error    | Member or declaration that cannot be read   |
/// | D002 | Warning  | Duplicate enum value                        |
namespace codes {
constexpr const char* NONCONFORMING_TYPE = "T001";
constexpr const char* MALFORMED_TYPE = "T002";
constexpr const char* MALFORMED_DECLARATION = "D001";
constexpr const char* DUPLICATE_ENUM_VALUE = "D002";
} // namespace codes

struct Diagnostic {
    Severity severity;
    std::string code;
    std::string message;
    uint32_t line = 0; ///< 1-based source line, 0 if unknown.

    bool operator==(const Diagnostic&) const = default;
};

// ============================================================================
// Members
// ============================================================================

/// A function parameter or struct field.
struct Parameter {
    std::string name;
    types::Type type;

    bool operator==(const Parameter&) const = default;
};

/// An event field. Event fields are always scalar in source form.
struct EventField {
    std::string name;
    types::ScalarType type;
    bool indexed = false;

    bool operator==(const EventField&) const = default;
};

// ============================================================================
// Declarations
// ============================================================================

struct Enum {
    std::string name;
    std::vector<std::string> values; ///< Declaration order, no duplicates.
    uint32_t line = 0;
    std::vector<Diagnostic> diagnostics;

    bool operator==(const Enum&) const = default;
};

struct Constant {
    std::string name;
    types::Type type;
    std::string value; ///< Literal text as written.
    uint32_t line = 0;
    std::vector<Diagnostic> diagnostics;

    bool operator==(const Constant&) const = default;
};

enum class VariableVisibility {
    Public,  ///< Declared as `name: public(T)`.
    Private, ///< Declared as `name: T`.
};

[[nodiscard]] auto variable_visibility_to_string(VariableVisibility vis) -> std::string_view;

/// A contract storage variable.
struct Variable {
    std::string name;
    types::Type type; ///< With any `public(...)` wrapper removed.
    VariableVisibility visibility = VariableVisibility::Private;
    uint32_t line = 0;
    std::vector<Diagnostic> diagnostics;

    bool operator==(const Variable&) const = default;
};

struct Struct {
    std::string name;
    std::vector<Parameter> fields;
    uint32_t line = 0;
    std::vector<Diagnostic> diagnostics;

    bool operator==(const Struct&) const = default;
};

struct Event {
    std::string name;
    std::vector<EventField> fields;
    uint32_t line = 0;
    std::vector<Diagnostic> diagnostics;

    bool operator==(const Event&) const = default;
};

enum class FunctionVisibility {
    External, ///< `@external`: callable from outside the contract.
    Internal, ///< `@internal`: callable only from within.
};

[[nodiscard]] auto function_visibility_to_string(FunctionVisibility vis) -> std::string_view;

struct Function {
    std::string name;
    std::vector<Parameter> params;
    std::optional<types::Type> return_type;
    std::optional<std::string> docstring;
    FunctionVisibility visibility = FunctionVisibility::Internal;
    uint32_t line = 0; ///< Line of the `def` keyword.
    std::vector<Diagnostic> diagnostics;

    bool operator==(const Function&) const = default;
};

// ============================================================================
// Contract
// ============================================================================

/// Everything extracted from one source file.
struct Contract {
    std::string name;          ///< File stem: "token" for "nested/token.vy".
    std::string relative_path; ///< Path relative to the scanned root.
    std::optional<std::string> docstring;

    std::vector<Enum> enums;
    std::vector<Struct> structs;
    std::vector<Event> events;
    std::vector<Constant> constants;
    std::vector<Variable> variables;
    std::vector<Function> functions; ///< All external functions, then all internal ones.

    /// Diagnostics for declarations that produced no entity at all.
    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] auto external_functions() const -> std::vector<const Function*>;
    [[nodiscard]] auto internal_functions() const -> std::vector<const Function*>;

    /// Finds a constant by name.
    [[nodiscard]] auto find_constant(std::string_view name) const -> const Constant*;

    /// Every diagnostic of the contract and its entities, in category order.
    [[nodiscard]] auto all_diagnostics() const -> std::vector<Diagnostic>;

    [[nodiscard]] auto has_errors() const -> bool;

    bool operator==(const Contract&) const = default;
};

} // namespace vydoc::model

#endif // VYDOC_MODEL_CONTRACT_HPP
