//! # Common Definitions
//!
//! Types and helpers shared by every vydoc component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Fallible operations return `Result<T, E>`
//! - **Value Entities**: Extracted entities are plain values, copied or moved,
//!   never shared through mutable pointers

#ifndef VYDOC_COMMON_HPP
#define VYDOC_COMMON_HPP

#include <string>
#include <variant>

namespace vydoc {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<Source, std::string> loaded = Source::from_file(path);
/// if (is_err(loaded)) {
///     VYDOC_LOG_ERROR("driver", unwrap_err(loaded));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace vydoc

#endif // VYDOC_COMMON_HPP
