//! # Common Definitions
//!
//! This module provides the small set of types and helpers shared by every
//! part of the jsonapi library: version constants, the `Result` type used for
//! error propagation, and ownership aliases.
//!
//! ## Overview
//!
//! - **Version Information**: Library version and the JSON:API revision it speaks
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Alias for uniquely owned heap values
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership
//! - **Value Semantics**: Documents and resources are plain copyable values

#ifndef JSONAPI_COMMON_HPP
#define JSONAPI_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace jsonapi {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.0";

/// Revision of the JSON:API format the codec reads and writes.
constexpr const char* FORMAT_VERSION = "1.1";

/// IANA media type for JSON:API payloads.
constexpr const char* MEDIA_TYPE = "application/vnd.api+json";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// Operations with nothing to return on success use `Result<bool, E>` and
/// return `true`.
///
/// # Example
///
/// ```cpp
/// auto result = decode_document(bytes);
/// if (is_ok(result)) {
///     auto& doc = unwrap(result);
/// } else {
///     std::cerr << unwrap_err(result).to_string() << "\n";
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
/// # Panics
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
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace jsonapi

#endif // JSONAPI_COMMON_HPP
