//! # JSON Syntax Errors
//!
//! Errors produced while turning raw bytes into a `JsonValue` tree. They carry
//! the position of the offending character so the codec can report where a
//! document stopped being valid JSON.
//!
//! ## Example
//!
//! ```cpp
//! auto error = JsonError::make("Unterminated string", 3, 14, 57);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "line 3, column 14: Unterminated string"
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace jsonapi::json {

/// A syntax error encountered while parsing JSON text.
///
/// # Fields
///
/// - `message`: Description of what went wrong
/// - `line`: 1-based line number (0 if unknown)
/// - `column`: 1-based column number (0 if unknown)
/// - `offset`: Byte offset from start of input
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    /// Creates an error without location information.
    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    /// Creates an error at the given position.
    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as `"line X, column Y: message"`, dropping whatever
    /// location parts are unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace jsonapi::json
