//! # JSON Parser
//!
//! A strict recursive descent parser that turns raw document bytes into a
//! `JsonValue` tree. It is the first pass of document decoding: the codec
//! needs a shape-erased tree before it can decide whether `"data"` holds one
//! resource, many, or none.
//!
//! ## Behaviour
//!
//! - Input must be exactly one JSON value, optionally surrounded by whitespace
//! - Trailing commas, comments and single quotes are rejected
//! - `\uXXXX` escapes are decoded to UTF-8, including surrogate pairs
//! - Numbers without a fraction or exponent are kept as integers
//! - Nesting deeper than the configured limit is rejected
//!
//! Every error carries the line and column of the character that triggered it.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace jsonapi::json {

/// Default nesting limit for arrays and objects.
constexpr size_t DEFAULT_MAX_DEPTH = 1000;

/// Character-level JSON reader.
///
/// One instance parses one input; use `parse_json()` unless you need to
/// reuse a configured reader type.
class JsonReader {
public:
    explicit JsonReader(std::string_view input, size_t max_depth = DEFAULT_MAX_DEPTH);

    /// Parses the whole input as a single JSON value.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;
    size_t max_depth_;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }

    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }

    auto advance() -> char;

    void skip_whitespace();

    [[nodiscard]] auto error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;

    auto parse_object() -> Result<JsonValue, JsonError>;

    auto parse_array() -> Result<JsonValue, JsonError>;

    auto parse_string() -> Result<std::string, JsonError>;

    auto parse_number() -> Result<JsonValue, JsonError>;

    auto parse_literal(std::string_view word, JsonValue value) -> Result<JsonValue, JsonError>;

    auto parse_hex4() -> Result<unsigned int, JsonError>;
};

/// Parses `input` into a `JsonValue`.
///
/// # Example
///
/// ```cpp
/// auto result = parse_json(R"({"data": null})");
/// if (is_ok(result)) {
///     assert(unwrap(result).get("data")->is_null());
/// }
/// ```
[[nodiscard]] auto parse_json(std::string_view input, size_t max_depth = DEFAULT_MAX_DEPTH)
    -> Result<JsonValue, JsonError>;

} // namespace jsonapi::json
