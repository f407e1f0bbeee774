//! # JSON Parser Implementation
//!
//! Recursive descent directly over characters: each `parse_*` method starts
//! with the reader positioned on the first character of its production and
//! leaves it just past the last one. Position tracking happens in
//! `advance()`, so errors always point at the character being examined.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace jsonapi::json {

namespace {

/// Appends `codepoint` to `out` as UTF-8.
void append_utf8(std::string& out, unsigned int codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

JsonReader::JsonReader(std::string_view input, size_t max_depth)
    : input_(input), max_depth_(max_depth) {}

auto JsonReader::advance() -> char {
    if (at_end()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonReader::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            return;
        }
        advance();
    }
}

auto JsonReader::error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_, pos_);
}

auto JsonReader::parse() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    if (at_end()) {
        return error("Empty input");
    }

    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }

    skip_whitespace();
    if (!at_end()) {
        return error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonReader::parse_value() -> Result<JsonValue, JsonError> {
    skip_whitespace();

    switch (peek()) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
        return parse_literal("true", JsonValue(true));
    case 'f':
        return parse_literal("false", JsonValue(false));
    case 'n':
        return parse_literal("null", JsonValue());
    case '\0':
        if (at_end()) {
            return error("Unexpected end of input");
        }
        return error("Unexpected character");
    default:
        if (peek() == '-' || is_digit(peek())) {
            return parse_number();
        }
        return error(std::string("Unexpected character: ") + peek());
    }
}

auto JsonReader::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > max_depth_) {
        return error("Maximum nesting depth exceeded");
    }
    advance(); // '{'

    JsonObject obj;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error(peek() == '}' ? "Trailing comma in object"
                                       : "Expected string key in object");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (peek() != ':') {
            return error("Expected ':' after object key");
        }
        advance();

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        // Duplicate keys: the last occurrence wins.
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        char c = advance();
        if (c == ',') {
            continue;
        }
        if (c == '}') {
            --depth_;
            return JsonValue(std::move(obj));
        }
        return error("Expected ',' or '}' in object");
    }
}

auto JsonReader::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > max_depth_) {
        return error("Maximum nesting depth exceeded");
    }
    advance(); // '['

    JsonArray arr;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        skip_whitespace();
        if (peek() == ']') {
            return error("Trailing comma in array");
        }
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ',') {
            continue;
        }
        if (c == ']') {
            --depth_;
            return JsonValue(std::move(arr));
        }
        return error("Expected ',' or ']' in array");
    }
}

auto JsonReader::parse_hex4() -> Result<unsigned int, JsonError> {
    if (pos_ + 4 > input_.size()) {
        return error("Incomplete unicode escape sequence");
    }
    unsigned int value = 0;
    const char* first = input_.data() + pos_;
    auto [ptr, ec] = std::from_chars(first, first + 4, value, 16);
    if (ec != std::errc{} || ptr != first + 4) {
        return error("Invalid unicode escape sequence");
    }
    for (int i = 0; i < 4; ++i) {
        advance();
    }
    return value;
}

auto JsonReader::parse_string() -> Result<std::string, JsonError> {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_pos = pos_;
    advance(); // opening quote

    std::string value;
    while (!at_end()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("Control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto high = parse_hex4();
            if (is_err(high)) {
                return unwrap_err(high);
            }
            unsigned int codepoint = unwrap(high);
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                if (peek() != '\\' || pos_ + 1 >= input_.size() || input_[pos_ + 1] != 'u') {
                    return error("Unpaired surrogate in unicode escape");
                }
                advance();
                advance();
                auto low = parse_hex4();
                if (is_err(low)) {
                    return unwrap_err(low);
                }
                if (unwrap(low) < 0xDC00 || unwrap(low) > 0xDFFF) {
                    return error("Invalid low surrogate in unicode escape");
                }
                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (unwrap(low) - 0xDC00);
            } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                return error("Unpaired surrogate in unicode escape");
            }
            append_utf8(value, codepoint);
            break;
        }
        default:
            return error(std::string("Invalid escape sequence: \\") + escaped);
        }
    }

    return JsonError::make("Unterminated string", start_line, start_col, start_pos);
}

auto JsonReader::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (peek() == '0') {
        advance();
        if (is_digit(peek())) {
            return error("Leading zeros are not allowed");
        }
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            advance();
        }
    } else {
        return error("Invalid number");
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit(peek())) {
            return error("Expected digit after decimal point");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            return error("Expected digit in exponent");
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    std::string_view text = input_.substr(start, pos_ - start);
    const char* first = text.data();
    const char* last = text.data() + text.size();

    if (!is_float) {
        if (text.front() == '-') {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc{}) {
                return JsonValue(value);
            }
        } else {
            uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc{}) {
                if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return JsonValue(static_cast<int64_t>(value));
                }
                return JsonValue(value);
            }
        }
        // Out of 64-bit range: keep it as a double.
    }

    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonReader::parse_literal(std::string_view word, JsonValue value)
    -> Result<JsonValue, JsonError> {
    if (input_.substr(pos_, word.size()) != word) {
        return error("Unknown literal");
    }
    for (size_t i = 0; i < word.size(); ++i) {
        advance();
    }
    return value;
}

auto parse_json(std::string_view input, size_t max_depth) -> Result<JsonValue, JsonError> {
    JsonReader reader(input, max_depth);
    return reader.parse();
}

} // namespace jsonapi::json
