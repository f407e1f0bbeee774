//! # JSON Serializer
//!
//! Turns a `JsonValue` tree back into text, either compact (the wire form the
//! codec emits by default) or indented for humans.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Backspace, form feed, LF, CR, tab | `\b`, `\f`, `\n`, `\r`, `\t` |
//! | Other control (0x00-0x1F) | `\uXXXX` |
//!
//! NaN and infinities have no JSON spelling and are written as `null`.

#include "json/json_value.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace jsonapi::json {

namespace {

void write_escaped(const std::string& s, std::string& out) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

void write_number(const JsonNumber& num, std::string& out) {
    switch (num.kind) {
    case JsonNumber::Kind::Int64:
        out += std::to_string(num.i64);
        return;
    case JsonNumber::Kind::Uint64:
        out += std::to_string(num.u64);
        return;
    case JsonNumber::Kind::Double: {
        if (std::isnan(num.f64) || std::isinf(num.f64)) {
            out += "null";
            return;
        }
        std::ostringstream oss;
        oss << std::setprecision(17) << num.f64;
        std::string text = oss.str();
        // Keep a fractional marker so the value reads back as a double.
        if (text.find_first_of(".eE") == std::string::npos) {
            text += ".0";
        }
        out += text;
        return;
    }
    }
}

/// Writes `value` into `out`. `indent == 0` selects compact output.
void write_value(const JsonValue& value, std::string& out, int indent, int depth) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        write_number(value.as_number(), out);
    } else if (value.is_string()) {
        write_escaped(value.as_string(), out);
    } else {
        bool is_array = value.is_array();
        out += is_array ? '[' : '{';
        if (value.size() == 0) {
            out += is_array ? ']' : '}';
            return;
        }

        std::string inner(static_cast<size_t>((depth + 1) * indent), ' ');
        bool first = true;
        auto separate = [&] {
            if (!first) {
                out += ',';
            }
            first = false;
            if (indent > 0) {
                out += '\n';
                out += inner;
            }
        };

        if (is_array) {
            for (const auto& elem : value.as_array()) {
                separate();
                write_value(elem, out, indent, depth + 1);
            }
        } else {
            for (const auto& [key, val] : value.as_object()) {
                separate();
                write_escaped(key, out);
                out += indent > 0 ? ": " : ":";
                write_value(val, out, indent, depth + 1);
            }
        }

        if (indent > 0) {
            out += '\n';
            out += std::string(static_cast<size_t>(depth * indent), ' ');
        }
        out += is_array ? ']' : '}';
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string result;
    write_value(*this, result, 0, 0);
    return result;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string result;
    write_value(*this, result, indent < 0 ? 0 : indent, 0);
    return result;
}

} // namespace jsonapi::json
