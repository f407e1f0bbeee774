//! # JSON Value Implementation
//!
//! Deep copy and structural equality for `JsonValue`. Serialization lives in
//! `json_serializer.cpp`.
//!
//! ## Equality Semantics
//!
//! | Type | Comparison Rule |
//! |------|-----------------|
//! | `null` | All nulls are equal |
//! | `number` | Numeric comparison (see `JsonNumber::operator==`) |
//! | `array` | Element-by-element in order |
//! | `object` | Key-value pairs, independent of insertion order |
//!
//! Values of different JSON types are never equal.

#include "json/json_value.hpp"

namespace jsonapi::json {

namespace {

auto copy_variant(const JsonValue::ValueVariant& source) -> JsonValue::ValueVariant {
    if (auto* arr = std::get_if<Box<JsonArray>>(&source)) {
        return make_box<JsonArray>(**arr);
    }
    if (auto* obj = std::get_if<Box<JsonObject>>(&source)) {
        return make_box<JsonObject>(**obj);
    }
    if (auto* num = std::get_if<JsonNumber>(&source)) {
        return *num;
    }
    if (auto* str = std::get_if<std::string>(&source)) {
        return *str;
    }
    if (auto* b = std::get_if<bool>(&source)) {
        return *b;
    }
    return JsonValue::Null{};
}

} // namespace

JsonValue::JsonValue(const JsonValue& other) : data(copy_variant(other.data)) {}

auto JsonValue::operator=(const JsonValue& other) -> JsonValue& {
    if (this != &other) {
        data = copy_variant(other.data);
    }
    return *this;
}

auto JsonValue::kind_name() const -> const char* {
    if (is_null()) {
        return "null";
    }
    if (is_bool()) {
        return "bool";
    }
    if (is_number()) {
        return "number";
    }
    if (is_string()) {
        return "string";
    }
    if (is_array()) {
        return "array";
    }
    return "object";
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }

    if (is_array()) {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }

    const auto& lhs = as_object();
    const auto& rhs = other.as_object();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& [key, val] : lhs) {
        auto it = rhs.find(key);
        if (it == rhs.end() || it->second != val) {
            return false;
        }
    }
    return true;
}

} // namespace jsonapi::json
