//! # Wire Helpers
//!
//! Small readers shared by the decoders in this directory. Each one looks up
//! an optional member of a JSON object and checks its type, so the decoders
//! only spell out the format rules.

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"
#include "jsonapi/error.hpp"

#include <string>

namespace jsonapi::wire {

/// Reads an optional string member. Missing or null yields `""`.
inline auto read_string(const json::JsonValue& object, const std::string& key)
    -> Result<std::string, Error> {
    const json::JsonValue* value = object.get(key);
    if (value == nullptr || value->is_null()) {
        return std::string();
    }
    if (!value->is_string()) {
        return Error::type_mismatch(value->kind_name(), {"string"});
    }
    return value->as_string();
}

/// Reads an optional member of any type. Missing yields null.
inline auto read_any(const json::JsonValue& object, const std::string& key) -> json::JsonValue {
    const json::JsonValue* value = object.get(key);
    return value != nullptr ? *value : json::JsonValue();
}

/// Fails with a `TypeMismatch` unless `value` is an object.
inline auto expect_object(const json::JsonValue& value) -> Result<bool, Error> {
    if (!value.is_object()) {
        return Error::type_mismatch(value.kind_name(), {"object"});
    }
    return true;
}

/// Sets `key` on `object` when `value` is non-empty.
inline void put_string(json::JsonValue& object, const std::string& key, const std::string& value) {
    if (!value.empty()) {
        object.set(key, json::JsonValue(value));
    }
}

/// Sets `key` on `object` when `value` is not null.
inline void put_any(json::JsonValue& object, const std::string& key, const json::JsonValue& value) {
    if (!value.is_null()) {
        object.set(key, value);
    }
}

} // namespace jsonapi::wire
