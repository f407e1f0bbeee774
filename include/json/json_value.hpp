//! # JSON Value Types
//!
//! The shape-erased JSON tree used throughout the codec. Raw bytes are first
//! parsed into a `JsonValue`; the document codec then inspects that tree to
//! decide how primary data is shaped before converting it into typed
//! resource objects. Encoding goes the other way: documents are lowered into
//! a `JsonValue` and serialized.
//!
//! ## Number Handling
//!
//! Numbers keep their integer-ness so attribute values survive a round trip:
//!
//! | JSON Input | Storage Type |
//! |------------|--------------|
//! | `42` | `Int64` |
//! | `18446744073709551615` | `Uint64` |
//! | `3.14`, `1e10` | `Double` |
//!
//! ## Value Semantics
//!
//! Arrays and objects are heap allocated behind a `Box`, but `JsonValue`
//! copies deeply, so resource objects holding attributes and meta can be
//! copied like any other value.

#pragma once

#include "common.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonapi::json {

struct JsonValue;

/// A JSON array.
using JsonArray = std::vector<JsonValue>;

/// A JSON object. Keys are kept sorted, so serialized output is stable.
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number that remembers whether it was written as an integer.
struct JsonNumber {
    enum class Kind : uint8_t {
        Int64,  ///< Signed 64-bit integer (`i64` field)
        Uint64, ///< Unsigned 64-bit integer above `INT64_MAX` (`u64` field)
        Double  ///< IEEE 754 double (`f64` field)
    };

    Kind kind;

    union {
        int64_t i64;
        uint64_t u64;
        double f64;
    };

    JsonNumber() : kind(Kind::Int64), i64(0) {}

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}

    explicit JsonNumber(uint64_t value) : kind(Kind::Uint64), u64(value) {}

    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind != Kind::Double;
    }

    /// Returns the value as `int64_t` if it fits without loss.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        switch (kind) {
        case Kind::Int64:
            return i64;
        case Kind::Uint64:
            if (u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u64);
            }
            return std::nullopt;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    /// Returns the value as a double, possibly losing precision.
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }

    /// Numbers of different kinds compare by value.
    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        switch (kind) {
        case Kind::Int64:
            return i64 == other.i64;
        case Kind::Uint64:
            return u64 == other.u64;
        case Kind::Double:
            return f64 == other.f64;
        }
        return false;
    }

    [[nodiscard]] auto operator!=(const JsonNumber& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// Any JSON value.
///
/// # Example
///
/// ```cpp
/// JsonValue attrs(JsonObject{{"title", JsonValue("Rails is Omakase")}});
/// if (auto* title = attrs.get("title"); title && title->is_string()) {
///     std::cout << title->as_string() << "\n";
/// }
/// ```
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      JsonNumber,       // number
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    JsonValue() : data(Null{}) {}

    explicit JsonValue(std::nullptr_t) : data(Null{}) {}

    explicit JsonValue(bool value) : data(value) {}

    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}

    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}

    explicit JsonValue(uint64_t value) : data(JsonNumber(value)) {}

    explicit JsonValue(double value) : data(JsonNumber(value)) {}

    explicit JsonValue(JsonNumber value) : data(value) {}

    explicit JsonValue(const char* value) : data(std::string(value)) {}

    explicit JsonValue(std::string value) : data(std::move(value)) {}

    explicit JsonValue(std::string_view value) : data(std::string(value)) {}

    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}

    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    /// Deep copy.
    JsonValue(const JsonValue& other);

    JsonValue(JsonValue&& other) noexcept = default;

    /// Deep copy assignment.
    auto operator=(const JsonValue& other) -> JsonValue&;

    auto operator=(JsonValue&& other) noexcept -> JsonValue& = default;

    ~JsonValue() = default;

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    /// Returns the JSON type name: `"null"`, `"bool"`, `"number"`,
    /// `"string"`, `"array"` or `"object"`.
    ///
    /// Used as the actual type name when a decoder finds a value of the
    /// wrong shape.
    [[nodiscard]] auto kind_name() const -> const char*;

    // ========================================================================
    // Accessors
    // ========================================================================
    //
    // These throw `std::bad_variant_access` on a type mismatch; check with
    // the `is_*` queries first.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Object Access
    // ========================================================================

    /// Looks up `key` if this is an object. Returns `nullptr` when the key is
    /// missing or this is not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// Number of elements (array) or members (object); 0 for scalars.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    // ========================================================================
    // Mutation
    // ========================================================================

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Compact serialization with no insignificant whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Multi-line serialization with `indent` spaces per nesting level.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    // ========================================================================
    // Comparison
    // ========================================================================

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace jsonapi::json
