//! # Resource Objects and Documents
//!
//! The in-memory form of a JSON:API payload. Everything here is a plain value
//! type: documents own their resources, and copying a document copies the
//! whole tree.
//!
//! ## Recursion
//!
//! A relationship is itself a document whose primary data holds resource
//! identifiers, so the types are mutually recursive:
//!
//! ```text
//! Document ──data──▶ ResourceObject ──relationships──▶ Relationship
//!     ▲                                                     │
//!     └──────────────────────── document ───────────────────┘
//! ```
//!
//! ## Primary Data
//!
//! `Document::data` is a tagged variant, so a document is always exactly one
//! of: no primary data, one resource, or a (possibly empty) list.
//!
//! | Alternative | `shape()` | Wire form |
//! |-------------|-----------|-----------|
//! | `std::monostate` | `None` | `"data": null` or no key |
//! | `ResourceObject` | `One` | `"data": {...}` |
//! | `std::vector<ResourceObject>` | `Many` | `"data": [...]` |

#pragma once

#include "json/json_value.hpp"
#include "jsonapi/link.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jsonapi {

struct Document;
struct Relationship;

// ============================================================================
// ResourceObject
// ============================================================================

/// An addressable entity: type name, identifier, attributes, relationships.
struct ResourceObject {
    /// Wire identifier; empty for resources that do not have one yet.
    std::string id;

    /// Resource type name. Required on the wire.
    std::string type;

    json::JsonObject attributes;

    /// Named relationships. Names are unique; order is not significant and
    /// decoding yields them sorted by name.
    std::vector<Relationship> relationships;

    json::JsonValue meta;

    std::optional<Link> links;

    /// `{Type: T, ID: I}`, the key used for linkage checks.
    [[nodiscard]] auto identity() const -> std::string;

    /// The relationship document named `name`, or `nullptr`.
    [[nodiscard]] auto relationship(const std::string& name) const -> const Document*;

    [[nodiscard]] auto relationship(const std::string& name) -> Document*;

    /// Replaces the relationship named `name`, or appends it.
    void set_relationship(const std::string& name, Document document);

    /// Relationships are matched by name, not by position.
    [[nodiscard]] auto operator==(const ResourceObject& other) const -> bool;
};

// ============================================================================
// Document
// ============================================================================

/// Which alternative of `Document::data` is active.
enum class DataShape : uint8_t { None, One, Many };

/// Returns "None", "One" or "Many".
[[nodiscard]] auto data_shape_name(DataShape shape) -> const char*;

using PrimaryData = std::variant<std::monostate, ResourceObject, std::vector<ResourceObject>>;

/// The `jsonapi` member: format version and implementation meta.
struct JsonApiObject {
    std::string version;
    json::JsonValue meta;

    [[nodiscard]] auto operator==(const JsonApiObject& other) const -> bool = default;
};

/// Where an error originated in the request.
struct ErrorSource {
    /// JSON pointer into the request document (e.g. `/data/attributes/title`).
    std::string pointer;

    /// Name of the offending query parameter.
    std::string parameter;

    [[nodiscard]] auto operator==(const ErrorSource& other) const -> bool = default;
};

/// An entry of the top-level `errors` array. Every member is optional.
struct ErrorObject {
    std::string id;
    std::optional<ErrorLink> links;
    std::string status;
    std::string code;
    std::string title;
    std::string detail;
    std::optional<ErrorSource> source;
    json::JsonValue meta;

    [[nodiscard]] auto operator==(const ErrorObject& other) const -> bool = default;
};

/// A top-level document, or the value of a relationship.
struct Document {
    PrimaryData data;

    json::JsonValue meta;

    std::optional<JsonApiObject> jsonapi;

    /// When non-empty, `data` is left off the wire.
    std::vector<ErrorObject> errors;

    std::optional<Link> links;

    /// Resources shipped alongside primary data in a compound document.
    std::vector<ResourceObject> included;

    [[nodiscard]] auto shape() const -> DataShape;

    /// The single primary resource, or `nullptr` unless the shape is `One`.
    [[nodiscard]] auto data_one() const -> const ResourceObject*;

    [[nodiscard]] auto data_one() -> ResourceObject*;

    /// The primary resource list, or `nullptr` unless the shape is `Many`.
    [[nodiscard]] auto data_many() const -> const std::vector<ResourceObject>*;

    [[nodiscard]] auto data_many() -> std::vector<ResourceObject>*;

    void set_data_one(ResourceObject resource);

    void set_data_many(std::vector<ResourceObject> resources);

    void clear_data();

    /// Pointers to every primary resource, whatever the shape.
    [[nodiscard]] auto primary_resources() -> std::vector<ResourceObject*>;

    /// True when there is no primary resource at all.
    [[nodiscard]] auto is_empty() const -> bool;

    [[nodiscard]] auto operator==(const Document& other) const -> bool;
};

struct Relationship {
    std::string name;
    Document document;

    [[nodiscard]] auto operator==(const Relationship& other) const -> bool = default;
};

} // namespace jsonapi
