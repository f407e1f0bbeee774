//! # Links and Meta Validation
//!
//! Links objects appear at the top level of a document, on resources and on
//! relationships. `self` and `related` each hold either a URL string or a
//! link object (`{"href": ..., "meta": ...}`); the pagination members are
//! plain strings.
//!
//! ## Validation Rules
//!
//! - A meta value must be absent (null) or an object
//! - A link object is empty when its `href` is empty; a string when it is `""`
//! - `Link::check()` fails when both `self` and `related` are empty, and
//!   otherwise resets the empty one to absent so it is left off the wire
//!
//! ## Example
//!
//! ```cpp
//! Link link;
//! link.self = std::string("/articles/1");
//! link.related = std::string("");
//! auto result = link.check();          // ok
//! assert(link.has_related() == false); // normalised away
//! ```

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"
#include "jsonapi/error.hpp"

#include <string>
#include <variant>

namespace jsonapi {

/// Checks that a meta value is absent or map-like.
///
/// # Returns
///
/// `true`, or a `TypeMismatch` naming the actual JSON type and the expected
/// set `{"struct", "map"}`.
[[nodiscard]] auto check_meta(const json::JsonValue& meta) -> Result<bool, Error>;

/// A link with metadata, as opposed to a bare URL string.
struct LinkObject {
    std::string href;
    json::JsonValue meta;

    [[nodiscard]] auto operator==(const LinkObject& other) const -> bool = default;
};

/// The value of `self` or `related`: absent, a URL string, or a link object.
using LinkValue = std::variant<std::monostate, std::string, LinkObject>;

/// Reports whether a link value is empty.
///
/// # Returns
///
/// `true` when the value is absent, an empty string, or a link object with an
/// empty `href`. A link object whose meta fails `check_meta` yields that
/// `TypeMismatch` instead.
[[nodiscard]] auto check_link_value(const LinkValue& value) -> Result<bool, Error>;

/// A links object.
struct Link {
    LinkValue self;
    LinkValue related;

    // Pagination
    std::string first;
    std::string last;
    std::string next;
    std::string previous;

    [[nodiscard]] auto has_self() const -> bool {
        return !std::holds_alternative<std::monostate>(self);
    }

    [[nodiscard]] auto has_related() const -> bool {
        return !std::holds_alternative<std::monostate>(related);
    }

    /// Validates and normalises `self`/`related` in place.
    ///
    /// Fails with `MissingLinkFields` when both are empty. When exactly one is
    /// empty it is reset to absent; the other is left untouched.
    [[nodiscard]] auto check() -> Result<bool, Error>;

    [[nodiscard]] auto operator==(const Link& other) const -> bool = default;
};

/// The `links` member of an error object.
struct ErrorLink {
    LinkValue about;

    [[nodiscard]] auto operator==(const ErrorLink& other) const -> bool = default;
};

// ============================================================================
// Wire Conversion
// ============================================================================

[[nodiscard]] auto link_value_to_json(const LinkValue& value) -> json::JsonValue;

/// Reads `self`/`related`/`about`. Null maps to absent; anything other than a
/// string or object is a `TypeMismatch` expecting `{"LinkObject", "string"}`.
[[nodiscard]] auto link_value_from_json(const json::JsonValue& value) -> Result<LinkValue, Error>;

[[nodiscard]] auto link_to_json(const Link& link) -> json::JsonValue;

[[nodiscard]] auto link_from_json(const json::JsonValue& value) -> Result<Link, Error>;

} // namespace jsonapi
