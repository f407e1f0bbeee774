//! # Link Providers
//!
//! Domain types can publish links for themselves (`Linkable`) and for each of
//! their relations (`LinkableRelation`). The codec does not call these on its
//! own; whatever layer turns domain values into `ResourceObject`s uses
//! `resource_links` and `relation_links` to fill the `links` members.
//!
//! ```cpp
//! struct Article {
//!     std::string id;
//!     auto link() const -> std::optional<Link>;
//!     auto link_relation(const std::string& name) const -> std::optional<Link>;
//! };
//!
//! resource.links = unwrap(resource_links(article));
//! ```

#pragma once

#include "common.hpp"
#include "jsonapi/document.hpp"
#include "jsonapi/error.hpp"
#include "jsonapi/identifier.hpp"
#include "jsonapi/link.hpp"

#include <concepts>
#include <optional>
#include <string>

namespace jsonapi {

template <typename T>
concept Linkable = requires(const T& value) {
    { value.link() } -> std::convertible_to<std::optional<Link>>;
};

template <typename T>
concept LinkableRelation = requires(const T& value, const std::string& name) {
    { value.link_relation(name) } -> std::convertible_to<std::optional<Link>>;
};

namespace detail {

inline auto checked(std::optional<Link> link) -> Result<std::optional<Link>, Error> {
    if (!link) {
        return std::optional<Link>{};
    }
    auto ok = link->check();
    if (is_err(ok)) {
        return unwrap_err(ok);
    }
    return link;
}

} // namespace detail

/// Resource-level links of `value`, validated with `Link::check()`.
/// Types without a `link()` member have none.
template <typename T>
auto resource_links(const T& value) -> Result<std::optional<Link>, Error> {
    if constexpr (Linkable<T>) {
        return detail::checked(value.link());
    } else {
        return std::optional<Link>{};
    }
}

/// Links of the relation `name` on `value`, validated with `Link::check()`.
template <typename T>
auto relation_links(const T& value, const std::string& name)
    -> Result<std::optional<Link>, Error> {
    if constexpr (LinkableRelation<T>) {
        return detail::checked(value.link_relation(name));
    } else {
        return std::optional<Link>{};
    }
}

/// Builds a relationship placeholder `{type, id}` from any key type that the
/// identifier protocol accepts.
template <typename K>
auto make_identifier(const std::string& type, const K& key) -> Result<ResourceObject, Error> {
    auto id = marshal_identifier(key);
    if (is_err(id)) {
        return unwrap_err(id);
    }
    ResourceObject resource;
    resource.type = type;
    resource.id = std::move(unwrap(id));
    return resource;
}

} // namespace jsonapi
