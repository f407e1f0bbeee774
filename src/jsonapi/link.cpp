//! # Links and Meta Validation Implementation

#include "jsonapi/link.hpp"

#include "wire.hpp"

namespace jsonapi {

auto check_meta(const json::JsonValue& meta) -> Result<bool, Error> {
    if (meta.is_null() || meta.is_object()) {
        return true;
    }
    return Error::type_mismatch(meta.kind_name(), {"struct", "map"});
}

auto check_link_value(const LinkValue& value) -> Result<bool, Error> {
    if (const auto* object = std::get_if<LinkObject>(&value)) {
        auto meta = check_meta(object->meta);
        if (is_err(meta)) {
            return meta;
        }
        return object->href.empty();
    }
    if (const auto* url = std::get_if<std::string>(&value)) {
        return url->empty();
    }
    return true;
}

auto Link::check() -> Result<bool, Error> {
    auto self_empty = check_link_value(self);
    if (is_err(self_empty)) {
        return self_empty;
    }
    auto related_empty = check_link_value(related);
    if (is_err(related_empty)) {
        return related_empty;
    }

    if (unwrap(self_empty) && unwrap(related_empty)) {
        return Error::missing_link_fields();
    }
    if (unwrap(self_empty)) {
        self = std::monostate{};
    } else if (unwrap(related_empty)) {
        related = std::monostate{};
    }
    return true;
}

// ============================================================================
// Wire Conversion
// ============================================================================

auto link_value_to_json(const LinkValue& value) -> json::JsonValue {
    if (const auto* url = std::get_if<std::string>(&value)) {
        return json::JsonValue(*url);
    }
    if (const auto* object = std::get_if<LinkObject>(&value)) {
        auto out = json::json_object();
        wire::put_string(out, "href", object->href);
        wire::put_any(out, "meta", object->meta);
        return out;
    }
    return json::json_null();
}

auto link_value_from_json(const json::JsonValue& value) -> Result<LinkValue, Error> {
    if (value.is_null()) {
        return LinkValue{};
    }
    if (value.is_string()) {
        return LinkValue{value.as_string()};
    }
    if (!value.is_object()) {
        return Error::type_mismatch(value.kind_name(), {"LinkObject", "string"});
    }

    auto href = wire::read_string(value, "href");
    if (is_err(href)) {
        return unwrap_err(href);
    }
    LinkObject object;
    object.href = std::move(unwrap(href));
    object.meta = wire::read_any(value, "meta");
    return LinkValue{std::move(object)};
}

auto link_to_json(const Link& link) -> json::JsonValue {
    auto out = json::json_object();
    if (link.has_self()) {
        out.set("self", link_value_to_json(link.self));
    }
    if (link.has_related()) {
        out.set("related", link_value_to_json(link.related));
    }
    wire::put_string(out, "first", link.first);
    wire::put_string(out, "last", link.last);
    wire::put_string(out, "next", link.next);
    wire::put_string(out, "previous", link.previous);
    return out;
}

auto link_from_json(const json::JsonValue& value) -> Result<Link, Error> {
    auto is_object = wire::expect_object(value);
    if (is_err(is_object)) {
        return unwrap_err(is_object);
    }

    Link link;
    for (auto [key, slot] : {std::pair{"self", &link.self}, std::pair{"related", &link.related}}) {
        const json::JsonValue* member = value.get(key);
        if (member == nullptr) {
            continue;
        }
        auto parsed = link_value_from_json(*member);
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        *slot = std::move(unwrap(parsed));
    }

    for (auto [key, slot] :
         {std::pair{"first", &link.first}, std::pair{"last", &link.last},
          std::pair{"next", &link.next}, std::pair{"previous", &link.previous}}) {
        auto text = wire::read_string(value, key);
        if (is_err(text)) {
            return unwrap_err(text);
        }
        *slot = std::move(unwrap(text));
    }
    return link;
}

} // namespace jsonapi
