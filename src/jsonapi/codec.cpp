//! # Document Codec Implementation
//!
//! Decoders return on the first failure, so a partly built document never
//! escapes.

#include "jsonapi/codec.hpp"

#include "jsonapi/link.hpp"
#include "log/log.hpp"
#include "wire.hpp"

namespace jsonapi {

namespace {

// ============================================================================
// Shared Readers
// ============================================================================

/// Reads an optional member that must be an object when present.
auto read_object(const json::JsonValue& object, const std::string& key)
    -> Result<const json::JsonValue*, Error> {
    const json::JsonValue* value = object.get(key);
    if (value == nullptr || value->is_null()) {
        return static_cast<const json::JsonValue*>(nullptr);
    }
    if (!value->is_object()) {
        return Error::type_mismatch(value->kind_name(), {"object"});
    }
    return value;
}

/// Reads an optional member that must be an array when present.
auto read_array(const json::JsonValue& object, const std::string& key)
    -> Result<const json::JsonValue*, Error> {
    const json::JsonValue* value = object.get(key);
    if (value == nullptr || value->is_null()) {
        return static_cast<const json::JsonValue*>(nullptr);
    }
    if (!value->is_array()) {
        return Error::type_mismatch(value->kind_name(), {"array"});
    }
    return value;
}

/// Reads and validates a `meta` member.
auto read_meta(const json::JsonValue& object) -> Result<json::JsonValue, Error> {
    json::JsonValue meta = wire::read_any(object, "meta");
    auto valid = check_meta(meta);
    if (is_err(valid)) {
        return unwrap_err(valid);
    }
    return meta;
}

/// Reads an optional `links` member.
auto read_links(const json::JsonValue& object) -> Result<std::optional<Link>, Error> {
    const json::JsonValue* value = object.get("links");
    if (value == nullptr || value->is_null()) {
        return std::optional<Link>{};
    }
    auto link = link_from_json(*value);
    if (is_err(link)) {
        return unwrap_err(link);
    }
    return std::optional<Link>(std::move(unwrap(link)));
}

/// Validates a copy of `link` and lowers it.
auto write_links(json::JsonValue& out, const std::optional<Link>& links) -> Result<bool, Error> {
    if (!links) {
        return true;
    }
    Link checked = *links;
    auto ok = checked.check();
    if (is_err(ok)) {
        return ok;
    }
    out.set("links", link_to_json(checked));
    return true;
}

auto write_meta(json::JsonValue& out, const json::JsonValue& meta) -> Result<bool, Error> {
    auto ok = check_meta(meta);
    if (is_err(ok)) {
        return ok;
    }
    wire::put_any(out, "meta", meta);
    return true;
}

auto resources_from_json(const json::JsonArray& items)
    -> Result<std::vector<ResourceObject>, Error> {
    std::vector<ResourceObject> resources;
    resources.reserve(items.size());
    for (const auto& item : items) {
        auto resource = resource_from_json(item);
        if (is_err(resource)) {
            return unwrap_err(resource);
        }
        resources.push_back(std::move(unwrap(resource)));
    }
    return resources;
}

auto resources_to_json(const std::vector<ResourceObject>& resources)
    -> Result<json::JsonValue, Error> {
    auto out = json::json_array();
    for (const auto& resource : resources) {
        auto value = resource_to_json(resource);
        if (is_err(value)) {
            return value;
        }
        out.push(std::move(unwrap(value)));
    }
    return out;
}

// ============================================================================
// Error Objects
// ============================================================================

auto error_object_to_json(const ErrorObject& error) -> json::JsonValue {
    auto out = json::json_object();
    wire::put_string(out, "id", error.id);
    if (error.links) {
        auto links = json::json_object();
        if (!std::holds_alternative<std::monostate>(error.links->about)) {
            links.set("about", link_value_to_json(error.links->about));
        }
        out.set("links", std::move(links));
    }
    wire::put_string(out, "status", error.status);
    wire::put_string(out, "code", error.code);
    wire::put_string(out, "title", error.title);
    wire::put_string(out, "detail", error.detail);
    if (error.source) {
        auto source = json::json_object();
        wire::put_string(source, "pointer", error.source->pointer);
        wire::put_string(source, "parameter", error.source->parameter);
        out.set("source", std::move(source));
    }
    wire::put_any(out, "meta", error.meta);
    return out;
}

auto error_object_from_json(const json::JsonValue& value) -> Result<ErrorObject, Error> {
    auto is_object = wire::expect_object(value);
    if (is_err(is_object)) {
        return unwrap_err(is_object);
    }

    ErrorObject error;
    for (auto [key, slot] :
         {std::pair{"id", &error.id}, std::pair{"status", &error.status},
          std::pair{"code", &error.code}, std::pair{"title", &error.title},
          std::pair{"detail", &error.detail}}) {
        auto text = wire::read_string(value, key);
        if (is_err(text)) {
            return unwrap_err(text);
        }
        *slot = std::move(unwrap(text));
    }

    auto links = read_object(value, "links");
    if (is_err(links)) {
        return unwrap_err(links);
    }
    if (const json::JsonValue* object = unwrap(links)) {
        ErrorLink link;
        if (const json::JsonValue* about = object->get("about")) {
            auto parsed = link_value_from_json(*about);
            if (is_err(parsed)) {
                return unwrap_err(parsed);
            }
            link.about = std::move(unwrap(parsed));
        }
        error.links = std::move(link);
    }

    auto source = read_object(value, "source");
    if (is_err(source)) {
        return unwrap_err(source);
    }
    if (const json::JsonValue* object = unwrap(source)) {
        ErrorSource parsed;
        for (auto [key, slot] : {std::pair{"pointer", &parsed.pointer},
                                 std::pair{"parameter", &parsed.parameter}}) {
            auto text = wire::read_string(*object, key);
            if (is_err(text)) {
                return unwrap_err(text);
            }
            *slot = std::move(unwrap(text));
        }
        error.source = std::move(parsed);
    }

    error.meta = wire::read_any(value, "meta");
    return error;
}

// ============================================================================
// JSON:API Object
// ============================================================================

auto jsonapi_object_from_json(const json::JsonValue& value) -> Result<JsonApiObject, Error> {
    JsonApiObject object;
    auto version = wire::read_string(value, "version");
    if (is_err(version)) {
        return unwrap_err(version);
    }
    object.version = std::move(unwrap(version));
    auto meta = read_meta(value);
    if (is_err(meta)) {
        return unwrap_err(meta);
    }
    object.meta = std::move(unwrap(meta));
    return object;
}

auto jsonapi_object_to_json(const JsonApiObject& object) -> Result<json::JsonValue, Error> {
    auto out = json::json_object();
    out.set("version", json::JsonValue(object.version));
    auto meta = write_meta(out, object.meta);
    if (is_err(meta)) {
        return unwrap_err(meta);
    }
    return out;
}

} // namespace

// ============================================================================
// Shape Sniff
// ============================================================================

auto sniff_shape(const json::JsonValue& value) -> Result<DataShape, Error> {
    if (!value.is_object()) {
        return Error::malformed(std::string("document must be a JSON object, got ") +
                                value.kind_name());
    }
    if (value.size() == 0) {
        return Error::missing_data_field();
    }

    const json::JsonValue* data = value.get("data");
    if (data == nullptr || data->is_null()) {
        return DataShape::None;
    }
    if (data->is_object()) {
        if (data->size() == 0) {
            return Error::invalid_data_field();
        }
        return DataShape::One;
    }
    if (data->is_array()) {
        return DataShape::Many;
    }
    return Error::type_mismatch(data->kind_name(), {"object", "array", "null"});
}

// ============================================================================
// Resource Objects
// ============================================================================

auto resource_from_json(const json::JsonValue& value) -> Result<ResourceObject, Error> {
    auto is_object = wire::expect_object(value);
    if (is_err(is_object)) {
        return unwrap_err(is_object);
    }

    ResourceObject resource;

    auto type = wire::read_string(value, "type");
    if (is_err(type)) {
        return unwrap_err(type);
    }
    resource.type = std::move(unwrap(type));
    if (resource.type.empty()) {
        return Error::malformed("resource object is missing \"type\"");
    }

    auto id = wire::read_string(value, "id");
    if (is_err(id)) {
        return unwrap_err(id);
    }
    resource.id = std::move(unwrap(id));

    auto attributes = read_object(value, "attributes");
    if (is_err(attributes)) {
        return unwrap_err(attributes);
    }
    if (const json::JsonValue* object = unwrap(attributes)) {
        resource.attributes = object->as_object();
    }

    auto relationships = read_object(value, "relationships");
    if (is_err(relationships)) {
        return unwrap_err(relationships);
    }
    if (const json::JsonValue* object = unwrap(relationships)) {
        for (const auto& [name, member] : object->as_object()) {
            if (member.is_null()) {
                resource.relationships.push_back(Relationship{name, Document{}});
                continue;
            }
            auto related = document_from_json(member);
            if (is_err(related)) {
                JSONAPI_LOG_DEBUG("codec", "relationship \"" << name << "\" of " << resource.type
                                                             << " failed to decode");
                return unwrap_err(related);
            }
            resource.relationships.push_back(Relationship{name, std::move(unwrap(related))});
        }
    }

    auto meta = read_meta(value);
    if (is_err(meta)) {
        return unwrap_err(meta);
    }
    resource.meta = std::move(unwrap(meta));

    auto links = read_links(value);
    if (is_err(links)) {
        return unwrap_err(links);
    }
    resource.links = std::move(unwrap(links));

    return resource;
}

auto resource_to_json(const ResourceObject& resource) -> Result<json::JsonValue, Error> {
    if (resource.type.empty()) {
        return Error::malformed("resource object is missing \"type\"");
    }

    auto out = json::json_object();
    wire::put_string(out, "id", resource.id);
    out.set("type", json::JsonValue(resource.type));
    if (!resource.attributes.empty()) {
        out.set("attributes", json::JsonValue(resource.attributes));
    }
    if (!resource.relationships.empty()) {
        auto relationships = json::json_object();
        for (const auto& relationship : resource.relationships) {
            if (relationships.contains(relationship.name)) {
                return Error::malformed("duplicate relationship \"" + relationship.name +
                                        "\" on " + resource.identity());
            }
            auto value = document_to_json(relationship.document);
            if (is_err(value)) {
                return value;
            }
            relationships.set(relationship.name, std::move(unwrap(value)));
        }
        out.set("relationships", std::move(relationships));
    }

    auto meta = write_meta(out, resource.meta);
    if (is_err(meta)) {
        return unwrap_err(meta);
    }
    auto links = write_links(out, resource.links);
    if (is_err(links)) {
        return unwrap_err(links);
    }
    return out;
}

// ============================================================================
// Documents
// ============================================================================

auto document_from_json(const json::JsonValue& value) -> Result<Document, Error> {
    auto shape = sniff_shape(value);
    if (is_err(shape)) {
        return unwrap_err(shape);
    }

    Document document;

    switch (unwrap(shape)) {
    case DataShape::One: {
        auto resource = resource_from_json(*value.get("data"));
        if (is_err(resource)) {
            return unwrap_err(resource);
        }
        document.set_data_one(std::move(unwrap(resource)));
        break;
    }
    case DataShape::Many: {
        auto resources = resources_from_json(value.get("data")->as_array());
        if (is_err(resources)) {
            return unwrap_err(resources);
        }
        document.set_data_many(std::move(unwrap(resources)));
        break;
    }
    case DataShape::None:
        break;
    }

    auto meta = read_meta(value);
    if (is_err(meta)) {
        return unwrap_err(meta);
    }
    document.meta = std::move(unwrap(meta));

    auto format_info = read_object(value, "jsonapi");
    if (is_err(format_info)) {
        return unwrap_err(format_info);
    }
    if (const json::JsonValue* object = unwrap(format_info)) {
        auto parsed = jsonapi_object_from_json(*object);
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        document.jsonapi = std::move(unwrap(parsed));
    }

    auto errors = read_array(value, "errors");
    if (is_err(errors)) {
        return unwrap_err(errors);
    }
    if (const json::JsonValue* array = unwrap(errors)) {
        for (const auto& item : array->as_array()) {
            auto error = error_object_from_json(item);
            if (is_err(error)) {
                return unwrap_err(error);
            }
            document.errors.push_back(std::move(unwrap(error)));
        }
    }

    auto links = read_links(value);
    if (is_err(links)) {
        return unwrap_err(links);
    }
    document.links = std::move(unwrap(links));

    auto included = read_array(value, "included");
    if (is_err(included)) {
        return unwrap_err(included);
    }
    if (const json::JsonValue* array = unwrap(included)) {
        auto resources = resources_from_json(array->as_array());
        if (is_err(resources)) {
            return unwrap_err(resources);
        }
        document.included = std::move(unwrap(resources));
    }

    return document;
}

auto document_to_json(const Document& document) -> Result<json::JsonValue, Error> {
    auto out = json::json_object();

    if (document.errors.empty()) {
        if (const auto* many = document.data_many()) {
            auto data = resources_to_json(*many);
            if (is_err(data)) {
                return data;
            }
            out.set("data", std::move(unwrap(data)));
        } else if (const auto* one = document.data_one()) {
            auto data = resource_to_json(*one);
            if (is_err(data)) {
                return data;
            }
            out.set("data", std::move(unwrap(data)));
        } else {
            out.set("data", json::json_null());
        }
    } else {
        auto errors = json::json_array();
        for (const auto& error : document.errors) {
            errors.push(error_object_to_json(error));
        }
        out.set("errors", std::move(errors));
    }

    auto meta = write_meta(out, document.meta);
    if (is_err(meta)) {
        return unwrap_err(meta);
    }

    if (document.jsonapi) {
        auto object = jsonapi_object_to_json(*document.jsonapi);
        if (is_err(object)) {
            return object;
        }
        out.set("jsonapi", std::move(unwrap(object)));
    }

    auto links = write_links(out, document.links);
    if (is_err(links)) {
        return unwrap_err(links);
    }

    if (!document.included.empty()) {
        auto included = resources_to_json(document.included);
        if (is_err(included)) {
            return included;
        }
        out.set("included", std::move(unwrap(included)));
    }

    return out;
}

// ============================================================================
// Text Entry Points
// ============================================================================

auto encode_document(const Document& document, const EncodeOptions& options)
    -> Result<std::string, Error> {
    auto tree = document_to_json(document);
    if (is_err(tree)) {
        JSONAPI_LOG_DEBUG("codec", "encode failed: " << unwrap_err(tree).to_string());
        return unwrap_err(tree);
    }
    JSONAPI_LOG_DEBUG("codec", "encoded document with shape "
                                   << data_shape_name(document.shape()) << ", "
                                   << document.errors.size() << " errors, "
                                   << document.included.size() << " included");
    if (options.indent > 0) {
        return unwrap(tree).to_string_pretty(options.indent);
    }
    return unwrap(tree).to_string();
}

auto decode_document(std::string_view text, const DecodeOptions& options)
    -> Result<Document, Error> {
    auto tree = json::parse_json(text, options.max_depth);
    if (is_err(tree)) {
        const auto& error = unwrap_err(tree);
        JSONAPI_LOG_DEBUG("codec", "invalid JSON: " << error.to_string());
        return Error::syntax(error);
    }

    auto document = document_from_json(unwrap(tree));
    if (is_err(document)) {
        JSONAPI_LOG_DEBUG("codec", "decode failed: " << unwrap_err(document).to_string());
        return document;
    }
    JSONAPI_LOG_DEBUG("codec", "decoded document with shape "
                                   << data_shape_name(unwrap(document).shape()) << ", "
                                   << unwrap(document).included.size() << " included");
    return document;
}

} // namespace jsonapi
