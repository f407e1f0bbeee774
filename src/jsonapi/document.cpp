#include "jsonapi/document.hpp"

#include <algorithm>

namespace jsonapi {

// ============================================================================
// ResourceObject
// ============================================================================

auto ResourceObject::identity() const -> std::string {
    return "{Type: " + type + ", ID: " + id + "}";
}

auto ResourceObject::relationship(const std::string& name) const -> const Document* {
    auto it = std::find_if(relationships.begin(), relationships.end(),
                           [&](const Relationship& rel) { return rel.name == name; });
    return it != relationships.end() ? &it->document : nullptr;
}

auto ResourceObject::relationship(const std::string& name) -> Document* {
    auto it = std::find_if(relationships.begin(), relationships.end(),
                           [&](const Relationship& rel) { return rel.name == name; });
    return it != relationships.end() ? &it->document : nullptr;
}

void ResourceObject::set_relationship(const std::string& name, Document document) {
    if (Document* existing = relationship(name)) {
        *existing = std::move(document);
        return;
    }
    relationships.push_back(Relationship{name, std::move(document)});
}

// Relationships compare by name; their order is not significant.
auto ResourceObject::operator==(const ResourceObject& other) const -> bool {
    if (id != other.id || type != other.type || attributes != other.attributes ||
        meta != other.meta || links != other.links ||
        relationships.size() != other.relationships.size()) {
        return false;
    }
    return std::all_of(relationships.begin(), relationships.end(), [&](const Relationship& rel) {
        const Document* match = other.relationship(rel.name);
        return match != nullptr && *match == rel.document;
    });
}

// ============================================================================
// Document
// ============================================================================

auto data_shape_name(DataShape shape) -> const char* {
    switch (shape) {
    case DataShape::None:
        return "None";
    case DataShape::One:
        return "One";
    case DataShape::Many:
        return "Many";
    }
    return "Unknown";
}

auto Document::shape() const -> DataShape {
    switch (data.index()) {
    case 1:
        return DataShape::One;
    case 2:
        return DataShape::Many;
    default:
        return DataShape::None;
    }
}

auto Document::data_one() const -> const ResourceObject* {
    return std::get_if<ResourceObject>(&data);
}

auto Document::data_one() -> ResourceObject* {
    return std::get_if<ResourceObject>(&data);
}

auto Document::data_many() const -> const std::vector<ResourceObject>* {
    return std::get_if<std::vector<ResourceObject>>(&data);
}

auto Document::data_many() -> std::vector<ResourceObject>* {
    return std::get_if<std::vector<ResourceObject>>(&data);
}

void Document::set_data_one(ResourceObject resource) {
    data = std::move(resource);
}

void Document::set_data_many(std::vector<ResourceObject> resources) {
    data = std::move(resources);
}

void Document::clear_data() {
    data = std::monostate{};
}

auto Document::primary_resources() -> std::vector<ResourceObject*> {
    std::vector<ResourceObject*> out;
    if (auto* one = data_one()) {
        out.push_back(one);
    } else if (auto* many = data_many()) {
        out.reserve(many->size());
        for (auto& resource : *many) {
            out.push_back(&resource);
        }
    }
    return out;
}

auto Document::is_empty() const -> bool {
    if (data_one() != nullptr) {
        return false;
    }
    const auto* many = data_many();
    return many == nullptr || many->empty();
}

auto Document::operator==(const Document& other) const -> bool {
    return data == other.data && meta == other.meta && jsonapi == other.jsonapi &&
           errors == other.errors && links == other.links && included == other.included;
}

} // namespace jsonapi
