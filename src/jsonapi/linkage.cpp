#include "jsonapi/linkage.hpp"

#include "log/log.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jsonapi {

namespace {

/// An included resource and the placeholders its relationships point to.
struct IncludeNode {
    size_t index = 0;
    std::vector<ResourceObject*> related;
    bool visited = false;
};

/// Appends the primary data of every relationship of `resource` to `out`.
void push_relationship_targets(ResourceObject& resource, std::vector<ResourceObject*>& out) {
    for (auto& relationship : resource.relationships) {
        for (ResourceObject* target : relationship.document.primary_resources()) {
            out.push_back(target);
        }
    }
}

} // namespace

auto verify_full_linkage(Document& document, bool alias_relationships) -> Result<bool, Error> {
    if (document.included.empty()) {
        return true;
    }

    std::unordered_map<std::string, IncludeNode> graph;
    graph.reserve(document.included.size());
    for (size_t i = 0; i < document.included.size(); ++i) {
        IncludeNode node;
        node.index = i;
        push_relationship_targets(document.included[i], node.related);
        // A repeated identity replaces the earlier entry.
        graph[document.included[i].identity()] = std::move(node);
    }

    std::vector<ResourceObject*> pending;
    for (ResourceObject* primary : document.primary_resources()) {
        push_relationship_targets(*primary, pending);
    }
    JSONAPI_LOG_DEBUG("linkage", "verifying " << graph.size() << " included resources from "
                                              << pending.size() << " primary relationship targets");

    // Placeholder to overwrite, and the included index to copy into it.
    std::vector<std::pair<ResourceObject*, size_t>> aliases;
    size_t visited = 0;

    while (!pending.empty()) {
        ResourceObject* placeholder = pending.back();
        pending.pop_back();

        auto it = graph.find(placeholder->identity());
        if (it == graph.end()) {
            JSONAPI_LOG_TRACE("linkage", "skip " << placeholder->identity() << " (not included)");
            continue;
        }

        IncludeNode& node = it->second;
        aliases.emplace_back(placeholder, node.index);
        if (node.visited) {
            continue;
        }

        node.visited = true;
        ++visited;
        JSONAPI_LOG_TRACE("linkage", "visit " << it->first << " (" << node.related.size()
                                              << " related)");
        pending.insert(pending.end(), node.related.begin(), node.related.end());
    }

    std::set<std::string> orphans;
    for (const auto& [identity, node] : graph) {
        if (!node.visited) {
            orphans.insert(identity);
        }
    }
    JSONAPI_LOG_DEBUG("linkage", "reached " << visited << " of " << graph.size()
                                            << " included resources, " << orphans.size()
                                            << " orphaned");
    if (!orphans.empty()) {
        return Error::partial_linkage(std::move(orphans));
    }

    if (alias_relationships) {
        const std::vector<ResourceObject> bodies = document.included;
        for (auto [placeholder, index] : aliases) {
            *placeholder = bodies[index];
        }
        JSONAPI_LOG_DEBUG("linkage", "aliased " << aliases.size() << " relationship placeholders");
    }
    return true;
}

} // namespace jsonapi
