//! # Full Linkage Tests
//!
//! Reachability of included resources from primary data, cycle handling,
//! and relationship aliasing.

#include "jsonapi/codec.hpp"
#include "jsonapi/linkage.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace jsonapi;

namespace {

auto resource(std::string type, std::string id) -> ResourceObject {
    ResourceObject out;
    out.type = std::move(type);
    out.id = std::move(id);
    return out;
}

auto to_one(ResourceObject target) -> Document {
    Document out;
    out.set_data_one(std::move(target));
    return out;
}

/// `resource` with a single to-one relationship `name` pointing at `target`.
auto linked(ResourceObject from, const std::string& name, ResourceObject target) -> ResourceObject {
    from.set_relationship(name, to_one(std::move(target)));
    return from;
}

auto named(std::string type, std::string id, std::string name) -> ResourceObject {
    ResourceObject out = resource(std::move(type), std::move(id));
    out.attributes["name"] = json::JsonValue(std::move(name));
    return out;
}

auto decode_ok(std::string_view text) -> Document {
    auto result = decode_document(text);
    EXPECT_TRUE(is_ok(result)) << text;
    if (is_err(result)) {
        return Document{};
    }
    return std::move(unwrap(result));
}

} // namespace

// ============================================================================
// Relationship Accessors
// ============================================================================

TEST(RelationshipTest, SetReplacesByName) {
    ResourceObject article = resource("articles", "1");
    article.set_relationship("author", to_one(resource("people", "1")));
    article.set_relationship("tags", Document{});
    article.set_relationship("author", to_one(resource("people", "2")));

    ASSERT_EQ(article.relationships.size(), 2u);
    EXPECT_EQ(article.relationships[0].name, "author");
    EXPECT_EQ(article.relationships[1].name, "tags");
    EXPECT_EQ(article.relationship("author")->data_one()->id, "2");
}

TEST(RelationshipTest, PrimaryResourcesPerShape) {
    Document none;
    EXPECT_TRUE(none.primary_resources().empty());

    Document one = to_one(resource("a", "1"));
    ASSERT_EQ(one.primary_resources().size(), 1u);
    EXPECT_EQ(one.primary_resources()[0], one.data_one());

    Document many;
    many.set_data_many({resource("a", "1"), resource("a", "2")});
    EXPECT_EQ(many.primary_resources().size(), 2u);

    many.clear_data();
    EXPECT_EQ(many.shape(), DataShape::None);
}

// ============================================================================
// Verification
// ============================================================================

TEST(FullLinkageTest, NothingIncludedPasses) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    auto result = verify_full_linkage(document);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result));

    Document empty;
    EXPECT_TRUE(is_ok(verify_full_linkage(empty, true)));
}

TEST(FullLinkageTest, DirectlyReachable) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    document.included.push_back(named("b", "2", "bee"));

    EXPECT_TRUE(is_ok(verify_full_linkage(document)));
}

TEST(FullLinkageTest, OrphanIsReported) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    document.included.push_back(resource("b", "2"));
    document.included.push_back(resource("c", "3"));

    auto result = verify_full_linkage(document);
    ASSERT_TRUE(is_err(result));
    const Error& error = unwrap_err(result);
    EXPECT_EQ(error.kind, ErrorKind::PartialLinkage);
    EXPECT_EQ(error.resources, (std::set<std::string>{"{Type: c, ID: 3}"}));
    EXPECT_NE(error.to_string().find("{Type: c, ID: 3}"), std::string::npos);
}

TEST(FullLinkageTest, AllOrphansAreListed) {
    Document document = to_one(resource("a", "1"));
    document.included.push_back(resource("x", "1"));
    document.included.push_back(resource("y", "2"));

    auto result = verify_full_linkage(document);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).resources,
              (std::set<std::string>{"{Type: x, ID: 1}", "{Type: y, ID: 2}"}));
}

TEST(FullLinkageTest, TransitivelyReachable) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    document.included.push_back(linked(resource("b", "2"), "c", resource("c", "3")));
    document.included.push_back(linked(resource("c", "3"), "d", resource("d", "4")));
    document.included.push_back(resource("d", "4"));

    EXPECT_TRUE(is_ok(verify_full_linkage(document)));
}

TEST(FullLinkageTest, CyclesTerminate) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    document.included.push_back(linked(resource("b", "2"), "a", resource("a", "1")));
    document.included.push_back(linked(resource("a", "1"), "b", resource("b", "2")));

    EXPECT_TRUE(is_ok(verify_full_linkage(document)));
}

TEST(FullLinkageTest, TargetsOutsideTheDocumentAreIgnored) {
    ResourceObject article = resource("articles", "1");
    article.set_relationship("author", to_one(resource("people", "404")));
    article.set_relationship("editor", to_one(resource("people", "9")));

    Document document = to_one(article);
    document.included.push_back(resource("people", "9"));

    EXPECT_TRUE(is_ok(verify_full_linkage(document)));
}

TEST(FullLinkageTest, ManyPrimaryAndToManyRelationships) {
    ResourceObject article = resource("articles", "1");
    Document comments;
    comments.set_data_many({resource("comments", "5"), resource("comments", "12")});
    article.set_relationship("comments", std::move(comments));

    Document document;
    document.set_data_many({resource("articles", "0"), article});
    document.included.push_back(resource("comments", "5"));
    document.included.push_back(resource("comments", "12"));

    EXPECT_TRUE(is_ok(verify_full_linkage(document)));
}

TEST(FullLinkageTest, PrimaryDataItselfIsNotAnAnchor) {
    // Including the primary resource without any relationship to it leaves it unreached.
    Document document = to_one(resource("a", "1"));
    document.included.push_back(resource("a", "1"));

    auto result = verify_full_linkage(document);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).resources, (std::set<std::string>{"{Type: a, ID: 1}"}));
}

TEST(FullLinkageTest, DecodedCompoundDocument) {
    auto document = decode_ok(R"({
        "data": [{
            "type": "articles", "id": "1",
            "relationships": {
                "author": {"data": {"type": "people", "id": "9"}},
                "comments": {"data": [{"type": "comments", "id": "5"}]}
            }
        }],
        "included": [
            {"type": "people", "id": "9", "attributes": {"name": "Dan"}},
            {
                "type": "comments", "id": "5",
                "relationships": {"author": {"data": {"type": "people", "id": "2"}}}
            },
            {"type": "people", "id": "2", "attributes": {"name": "Tom"}}
        ]
    })");

    EXPECT_TRUE(is_ok(verify_full_linkage(document)));

    document.included.push_back(resource("tags", "7"));
    auto result = verify_full_linkage(document);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).resources, (std::set<std::string>{"{Type: tags, ID: 7}"}));
}

// ============================================================================
// Aliasing
// ============================================================================

TEST(AliasingTest, PlaceholdersBecomeFullResources) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    document.included.push_back(linked(named("b", "2", "bee"), "a", resource("a", "1")));
    document.included.push_back(named("a", "1", "ay"));

    ASSERT_TRUE(is_ok(verify_full_linkage(document, true)));

    const ResourceObject* b = document.data_one()->relationship("b")->data_one();
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->attributes.at("name").as_string(), "bee");
    ASSERT_NE(b->relationship("a"), nullptr);

    // The nested target is copied from the unaliased included list.
    const ResourceObject* a = b->relationship("a")->data_one();
    EXPECT_EQ(a->identity(), "{Type: a, ID: 1}");
    EXPECT_TRUE(a->attributes.empty());

    const ResourceObject* included_a = document.included[0].relationship("a")->data_one();
    EXPECT_EQ(included_a->attributes.at("name").as_string(), "ay");
}

TEST(AliasingTest, MutuallyLinkedIncludesAreBothMaterialised) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    document.included.push_back(linked(named("b", "2", "bee"), "a", resource("a", "1")));
    document.included.push_back(linked(named("a", "1", "ay"), "b", resource("b", "2")));

    ASSERT_TRUE(is_ok(verify_full_linkage(document, true)));

    const ResourceObject* primary_b = document.data_one()->relationship("b")->data_one();
    EXPECT_EQ(primary_b->identity(), "{Type: b, ID: 2}");
    EXPECT_EQ(primary_b->attributes.at("name").as_string(), "bee");

    const ResourceObject* b_to_a = document.included[0].relationship("a")->data_one();
    EXPECT_EQ(b_to_a->identity(), "{Type: a, ID: 1}");
    EXPECT_EQ(b_to_a->attributes.at("name").as_string(), "ay");
    ASSERT_NE(b_to_a->relationship("b"), nullptr);

    const ResourceObject* a_to_b = document.included[1].relationship("b")->data_one();
    EXPECT_EQ(a_to_b->identity(), "{Type: b, ID: 2}");
    EXPECT_EQ(a_to_b->attributes.at("name").as_string(), "bee");
    ASSERT_NE(a_to_b->relationship("a"), nullptr);
}

TEST(AliasingTest, EveryPlaceholderOfATargetIsReplaced) {
    ResourceObject article = resource("articles", "1");
    article.set_relationship("author", to_one(resource("people", "9")));
    article.set_relationship("editor", to_one(resource("people", "9")));

    Document document = to_one(article);
    document.included.push_back(named("people", "9", "Dan"));

    ASSERT_TRUE(is_ok(verify_full_linkage(document, true)));
    for (const char* name : {"author", "editor"}) {
        const ResourceObject* person = document.data_one()->relationship(name)->data_one();
        EXPECT_EQ(person->attributes.at("name").as_string(), "Dan") << name;
    }
}

TEST(AliasingTest, OutsideTargetsStayPlaceholders) {
    ResourceObject article = resource("articles", "1");
    article.set_relationship("author", to_one(resource("people", "404")));
    Document document = to_one(article);
    document.included.push_back(linked(named("tags", "1", "t"), "x", resource("x", "1")));
    document.data_one()->set_relationship("tag", to_one(resource("tags", "1")));

    ASSERT_TRUE(is_ok(verify_full_linkage(document, true)));
    EXPECT_TRUE(document.data_one()->relationship("author")->data_one()->attributes.empty());
    EXPECT_EQ(document.data_one()->relationship("tag")->data_one()->attributes.size(), 1u);
}

TEST(AliasingTest, FailureLeavesDocumentUntouched) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    document.included.push_back(named("b", "2", "bee"));
    document.included.push_back(resource("c", "3"));
    const Document before = document;

    auto result = verify_full_linkage(document, true);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(document, before);
}

TEST(AliasingTest, WithoutFlagDocumentIsUntouched) {
    Document document = to_one(linked(resource("a", "1"), "b", resource("b", "2")));
    document.included.push_back(named("b", "2", "bee"));
    const Document before = document;

    ASSERT_TRUE(is_ok(verify_full_linkage(document)));
    EXPECT_EQ(document, before);
}
