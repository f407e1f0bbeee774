//! # Meta and Link Validation Tests

#include "json/json_parser.hpp"
#include "jsonapi/codec.hpp"
#include "jsonapi/link.hpp"
#include "jsonapi/linkable.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace jsonapi;

namespace {

auto meta_object() -> json::JsonValue {
    auto meta = json::json_object();
    meta.set("count", json::JsonValue(10));
    return meta;
}

struct Article {
    std::string id;

    auto link() const -> std::optional<Link> {
        Link link;
        link.self = "/articles/" + id;
        link.related = std::string("");
        return link;
    }

    auto link_relation(const std::string& name) const -> std::optional<Link> {
        if (name == "author") {
            Link link;
            link.self = "/articles/" + id + "/relationships/author";
            link.related = LinkObject{"/articles/" + id + "/author", meta_object()};
            return link;
        }
        if (name == "broken") {
            return Link{};
        }
        return std::nullopt;
    }
};

struct Plain {
    std::string id;
};

} // namespace

// ============================================================================
// check_meta
// ============================================================================

TEST(CheckMetaTest, NullAndObjectsPass) {
    EXPECT_TRUE(is_ok(check_meta(json::JsonValue())));
    EXPECT_TRUE(is_ok(check_meta(json::json_object())));
    EXPECT_TRUE(is_ok(check_meta(meta_object())));
}

TEST(CheckMetaTest, ScalarsAndArraysFail) {
    for (const auto& value : {json::JsonValue(1), json::JsonValue("x"), json::JsonValue(true),
                              json::json_array()}) {
        auto result = check_meta(value);
        ASSERT_TRUE(is_err(result)) << value.kind_name();
        const auto& error = unwrap_err(result);
        EXPECT_EQ(error.kind, ErrorKind::TypeMismatch);
        EXPECT_EQ(error.actual, value.kind_name());
        EXPECT_EQ(error.expected, (std::vector<std::string>{"struct", "map"}));
    }
}

// ============================================================================
// check_link_value
// ============================================================================

TEST(CheckLinkValueTest, Emptiness) {
    EXPECT_TRUE(unwrap(check_link_value(LinkValue{})));
    EXPECT_TRUE(unwrap(check_link_value(LinkValue{std::string()})));
    EXPECT_FALSE(unwrap(check_link_value(LinkValue{std::string("/a")})));
    EXPECT_TRUE(unwrap(check_link_value(LinkValue{LinkObject{}})));
    EXPECT_FALSE(unwrap(check_link_value(LinkValue{LinkObject{"/a", json::JsonValue()}})));
}

TEST(CheckLinkValueTest, LinkObjectMetaIsChecked) {
    auto result = check_link_value(LinkValue{LinkObject{"/a", json::JsonValue("oops")}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(unwrap_err(result).actual, "string");
}

// ============================================================================
// Link::check
// ============================================================================

TEST(LinkCheckTest, BothEmptyFails) {
    Link link;
    link.self = std::string("");
    link.related = std::string("");

    auto result = link.check();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::MissingLinkFields);
}

TEST(LinkCheckTest, BothAbsentFails) {
    Link link;
    link.next = "/articles?page=2";
    ASSERT_TRUE(is_err(link.check()));
}

TEST(LinkCheckTest, EmptyRelatedIsDropped) {
    Link link;
    link.self = std::string("/a");
    link.related = std::string("");

    ASSERT_TRUE(is_ok(link.check()));
    EXPECT_TRUE(link.has_self());
    EXPECT_FALSE(link.has_related());
    EXPECT_EQ(std::get<std::string>(link.self), "/a");
}

TEST(LinkCheckTest, EmptySelfObjectIsDropped) {
    Link link;
    link.self = LinkObject{};
    link.related = LinkObject{"/b", meta_object()};

    ASSERT_TRUE(is_ok(link.check()));
    EXPECT_FALSE(link.has_self());
    ASSERT_TRUE(link.has_related());
    EXPECT_EQ(std::get<LinkObject>(link.related).href, "/b");
}

TEST(LinkCheckTest, BothPresentUntouched) {
    Link link;
    link.self = std::string("/a");
    link.related = LinkObject{"/b", json::JsonValue()};
    Link before = link;

    ASSERT_TRUE(is_ok(link.check()));
    EXPECT_EQ(link, before);
}

TEST(LinkCheckTest, BadMetaReportedBeforeEmptiness) {
    Link link;
    link.related = LinkObject{"", json::json_array()};

    auto result = link.check();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::TypeMismatch);
}

// ============================================================================
// Wire Form
// ============================================================================

TEST(LinkWireTest, NormalisedLinkOmitsRelated) {
    Link link;
    link.self = std::string("/a");
    link.related = std::string("");
    ASSERT_TRUE(is_ok(link.check()));

    EXPECT_EQ(link_to_json(link).to_string(), R"({"self":"/a"})");
}

TEST(LinkWireTest, LinkObjectAndPagination) {
    Link link;
    link.related = LinkObject{"/b", meta_object()};
    link.first = "/p/1";
    link.previous = "/p/1";
    link.next = "/p/3";
    link.last = "/p/9";

    EXPECT_EQ(link_to_json(link).to_string(),
              R"({"first":"/p/1","last":"/p/9","next":"/p/3","previous":"/p/1",)"
              R"("related":{"href":"/b","meta":{"count":10}}})");
}

TEST(LinkWireTest, ReadsBothForms) {
    auto parsed = json::parse_json(
        R"({"self": "/a", "related": {"href": "/b", "meta": {"n": 1}}, "next": "/c"})");
    ASSERT_TRUE(is_ok(parsed));

    auto link = link_from_json(unwrap(parsed));
    ASSERT_TRUE(is_ok(link));
    EXPECT_EQ(std::get<std::string>(unwrap(link).self), "/a");
    EXPECT_EQ(std::get<LinkObject>(unwrap(link).related).href, "/b");
    EXPECT_EQ(unwrap(link).next, "/c");
}

TEST(LinkWireTest, RejectsWrongTypes) {
    auto number_self = json::parse_json(R"({"self": 5})");
    auto result = link_from_json(unwrap(number_self));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).expected, (std::vector<std::string>{"LinkObject", "string"}));

    auto number_next = json::parse_json(R"({"self": "/a", "next": 2})");
    ASSERT_TRUE(is_err(link_from_json(unwrap(number_next))));

    EXPECT_TRUE(is_err(link_from_json(json::JsonValue("/a"))));
}

TEST(LinkWireTest, EncodeFailsOnEmptyLinks) {
    Document document;
    document.links = Link{};

    auto encoded = encode_document(document);
    ASSERT_TRUE(is_err(encoded));
    EXPECT_EQ(unwrap_err(encoded).kind, ErrorKind::MissingLinkFields);
}

TEST(LinkWireTest, EncodeDoesNotMutateDocument) {
    Document document;
    Link link;
    link.self = std::string("/a");
    link.related = std::string("");
    document.links = link;

    auto encoded = encode_document(document);
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded), R"({"data":null,"links":{"self":"/a"}})");
    EXPECT_TRUE(document.links->has_related());
}

// ============================================================================
// Link Providers
// ============================================================================

TEST(LinkProviderTest, ResourceLinksAreChecked) {
    auto links = resource_links(Article{"7"});
    ASSERT_TRUE(is_ok(links));
    ASSERT_TRUE(unwrap(links).has_value());
    EXPECT_EQ(std::get<std::string>(unwrap(links)->self), "/articles/7");
    EXPECT_FALSE(unwrap(links)->has_related());
}

TEST(LinkProviderTest, RelationLinks) {
    Article article{"7"};

    auto author = relation_links(article, "author");
    ASSERT_TRUE(is_ok(author));
    ASSERT_TRUE(unwrap(author).has_value());
    EXPECT_EQ(std::get<LinkObject>(unwrap(author)->related).href, "/articles/7/author");

    auto unknown = relation_links(article, "comments");
    ASSERT_TRUE(is_ok(unknown));
    EXPECT_FALSE(unwrap(unknown).has_value());

    auto broken = relation_links(article, "broken");
    ASSERT_TRUE(is_err(broken));
    EXPECT_EQ(unwrap_err(broken).kind, ErrorKind::MissingLinkFields);
}

TEST(LinkProviderTest, TypesWithoutCapabilityHaveNoLinks) {
    static_assert(Linkable<Article>);
    static_assert(LinkableRelation<Article>);
    static_assert(!Linkable<Plain>);
    static_assert(!LinkableRelation<Plain>);

    auto links = resource_links(Plain{"1"});
    ASSERT_TRUE(is_ok(links));
    EXPECT_FALSE(unwrap(links).has_value());
    EXPECT_FALSE(unwrap(relation_links(Plain{"1"}, "author")).has_value());
}
