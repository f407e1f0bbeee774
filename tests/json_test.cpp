//! # JSON Layer Tests
//!
//! - Value construction, copies and equality
//! - Parser (primitives, strings and escapes, nesting, error positions)
//! - Serializer (compact, pretty, escapes, number forms)

#include "common.hpp"

#include "json/json_parser.hpp"
#include "json/json_value.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <string>

using namespace jsonapi;
using namespace jsonapi::json;

namespace {

auto parse_ok(std::string_view text) -> JsonValue {
    auto result = parse_json(text);
    EXPECT_TRUE(is_ok(result)) << text;
    if (is_err(result)) {
        return JsonValue();
    }
    return std::move(unwrap(result));
}

auto parse_err(std::string_view text) -> JsonError {
    auto result = parse_json(text);
    EXPECT_TRUE(is_err(result)) << text;
    if (is_ok(result)) {
        return JsonError::make("unexpected success");
    }
    return unwrap_err(result);
}

} // namespace

// ============================================================================
// Values
// ============================================================================

TEST(JsonValueTest, KindsAndNames) {
    EXPECT_STREQ(JsonValue().kind_name(), "null");
    EXPECT_STREQ(JsonValue(true).kind_name(), "bool");
    EXPECT_STREQ(JsonValue(3).kind_name(), "number");
    EXPECT_STREQ(JsonValue("x").kind_name(), "string");
    EXPECT_STREQ(json_array().kind_name(), "array");
    EXPECT_STREQ(json_object().kind_name(), "object");
}

TEST(JsonValueTest, CopyIsDeep) {
    auto original = json_object();
    original.set("tags", json_array());
    original.as_object_mut().at("tags").push(JsonValue("a"));

    JsonValue copy = original;
    copy.as_object_mut().at("tags").push(JsonValue("b"));

    EXPECT_EQ(original.get("tags")->size(), 1u);
    EXPECT_EQ(copy.get("tags")->size(), 2u);
    EXPECT_NE(original, copy);
}

TEST(JsonValueTest, ObjectEqualityIgnoresInsertionOrder) {
    auto a = json_object();
    a.set("x", JsonValue(1));
    a.set("y", JsonValue(2));

    auto b = json_object();
    b.set("y", JsonValue(2));
    b.set("x", JsonValue(1));

    EXPECT_EQ(a, b);
}

TEST(JsonValueTest, NumberEqualityAcrossKinds) {
    EXPECT_EQ(JsonNumber(int64_t{5}), JsonNumber(uint64_t{5}));
    EXPECT_NE(JsonNumber(int64_t{-1}), JsonNumber(std::numeric_limits<uint64_t>::max()));
    EXPECT_EQ(JsonNumber(2.5), JsonNumber(2.5));
}

TEST(JsonValueTest, GetOnNonObjectIsNull) {
    EXPECT_EQ(json_array().get("data"), nullptr);
    EXPECT_EQ(JsonValue("text").get("data"), nullptr);
    EXPECT_FALSE(json_object().contains("data"));
}

// ============================================================================
// Parser
// ============================================================================

TEST(JsonParserTest, Literals) {
    EXPECT_TRUE(parse_ok("null").is_null());
    EXPECT_TRUE(parse_ok("true").as_bool());
    EXPECT_FALSE(parse_ok(" false ").as_bool());
}

TEST(JsonParserTest, IntegersKeepTheirKind) {
    auto small = parse_ok("-42");
    EXPECT_EQ(small.as_number().kind, JsonNumber::Kind::Int64);
    EXPECT_EQ(small.as_number().try_as_i64().value_or(0), -42);

    auto large = parse_ok("18446744073709551615");
    EXPECT_EQ(large.as_number().kind, JsonNumber::Kind::Uint64);
    EXPECT_EQ(large.as_number().u64, std::numeric_limits<uint64_t>::max());

    auto real = parse_ok("1.5e2");
    EXPECT_EQ(real.as_number().kind, JsonNumber::Kind::Double);
    EXPECT_DOUBLE_EQ(real.as_number().as_f64(), 150.0);
}

TEST(JsonParserTest, StringEscapes) {
    auto value = parse_ok(R"("a\"b\\c\/d\né😀")");
    EXPECT_EQ(value.as_string(), "a\"b\\c/d\n\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JsonParserTest, NestedStructure) {
    auto value = parse_ok(R"({"data": [{"type": "a", "id": "1"}, {"type": "b"}], "meta": {}})");
    ASSERT_TRUE(value.is_object());
    ASSERT_TRUE(value.get("data")->is_array());
    EXPECT_EQ(value.get("data")->size(), 2u);
    EXPECT_EQ(value.get("data")->as_array()[0].get("id")->as_string(), "1");
    EXPECT_EQ(value.get("meta")->size(), 0u);
}

TEST(JsonParserTest, DuplicateKeyLastWins) {
    auto value = parse_ok(R"({"id": "1", "id": "2"})");
    EXPECT_EQ(value.get("id")->as_string(), "2");
}

TEST(JsonParserTest, RejectsMalformedInput) {
    EXPECT_EQ(parse_err("").message, "Empty input");
    EXPECT_EQ(parse_err("{} {}").message, "Unexpected content after JSON value");
    EXPECT_EQ(parse_err("[1, 2,]").message, "Trailing comma in array");
    EXPECT_EQ(parse_err(R"({"a": 1,})").message, "Trailing comma in object");
    EXPECT_EQ(parse_err("01").message, "Leading zeros are not allowed");
    EXPECT_EQ(parse_err("nul").message, "Unknown literal");
    EXPECT_EQ(parse_err(R"("\ud83d")").message, "Unpaired surrogate in unicode escape");
    EXPECT_EQ(parse_err("\"abc").message, "Unterminated string");
}

TEST(JsonParserTest, ErrorPosition) {
    auto error = parse_err("{\n  \"data\": nope\n}");
    EXPECT_EQ(error.line, 2u);
    EXPECT_EQ(error.column, 11u);
    EXPECT_EQ(error.to_string(), "line 2, column 11: Unknown literal");
}

TEST(JsonParserTest, DepthLimit) {
    std::string deep(20, '[');
    deep += std::string(20, ']');

    EXPECT_TRUE(is_ok(parse_json(deep, 20)));
    auto result = parse_json(deep, 19);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Maximum nesting depth exceeded");
}

// ============================================================================
// Serializer
// ============================================================================

TEST(JsonSerializerTest, CompactSortsKeys) {
    auto value = json_object();
    value.set("type", JsonValue("articles"));
    value.set("id", JsonValue("1"));
    value.set("attributes", json_object());

    EXPECT_EQ(value.to_string(), R"({"attributes":{},"id":"1","type":"articles"})");
}

TEST(JsonSerializerTest, Pretty) {
    auto value = json_object();
    auto list = json_array();
    list.push(JsonValue(1));
    list.push(JsonValue(true));
    value.set("data", std::move(list));

    EXPECT_EQ(value.to_string_pretty(2), "{\n  \"data\": [\n    1,\n    true\n  ]\n}");
}

TEST(JsonSerializerTest, EscapesControlCharacters) {
    JsonValue value(std::string("tab\there \"q\" \x01"));
    EXPECT_EQ(value.to_string(), R"("tab\there \"q\" \u0001")");
}

TEST(JsonSerializerTest, NumberForms) {
    EXPECT_EQ(JsonValue(int64_t{-7}).to_string(), "-7");
    EXPECT_EQ(JsonValue(std::numeric_limits<uint64_t>::max()).to_string(),
              "18446744073709551615");
    EXPECT_EQ(JsonValue(2.0).to_string(), "2.0");
    EXPECT_EQ(JsonValue(0.5).to_string(), "0.5");
    EXPECT_EQ(JsonValue(std::nan("")).to_string(), "null");
    EXPECT_EQ(JsonValue(std::numeric_limits<double>::infinity()).to_string(), "null");
}

TEST(JsonSerializerTest, ReparsesToEqualTree) {
    const char* text =
        R"({"data":{"attributes":{"rating":4.25,"tags":["x","y"]},"id":"9","type":"a"}})";
    auto value = parse_ok(text);
    EXPECT_EQ(value.to_string(), text);
    EXPECT_EQ(parse_ok(value.to_string_pretty(4)), value);
}
