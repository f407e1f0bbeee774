//! # Identifier Resolver Tests
//!
//! The marshal and unmarshal precedence chains, and `make_identifier`.

#include "jsonapi/identifier.hpp"
#include "jsonapi/linkable.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <string_view>

using namespace jsonapi;

namespace {

/// Custom wire form, also has a Stringer that must lose.
struct OrderKey {
    uint64_t value = 0;

    auto marshal_id() const -> std::string {
        return "ord-" + std::to_string(value);
    }

    auto to_string() const -> std::string {
        return "stringer";
    }
};

/// Only a Stringer.
struct Sku {
    std::string code;

    auto to_string() const -> std::string {
        return "sku:" + code;
    }
};

/// Records what it was handed and fails on request.
struct StrictKey {
    std::string received;
    int calls = 0;

    auto unmarshal_id(const std::string& id) -> Result<bool, Error> {
        ++calls;
        received = id;
        if (id.rfind("ok-", 0) != 0) {
            Error error = Error::malformed("key must start with ok-: " + id);
            error.actual = id;
            return error;
        }
        return true;
    }
};

struct Opaque {
    int x = 0;
};

} // namespace

// ============================================================================
// Marshal
// ============================================================================

TEST(MarshalIdentifierTest, CapabilityWinsOverStringer) {
    static_assert(MarshalIdentifier<OrderKey>);
    static_assert(Stringer<OrderKey>);

    auto id = marshal_identifier(OrderKey{42});
    ASSERT_TRUE(is_ok(id));
    EXPECT_EQ(unwrap(id), "ord-42");
}

TEST(MarshalIdentifierTest, StringsPassThrough) {
    EXPECT_EQ(unwrap(marshal_identifier(std::string("abc"))), "abc");
    EXPECT_EQ(unwrap(marshal_identifier(std::string_view("def"))), "def");
    EXPECT_EQ(unwrap(marshal_identifier(std::string())), "");
}

TEST(MarshalIdentifierTest, StringerIsTheFallback) {
    auto id = marshal_identifier(Sku{"X1"});
    ASSERT_TRUE(is_ok(id));
    EXPECT_EQ(unwrap(id), "sku:X1");
}

TEST(MarshalIdentifierTest, UnsupportedTypeFails) {
    auto id = marshal_identifier(Opaque{});
    ASSERT_TRUE(is_err(id));

    const auto& error = unwrap_err(id);
    EXPECT_EQ(error.kind, ErrorKind::TypeMismatch);
    EXPECT_NE(error.actual.find("Opaque"), std::string::npos);
    EXPECT_EQ(error.expected,
              (std::vector<std::string>{"MarshalIdentifier", "string", "Stringer"}));
}

TEST(MarshalIdentifierTest, IntegersAreNotStrings) {
    auto id = marshal_identifier(7);
    ASSERT_TRUE(is_err(id));
    EXPECT_EQ(unwrap_err(id).actual, "int");
}

TEST(MarshalIdentifierTest, TypeNamesAreReadable) {
    EXPECT_EQ(type_name<int>(), "int");
    EXPECT_NE(type_name<Opaque>().find("Opaque"), std::string::npos);
    EXPECT_EQ(type_name<Opaque>().find("6Opaque"), std::string::npos);
}

// ============================================================================
// Unmarshal
// ============================================================================

TEST(UnmarshalIdentifierTest, CapabilityReceivesExactString) {
    StrictKey key;
    auto result = unmarshal_identifier("ok- 12 ", key);

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(key.calls, 1);
    EXPECT_EQ(key.received, "ok- 12 ");
}

TEST(UnmarshalIdentifierTest, CapabilityErrorSurfacesUnchanged) {
    StrictKey key;
    auto result = unmarshal_identifier("nope", key);

    ASSERT_TRUE(is_err(result));
    Error expected = Error::malformed("key must start with ok-: nope");
    expected.actual = "nope";
    EXPECT_EQ(unwrap_err(result), expected);
    EXPECT_EQ(key.calls, 1);
}

TEST(UnmarshalIdentifierTest, StringAssignedDirectly) {
    std::string target = "old";
    auto result = unmarshal_identifier("new-id", target);

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(target, "new-id");
}

TEST(UnmarshalIdentifierTest, UnsupportedTargetFails) {
    int target = 3;
    auto result = unmarshal_identifier("4", target);

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(unwrap_err(result).expected,
              (std::vector<std::string>{"UnmarshalIdentifier", "string"}));
    EXPECT_EQ(target, 3);
}

TEST(UnmarshalIdentifierTest, MarshalOnlyTypeCannotUnmarshal) {
    static_assert(!UnmarshalIdentifier<OrderKey>);

    OrderKey key{5};
    EXPECT_TRUE(is_err(unmarshal_identifier("ord-6", key)));
    EXPECT_EQ(key.value, 5u);
}

// ============================================================================
// make_identifier
// ============================================================================

TEST(MakeIdentifierTest, BuildsPlaceholder) {
    auto resource = make_identifier("orders", OrderKey{9});
    ASSERT_TRUE(is_ok(resource));
    EXPECT_EQ(unwrap(resource).type, "orders");
    EXPECT_EQ(unwrap(resource).id, "ord-9");
    EXPECT_TRUE(unwrap(resource).attributes.empty());
    EXPECT_EQ(unwrap(resource).identity(), "{Type: orders, ID: ord-9}");
}

TEST(MakeIdentifierTest, PropagatesResolverFailure) {
    auto resource = make_identifier("things", Opaque{});
    ASSERT_TRUE(is_err(resource));
    EXPECT_EQ(unwrap_err(resource).kind, ErrorKind::TypeMismatch);
}
