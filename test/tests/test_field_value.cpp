#include <gtest/gtest.h>
#include "stencil_log.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

using stencil::FieldMap;
using stencil::FieldValue;

TEST(FieldValueTest, KindFollowsConstructorArgument) {
    EXPECT_EQ(FieldValue().kind(), FieldValue::Kind::Null);
    EXPECT_EQ(FieldValue(nullptr).kind(), FieldValue::Kind::Null);
    EXPECT_EQ(FieldValue(true).kind(), FieldValue::Kind::Bool);
    EXPECT_EQ(FieldValue(42).kind(), FieldValue::Kind::Integer);
    EXPECT_EQ(FieldValue(42ULL).kind(), FieldValue::Kind::Integer);
    EXPECT_EQ(FieldValue(2.5).kind(), FieldValue::Kind::Float);
    EXPECT_EQ(FieldValue(2.5f).kind(), FieldValue::Kind::Float);
    EXPECT_EQ(FieldValue("text").kind(), FieldValue::Kind::String);
    EXPECT_EQ(FieldValue(std::string("text")).kind(), FieldValue::Kind::String);
    EXPECT_EQ(FieldValue(FieldMap{{"a", 1}}).kind(), FieldValue::Kind::Map);
}

TEST(FieldValueTest, NullCharPointerIsNull) {
    const char *nothing = nullptr;
    EXPECT_TRUE(FieldValue(nothing).isNull());
}

TEST(FieldValueTest, ScalarToString) {
    EXPECT_EQ(FieldValue("us-east").toString(), "us-east");
    EXPECT_EQ(FieldValue(42).toString(), "42");
    EXPECT_EQ(FieldValue(-7).toString(), "-7");
    EXPECT_EQ(FieldValue(true).toString(), "true");
    EXPECT_EQ(FieldValue(false).toString(), "false");
    EXPECT_EQ(FieldValue(nullptr).toString(), "<nil>");
}

TEST(FieldValueTest, FloatToStringIsShortest) {
    EXPECT_EQ(FieldValue(3.14).toString(), "3.14");
    EXPECT_EQ(FieldValue(0.5).toString(), "0.5");
    EXPECT_EQ(FieldValue(100.0).toString(), "100");
    EXPECT_EQ(FieldValue(123456.0).toString(), "123456");
    EXPECT_EQ(FieldValue(1e6).toString(), "1e+06");
    EXPECT_EQ(FieldValue(1e21).toString(), "1e+21");
    EXPECT_EQ(FieldValue(0.001).toString(), "0.001");
    EXPECT_EQ(FieldValue(1e-5).toString(), "1e-05");
    EXPECT_EQ(FieldValue(0.1 + 0.2).toString(), "0.30000000000000004");
    EXPECT_EQ(FieldValue(0.0).toString(), "0");
}

TEST(FieldValueTest, NonFiniteFloatToString) {
    EXPECT_EQ(FieldValue(std::numeric_limits<double>::quiet_NaN()).toString(), "NaN");
    EXPECT_EQ(FieldValue(std::numeric_limits<double>::infinity()).toString(), "+Inf");
    EXPECT_EQ(FieldValue(-std::numeric_limits<double>::infinity()).toString(), "-Inf");
}

TEST(FieldValueTest, MapToStringSortsKeys) {
    FieldValue value(FieldMap{{"b", "x"}, {"a", 1}});
    EXPECT_EQ(value.toString(), "map[a:1 b:x]");

    FieldValue nested(FieldMap{{"outer", FieldMap{{"inner", true}}}});
    EXPECT_EQ(nested.toString(), "map[outer:map[inner:true]]");

    EXPECT_EQ(FieldValue(FieldMap()).toString(), "map[]");
}

TEST(FieldValueTest, AccessorsReturnStoredValue) {
    EXPECT_TRUE(FieldValue(true).asBool());
    EXPECT_EQ(FieldValue(-3).asInteger(), -3);
    EXPECT_DOUBLE_EQ(FieldValue(2.5).asFloat(), 2.5);
    EXPECT_EQ(FieldValue("abc").asString(), "abc");

    FieldValue map(FieldMap{{"a", 1}});
    ASSERT_EQ(map.asMap().size(), 1u);
    EXPECT_EQ(map.asMap().at("a").asInteger(), 1);
}

TEST(FieldValueTest, WrongAccessorThrows) {
    EXPECT_THROW(FieldValue(1).asString(), std::logic_error);
    EXPECT_THROW(FieldValue("1").asInteger(), std::logic_error);
    EXPECT_THROW(FieldValue(1.0).asBool(), std::logic_error);
    EXPECT_THROW(FieldValue().asMap(), std::logic_error);
}

TEST(FieldValueTest, StructuralEquality) {
    EXPECT_EQ(FieldValue(1), FieldValue(1L));
    EXPECT_NE(FieldValue(1), FieldValue(1.0));
    EXPECT_NE(FieldValue("1"), FieldValue(1));
    EXPECT_EQ(FieldValue(FieldMap{{"a", 1}}), FieldValue(FieldMap{{"a", 1}}));
    EXPECT_NE(FieldValue(FieldMap{{"a", 1}}), FieldValue(FieldMap{{"a", 2}}));
}

TEST(FieldValueTest, LargeUnsignedKeepsItsValue) {
    const std::uint64_t maxU64 = std::numeric_limits<std::uint64_t>::max();
    FieldValue big(maxU64);
    EXPECT_EQ(big.kind(), FieldValue::Kind::Unsigned);
    EXPECT_EQ(big.asUnsigned(), maxU64);
    EXPECT_EQ(big.toString(), "18446744073709551615");
    EXPECT_THROW(big.asInteger(), std::logic_error);

    FieldValue edge(static_cast<std::uint64_t>(std::numeric_limits<long long>::max()) + 1);
    EXPECT_EQ(edge.kind(), FieldValue::Kind::Unsigned);
    EXPECT_EQ(edge.toString(), "9223372036854775808");
}

TEST(FieldValueTest, SmallUnsignedStoredAsInteger) {
    FieldValue small(std::numeric_limits<long long>::max() + 0ULL);
    EXPECT_EQ(small.kind(), FieldValue::Kind::Integer);
    EXPECT_EQ(small.asInteger(), std::numeric_limits<long long>::max());
    EXPECT_EQ(FieldValue(5u), FieldValue(5));
    EXPECT_THROW(FieldValue(5u).asUnsigned(), std::logic_error);
}

TEST(FieldValueTest, CopiesShareNestedMap) {
    FieldValue original(FieldMap{{"a", 1}});
    FieldValue copy = original;
    EXPECT_EQ(&original.asMap(), &copy.asMap());
}
