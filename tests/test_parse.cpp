/**
 * @file test_parse.cpp
 * @brief Tests for plain scalar typing
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "dedupe/Parse.hpp"

#include <cmath>
#include <cstdint>

using namespace dedupe;

// ============================================================================
// Null and boolean
// ============================================================================

TEST(ParseScalar, NullForms) {
    EXPECT_TRUE(parse_scalar("").is_null());
    EXPECT_TRUE(parse_scalar("~").is_null());
    EXPECT_TRUE(parse_scalar("null").is_null());
    EXPECT_TRUE(parse_scalar("NULL").is_null());
}

TEST(ParseScalar, BooleanCoreSpellings) {
    EXPECT_EQ(parse_scalar("true"), true);
    EXPECT_EQ(parse_scalar("False"), false);
    EXPECT_EQ(parse_scalar("TRUE"), true);
}

TEST(ParseScalar, MixedCaseWordsStayStrings) {
    EXPECT_EQ(parse_scalar("tRuE"), "tRuE");
    EXPECT_EQ(parse_scalar("fALSE"), "fALSE");
    EXPECT_EQ(parse_scalar("nUlL"), "nUlL");
    EXPECT_EQ(parse_scalar(".iNf"), ".iNf");
    EXPECT_TRUE(parse_scalar("Null").is_null());
    EXPECT_TRUE(std::isinf(parse_scalar(".Inf").get<double>()));
    EXPECT_TRUE(std::isnan(parse_scalar(".NaN").get<double>()));
}

TEST(ParseScalar, YamlOneOneBooleansStayStrings) {
    EXPECT_EQ(parse_scalar("yes"), "yes");
    EXPECT_EQ(parse_scalar("off"), "off");
}

// ============================================================================
// Numbers
// ============================================================================

TEST(ParseScalar, Integers) {
    EXPECT_EQ(parse_scalar("42"), 42);
    EXPECT_EQ(parse_scalar("-17"), -17);
    EXPECT_EQ(parse_scalar("+5"), 5);
    EXPECT_EQ(parse_scalar("0x1F"), 31);
    EXPECT_EQ(parse_scalar("0o17"), 15);
    EXPECT_TRUE(parse_scalar("42").is_number_integer());
}

TEST(ParseScalar, IntegerAboveInt64IsUnsigned) {
    auto v = parse_scalar("18446744073709551615");
    ASSERT_TRUE(v.is_number_unsigned());
    EXPECT_EQ(v.get<std::uint64_t>(), 18446744073709551615ULL);

    auto hex = parse_scalar("0xFFFFFFFFFFFFFFFF");
    ASSERT_TRUE(hex.is_number_unsigned());
    EXPECT_EQ(hex.get<std::uint64_t>(), 18446744073709551615ULL);
}

TEST(ParseScalar, IntegerWiderThan64BitsStaysString) {
    EXPECT_EQ(parse_scalar("123456789012345678901234567890"),
              "123456789012345678901234567890");
    EXPECT_EQ(parse_scalar("-99999999999999999999"), "-99999999999999999999");
    EXPECT_EQ(parse_scalar("0x1FFFFFFFFFFFFFFFFF"), "0x1FFFFFFFFFFFFFFFFF");
}

TEST(ParseScalar, Floats) {
    EXPECT_DOUBLE_EQ(parse_scalar("3.14").get<double>(), 3.14);
    EXPECT_DOUBLE_EQ(parse_scalar("-2.5e10").get<double>(), -2.5e10);
    EXPECT_DOUBLE_EQ(parse_scalar(".5").get<double>(), 0.5);
    EXPECT_TRUE(parse_scalar("1.0").is_number_float());
}

TEST(ParseScalar, SpecialFloats) {
    EXPECT_TRUE(std::isinf(parse_scalar(".inf").get<double>()));
    EXPECT_LT(parse_scalar("-.inf").get<double>(), 0.0);
    EXPECT_TRUE(std::isnan(parse_scalar(".nan").get<double>()));
}

// ============================================================================
// Strings
// ============================================================================

TEST(ParseScalar, RawStrings) {
    EXPECT_EQ(parse_scalar("hello"), "hello");
    EXPECT_EQ(parse_scalar("1.2.3"), "1.2.3");
    EXPECT_EQ(parse_scalar("v1"), "v1");
    EXPECT_EQ(parse_scalar("12abc"), "12abc");
}
