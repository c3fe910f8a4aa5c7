/**
 * @file test_parse.cpp
 * @brief Unit tests for number literal classification
 *
 * Tests cover:
 * - Decimal integers, underscores and signs
 * - Hexadecimal, octal and binary prefixes
 * - Floats, exponents, infinities and NaN
 * - Integers beyond 64 bits
 * - Rejected literals
 */

#include <gtest/gtest.h>
#include "gura/Parse.hpp"

#include <cmath>
#include <limits>

using namespace gura;

namespace {

Value number_of(const std::string& literal) {
    auto value = parse_number(literal);
    if (!value) {
        ADD_FAILURE() << "Not a number: " << literal;
        return Value();
    }
    return *value;
}

} // namespace

// ============================================================================
// Integer Parsing
// ============================================================================

TEST(ParseInteger, Decimal) {
    EXPECT_EQ(number_of("42").as_integer(), 42);
    EXPECT_EQ(number_of("0").as_integer(), 0);
    EXPECT_EQ(number_of("-17").as_integer(), -17);
    EXPECT_EQ(number_of("+5").as_integer(), 5);
    EXPECT_EQ(number_of("-0").as_integer(), 0);
}

TEST(ParseInteger, Underscores) {
    EXPECT_EQ(number_of("1_000").as_integer(), 1000);
    EXPECT_EQ(number_of("5_349_221").as_integer(), 5349221);
    EXPECT_EQ(number_of("1_2_3_4_5").as_integer(), 12345);
}

TEST(ParseInteger, Int64Bounds) {
    EXPECT_EQ(number_of("9223372036854775807").as_integer(),
              std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(number_of("-9223372036854775808").as_integer(),
              std::numeric_limits<std::int64_t>::min());
}

TEST(ParseInteger, Prefixed) {
    EXPECT_EQ(number_of("0xDEADBEEF").as_integer(), 3735928559);
    EXPECT_EQ(number_of("0xdead_beef").as_integer(), 3735928559);
    EXPECT_EQ(number_of("0o01234567").as_integer(), 342391);
    EXPECT_EQ(number_of("0o755").as_integer(), 493);
    EXPECT_EQ(number_of("0b11010110").as_integer(), 214);
}

TEST(ParseInteger, PrefixedRejects) {
    EXPECT_FALSE(parse_number("0x").has_value());
    EXPECT_FALSE(parse_number("0b102").has_value());
    EXPECT_FALSE(parse_number("0o8").has_value());
    EXPECT_FALSE(parse_number("0xG1").has_value());
    EXPECT_FALSE(parse_number("0xFFFFFFFFFFFFFFFF").has_value());
}

// ============================================================================
// Big integers
// ============================================================================

TEST(ParseBigInteger, BeyondInt64) {
    Value v = number_of("99999999999999999999");
    ASSERT_TRUE(v.is_big_integer());
    EXPECT_EQ(to_string(v.as_big_integer()), "99999999999999999999");

    Value neg = number_of("-9223372036854775809");
    ASSERT_TRUE(neg.is_big_integer());
    EXPECT_EQ(to_string(neg.as_big_integer()), "-9223372036854775809");
}

TEST(ParseBigInteger, Int128Bounds) {
    Value min = number_of("-170141183460469231731687303715884105728");
    ASSERT_TRUE(min.is_big_integer());
    EXPECT_EQ(to_string(min.as_big_integer()), "-170141183460469231731687303715884105728");

    Value max = number_of("170141183460469231731687303715884105727");
    ASSERT_TRUE(max.is_big_integer());
    EXPECT_EQ(to_string(max.as_big_integer()), "170141183460469231731687303715884105727");

    EXPECT_FALSE(parse_number("170141183460469231731687303715884105728").has_value());
    EXPECT_FALSE(parse_number("-1701411834604692317316873037158841057280").has_value());
}

// ============================================================================
// Float Parsing
// ============================================================================

TEST(ParseFloat, SimpleFloats) {
    EXPECT_DOUBLE_EQ(number_of("3.14").as_float(), 3.14);
    EXPECT_DOUBLE_EQ(number_of("-0.01").as_float(), -0.01);
    EXPECT_DOUBLE_EQ(number_of("+1.0").as_float(), 1.0);
    EXPECT_DOUBLE_EQ(number_of(".5").as_float(), 0.5);
    EXPECT_DOUBLE_EQ(number_of("1.").as_float(), 1.0);
}

TEST(ParseFloat, Exponents) {
    EXPECT_DOUBLE_EQ(number_of("5e+22").as_float(), 5e+22);
    EXPECT_DOUBLE_EQ(number_of("1e06").as_float(), 1e06);
    EXPECT_DOUBLE_EQ(number_of("-2E-2").as_float(), -2E-2);
    EXPECT_DOUBLE_EQ(number_of("6.626e-34").as_float(), 6.626e-34);
    EXPECT_DOUBLE_EQ(number_of("224_617.445_991").as_float(), 224617.445991);
}

TEST(ParseFloat, ExponentMakesFloat) {
    EXPECT_TRUE(number_of("1e10").is_float());
    EXPECT_TRUE(number_of("1.0").is_float());
    EXPECT_TRUE(number_of("10").is_integer());
}

TEST(ParseFloat, OverflowSaturates) {
    EXPECT_TRUE(std::isinf(number_of("1e400").as_float()));
}

TEST(ParseFloat, InfinityAndNan) {
    EXPECT_EQ(number_of("inf").as_float(), std::numeric_limits<double>::infinity());
    EXPECT_EQ(number_of("+inf").as_float(), std::numeric_limits<double>::infinity());
    EXPECT_EQ(number_of("-inf").as_float(), -std::numeric_limits<double>::infinity());
    EXPECT_TRUE(std::isnan(number_of("nan").as_float()));
    EXPECT_TRUE(std::isnan(number_of("+nan").as_float()));
    EXPECT_TRUE(std::isnan(number_of("-nan").as_float()));
}

// ============================================================================
// Rejected literals
// ============================================================================

TEST(ParseInvalid, Malformed) {
    EXPECT_FALSE(parse_number("").has_value());
    EXPECT_FALSE(parse_number("_").has_value());
    EXPECT_FALSE(parse_number("1.2.3").has_value());
    EXPECT_FALSE(parse_number("--1").has_value());
    EXPECT_FALSE(parse_number("1-2").has_value());
    EXPECT_FALSE(parse_number("e").has_value());
    EXPECT_FALSE(parse_number("1e").has_value());
    EXPECT_FALSE(parse_number("abc").has_value());
}

TEST(ParseInvalid, InfAndNanMustBeWhole) {
    EXPECT_FALSE(parse_number("infinity").has_value());
    EXPECT_FALSE(parse_number("inf1").has_value());
    EXPECT_FALSE(parse_number("nana").has_value());
}
