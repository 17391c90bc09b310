/**
 * @file test_quantity.cpp
 * @brief Unit tests for resource quantity parsing and integer conversion.
 */

#include "core/quantity.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace kube_device;

namespace {

int64_t value_of(std::string_view text) {
    auto q = Quantity::parse(text);
    EXPECT_TRUE(q.has_value()) << text;
    return q ? q->value() : 0;
}

}  // namespace

TEST(QuantityTest, PlainIntegers) {
    EXPECT_EQ(value_of("0"), 0);
    EXPECT_EQ(value_of("2"), 2);
    EXPECT_EQ(value_of("+7"), 7);
    EXPECT_EQ(value_of("-3"), -3);
}

TEST(QuantityTest, DecimalSuffixes) {
    EXPECT_EQ(value_of("1k"), 1000);
    EXPECT_EQ(value_of("1.5k"), 1500);
    EXPECT_EQ(value_of("2M"), 2000000);
    EXPECT_EQ(value_of("3G"), 3000000000);
}

TEST(QuantityTest, BinarySuffixes) {
    EXPECT_EQ(value_of("1Ki"), 1024);
    EXPECT_EQ(value_of("16Gi"), int64_t{16} << 30);
    EXPECT_EQ(value_of("1Ti"), int64_t{1} << 40);
}

TEST(QuantityTest, Exponents) {
    EXPECT_EQ(value_of("1e3"), 1000);
    EXPECT_EQ(value_of("5E2"), 500);
    EXPECT_EQ(value_of("12e-1"), 2);
}

TEST(QuantityTest, FractionsRoundAwayFromZero) {
    EXPECT_EQ(value_of("500m"), 1);
    EXPECT_EQ(value_of("1500m"), 2);
    EXPECT_EQ(value_of("2000m"), 2);
    EXPECT_EQ(value_of("0.1"), 1);
    EXPECT_EQ(value_of("-500m"), -1);
    EXPECT_EQ(value_of("1n"), 1);
}

TEST(QuantityTest, SaturatesAtInt64Range) {
    EXPECT_EQ(value_of("100E"), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(value_of("-100E"), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(value_of("8Ei"), std::numeric_limits<int64_t>::max());
}

TEST(QuantityTest, KeepsOriginalSpelling) {
    auto q = Quantity::parse("16Gi");
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->string(), "16Gi");

    auto a = Quantity::parse("1000m");
    auto b = Quantity::parse("1");
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->value(), b->value());
    EXPECT_FALSE(*a == *b);
}

TEST(QuantityTest, FromInt) {
    auto q = Quantity::from_int(-7);
    EXPECT_EQ(q.value(), -7);
    EXPECT_EQ(q.string(), "-7");

    auto min = Quantity::from_int(std::numeric_limits<int64_t>::min());
    EXPECT_EQ(min.value(), std::numeric_limits<int64_t>::min());
}

TEST(QuantityTest, DefaultIsZero) {
    Quantity q;
    EXPECT_EQ(q.value(), 0);
    EXPECT_EQ(q.string(), "0");
}

TEST(QuantityTest, RejectsMalformed) {
    for (std::string_view text : {"", "abc", "5x", "1e", "1.2.3", "-", "Gi", "1ee3"}) {
        auto q = Quantity::parse(text);
        ASSERT_FALSE(q.has_value()) << text;
        EXPECT_EQ(q.error().code, ErrorCode::Invalid);
    }
}

TEST(QuantityTest, MantissaBeyondUint64Saturates) {
    EXPECT_EQ(value_of("18446744073709551615"), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(value_of("18446744073709551619"), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(value_of("-18446744073709551619"), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(value_of("9223372036854775807"), std::numeric_limits<int64_t>::max());
}

TEST(QuantityTest, DigitsPastPrecisionKeepMagnitude) {
    EXPECT_EQ(value_of("30000000000000000000000e-21"), 30);
}

TEST(QuantityTest, FractionalBinaryQuantities) {
    EXPECT_EQ(value_of("1.5Ki"), 1536);
    EXPECT_EQ(value_of("0.5Ki"), 512);
    EXPECT_EQ(value_of("0.001Ki"), 2);
}

TEST(QuantityTest, ExtremeExponents) {
    EXPECT_EQ(value_of("1e1000"), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(value_of("1e-1000"), 1);
    EXPECT_EQ(value_of("0e1000"), 0);
    EXPECT_EQ(value_of("1e-25"), 1);

    for (std::string_view text : {"1e1001", "1e-1001", "1e2147483647", "1e-2147483648",
                                  "1e99999999999"}) {
        auto q = Quantity::parse(text);
        ASSERT_FALSE(q.has_value()) << text;
        EXPECT_EQ(q.error().code, ErrorCode::Invalid) << text;
    }
}
