/**
 * @file DecimalTest.cpp
 * @brief Unit tests for Decimal
 */

#include <gtest/gtest.h>
#include "domain/Decimal.hpp"

using namespace bookkeeping::domain;

// ============================================================================
// PARSING
// ============================================================================

TEST(DecimalTest, FromString_KeepsScale) {
    auto value = Decimal::fromString("123.4500");
    EXPECT_EQ(value.scale(), 4u);
    EXPECT_EQ(value.toString(), "123.4500");
}

TEST(DecimalTest, FromString_Negative) {
    auto value = Decimal::fromString("-0.05");
    EXPECT_EQ(value.signum(), -1);
    EXPECT_EQ(value.toString(), "-0.05");
}

TEST(DecimalTest, FromString_LeadingZerosAreDecimal) {
    EXPECT_EQ(Decimal::fromString("0.50").toString(), "0.50");
    EXPECT_EQ(Decimal::fromString("0.08").toString(), "0.08");
    EXPECT_EQ(Decimal::fromString("0.99").toString(), "0.99");
    EXPECT_EQ(Decimal::fromString("007"), Decimal::fromInt(7));
    EXPECT_EQ(Decimal::fromString("0.3333333").toString(), "0.3333333");
}

TEST(DecimalTest, ToString_NegativeBelowOne) {
    EXPECT_EQ((Decimal::fromInt(0) - Decimal::fromString("0.09")).toString(), "-0.09");
    EXPECT_EQ(Decimal::fromString("-12.3").abs().toString(), "12.3");
}

TEST(DecimalTest, FromString_TrimsWhitespace) {
    EXPECT_EQ(Decimal::fromString("  42 ").toString(), "42");
}

TEST(DecimalTest, FromString_Invalid_Throws) {
    EXPECT_THROW(Decimal::fromString(""), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("12x"), std::invalid_argument);
}

// ============================================================================
// ARITHMETIC & COMPARISON
// ============================================================================

TEST(DecimalTest, Addition_AlignsScale) {
    auto sum = Decimal::fromString("100.10") + Decimal::fromString("0.005");
    EXPECT_EQ(sum.toString(), "100.105");
}

TEST(DecimalTest, DebitAndCredit_CancelOut) {
    auto debit = Decimal::fromString("100.10");
    auto credit = Decimal::fromString("-100.1");
    EXPECT_TRUE((debit + credit).isZero());
}

TEST(DecimalTest, Comparison_IgnoresScale) {
    EXPECT_EQ(Decimal::fromString("1.0"), Decimal::fromString("1.00"));
    EXPECT_LT(Decimal::fromString("0.99"), Decimal::fromInt(1));
    EXPECT_GT(Decimal::fromString("-0.5"), Decimal::fromInt(-1));
}

TEST(DecimalTest, Abs_And_Negate) {
    auto value = Decimal::fromString("-7.25");
    EXPECT_EQ(value.abs().toString(), "7.25");
    EXPECT_EQ((-value).toString(), "7.25");
}

// ============================================================================
// ROUNDING
// ============================================================================

TEST(DecimalTest, Rescale_RoundsHalfUp) {
    EXPECT_EQ(Decimal::fromString("1.005").rescale(2).toString(), "1.01");
    EXPECT_EQ(Decimal::fromString("1.004").rescale(2).toString(), "1.00");
    EXPECT_EQ(Decimal::fromString("-1.005").rescale(2).toString(), "-1.01");
}

TEST(DecimalTest, Rescale_Up_PadsZeros) {
    EXPECT_EQ(Decimal::fromString("3.5").rescale(3).toString(), "3.500");
}

TEST(DecimalTest, Divide_ByZero_Throws) {
    EXPECT_THROW(Decimal::divide(1, 0, 2), std::invalid_argument);
}

TEST(DecimalTest, Divide_RoundsToScale) {
    EXPECT_EQ(Decimal::divide(1, 3, 4).toString(), "0.3333");
    EXPECT_EQ(Decimal::divide(2, 3, 2).toString(), "0.67");
    EXPECT_EQ(Decimal::divide(-2, 3, 2).toString(), "-0.67");
}

TEST(DecimalTest, ToString_SmallFraction) {
    EXPECT_EQ(Decimal(Decimal::Coefficient(5), 3).toString(), "0.005");
}
