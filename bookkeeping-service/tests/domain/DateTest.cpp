/**
 * @file DateTest.cpp
 * @brief Unit tests for Date
 */

#include <gtest/gtest.h>
#include "domain/Date.hpp"

using namespace bookkeeping::domain;

TEST(DateTest, FromString_ParsesIso) {
    auto date = Date::fromString("2025-11-20");
    EXPECT_EQ(date.year(), 2025);
    EXPECT_EQ(date.month(), 11u);
    EXPECT_EQ(date.day(), 20u);
    EXPECT_EQ(date.toString(), "2025-11-20");
}

TEST(DateTest, FromString_Invalid_Throws) {
    EXPECT_THROW(Date::fromString("2025/11/20"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2025-02-30"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2025-11-20x"), std::invalid_argument);
}

TEST(DateTest, DaysInMonth_HandlesLeapYears) {
    EXPECT_EQ(Date(2024, 2, 10).daysInMonth(), 29u);
    EXPECT_EQ(Date(2025, 2, 10).daysInMonth(), 28u);
    EXPECT_EQ(Date(2025, 4, 1).daysInMonth(), 30u);
}

TEST(DateTest, PreviousMonth_CrossesYear) {
    EXPECT_EQ(Date(2026, 1, 15).previousMonth(), Date(2025, 12, 1));
    EXPECT_EQ(Date(2025, 3, 31).previousMonth(), Date(2025, 2, 1));
}

TEST(DateTest, MonthBoundaries) {
    Date date(2025, 2, 14);
    EXPECT_EQ(date.firstDayOfMonth(), Date(2025, 2, 1));
    EXPECT_EQ(date.lastDayOfMonth(), Date(2025, 2, 28));
}

TEST(DateTest, Formats) {
    Date date(2025, 3, 7);
    EXPECT_EQ(date.toCompactString(), "20250307");
    EXPECT_EQ(date.toMonthString(), "2025-03");
}

TEST(DateTest, AddDays_And_Ordering) {
    Date date(2025, 12, 31);
    EXPECT_EQ(date.addDays(1), Date(2026, 1, 1));
    EXPECT_LT(date, date.addDays(1));
    EXPECT_GE(date, date.addDays(-1));
}
