/**
 * @file ReportJsonTest.cpp
 * @brief Tests for report snapshot payloads
 */

#include <gtest/gtest.h>
#include "domain/ReportJson.hpp"

using namespace bookkeeping::domain;

TEST(ReportJsonTest, BalanceSheet_RestoresAmountsExactly) {
    BalanceSheet sheet;
    sheet.reportDate = Date(2025, 10, 31);
    ReportLine cash;
    cash.accountId = "a1";
    cash.code = "1001";
    cash.name = "Cash";
    cash.value = Decimal::fromString("1234.50");
    cash.accountType = "CASH";
    sheet.assets.push_back(cash);
    sheet.assetTotal = Decimal::fromString("1234.50");
    sheet.totalLiabilityEquity = Decimal::fromString("1234.50");
    sheet.isBalanced = true;

    auto restored = balanceSheetFromJson(nlohmann::json::parse(toJson(sheet).dump()));

    EXPECT_EQ(restored.reportDate, sheet.reportDate);
    ASSERT_EQ(restored.assets.size(), 1u);
    EXPECT_EQ(restored.assets[0].value.toString(), "1234.50");
    EXPECT_FALSE(restored.assets[0].parentId.has_value());
    EXPECT_TRUE(restored.isBalanced);
}

TEST(ReportJsonTest, Cashflow_SectionsKeepDirection) {
    CashflowStatement statement;
    statement.startDate = Date(2025, 10, 1);
    statement.endDate = Date(2025, 10, 31);
    CashflowLine line;
    line.cashflowTypeId = 3;
    line.categoryName = "Rent";
    line.direction = CashflowDirection::OUTFLOW;
    line.amount = Decimal::fromString("50.00");
    statement.operating.items.push_back(line);
    statement.operating.outflow = line.amount;
    statement.operating.net = -line.amount;
    statement.totalNet = -line.amount;

    auto json = toJson(statement);
    EXPECT_EQ(json["operating"]["item_list"][0]["direction"], "OUTFLOW");

    auto restored = cashflowStatementFromJson(json);
    ASSERT_EQ(restored.operating.items.size(), 1u);
    EXPECT_EQ(restored.operating.items[0].direction, CashflowDirection::OUTFLOW);
    EXPECT_EQ(restored.totalNet, Decimal::fromString("-50"));
}

TEST(ReportJsonTest, CorruptedPayload_Throws) {
    auto json = nlohmann::json::parse(R"({"start_date": "2025-10-01"})");
    EXPECT_THROW(incomeStatementFromJson(json), nlohmann::json::exception);
}
