/**
 * @file MonthlyReportServiceTest.cpp
 * @brief Unit tests for MonthlyReportService (snapshot cache and retention)
 */

#include "LedgerTestBase.hpp"
#include "application/MonthlyReportService.hpp"

using namespace bookkeeping;
using namespace bookkeeping::tests;

class MonthlyReportServiceTest : public LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();

        cash_ = createAccount("Cash", "CASH", true);
        capital_ = createAccount("Capital", "EQUITY");
        sales_ = createAccount("Sales", "REVENUE");
        receipts_ = createCashflowType("OP-IN-01", domain::FlowType::OPERATING,
                                       domain::CashflowDirection::INFLOW);

        ledgerService_->postTransaction(transaction(domain::Date(2025, 1, 3),
            {split(cash_, "1000"), split(capital_, "-1000")}));
        ledgerService_->postTransaction(transaction(domain::Date(2025, 2, 14),
            {split(cash_, "120", receipts_), split(sales_, "-120")}));
    }

    std::shared_ptr<application::MonthlyReportService> makeService(unsigned keepLastMonths) {
        domain::ReportRetentionPolicy retention;
        retention.keepLastMonths = keepLastMonths;
        return std::make_shared<application::MonthlyReportService>(uowFactory_, retention);
    }

    std::vector<domain::Date> cachedMonths() {
        auto uow = uowFactory_->begin();
        return uow->monthlyReports().findMonths();
    }

    std::string cash_;
    std::string capital_;
    std::string sales_;
    int64_t receipts_ = 0;
};

// ============================================================================
// CACHE
// ============================================================================

TEST_F(MonthlyReportServiceTest, FirstCall_GeneratesPreviousMonth) {
    auto service = makeService(1);

    auto snapshot = service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));

    EXPECT_FALSE(snapshot.fromCache);
    EXPECT_EQ(snapshot.month, domain::Date(2025, 2, 1));
    EXPECT_EQ(snapshot.balanceSheet.reportDate, domain::Date(2025, 2, 28));
    EXPECT_EQ(snapshot.balanceSheet.assetTotal, d("1120"));
    EXPECT_TRUE(snapshot.balanceSheet.isBalanced);
    EXPECT_EQ(snapshot.incomeStatement.startDate, domain::Date(2025, 2, 1));
    EXPECT_EQ(snapshot.incomeStatement.netIncome, d("120"));
    EXPECT_EQ(snapshot.cashflowStatement.operating.inflow, d("120"));

    auto uow = uowFactory_->begin();
    EXPECT_EQ(uow->monthlyReports().findByMonth(domain::Date(2025, 2, 1)).size(), 3u);
}

TEST_F(MonthlyReportServiceTest, SecondCall_ServedFromCache) {
    auto service = makeService(1);
    auto generated = service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));

    auto cached = service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 20));

    EXPECT_TRUE(cached.fromCache);
    EXPECT_EQ(cached.month, generated.month);
    EXPECT_EQ(cached.balanceSheet.assetTotal, generated.balanceSheet.assetTotal);
    EXPECT_EQ(cached.incomeStatement.netIncome, generated.incomeStatement.netIncome);
    EXPECT_EQ(cached.cashflowStatement.totalNet, generated.cashflowStatement.totalNet);
}

TEST_F(MonthlyReportServiceTest, CachedSnapshot_NotUpdatedByBackdatedPosting) {
    auto service = makeService(1);
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));

    ledgerService_->postTransaction(transaction(domain::Date(2025, 2, 20),
        {split(cash_, "30", receipts_), split(sales_, "-30")}));

    auto cached = service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 6));
    EXPECT_TRUE(cached.fromCache);
    EXPECT_EQ(cached.incomeStatement.netIncome, d("120"));
}

TEST_F(MonthlyReportServiceTest, CorruptedPayload_Regenerated) {
    auto service = makeService(1);
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));

    {
        std::lock_guard<std::mutex> lock(store_->mutex());
        for (auto& record : store_->state().monthlyReports) {
            record.payload = "{not json";
        }
    }

    auto snapshot = service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));

    EXPECT_FALSE(snapshot.fromCache);
    EXPECT_EQ(snapshot.incomeStatement.netIncome, d("120"));

    auto uow = uowFactory_->begin();
    EXPECT_EQ(uow->monthlyReports().findByMonth(domain::Date(2025, 2, 1)).size(), 3u);
}

TEST_F(MonthlyReportServiceTest, MissingReportType_Regenerated) {
    auto service = makeService(1);
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));

    {
        std::lock_guard<std::mutex> lock(store_->mutex());
        store_->state().monthlyReports.pop_back();
    }

    auto snapshot = service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));
    EXPECT_FALSE(snapshot.fromCache);
}

TEST_F(MonthlyReportServiceTest, JanuaryRun_ReportsDecember) {
    auto service = makeService(1);

    auto snapshot = service->getOrCreateMonthlySnapshot(domain::Date(2025, 1, 2));

    EXPECT_EQ(snapshot.month, domain::Date(2024, 12, 1));
    EXPECT_TRUE(snapshot.balanceSheet.assetTotal.isZero());
}

// ============================================================================
// RETENTION
// ============================================================================

TEST_F(MonthlyReportServiceTest, SingleSlot_NewMonthEvictsOld) {
    auto service = makeService(1);

    service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 4, 5));

    auto months = cachedMonths();
    ASSERT_EQ(months.size(), 1u);
    EXPECT_EQ(months[0], domain::Date(2025, 3, 1));
    EXPECT_EQ(service->currentCachedMonth(), domain::Date(2025, 3, 1));
}

TEST_F(MonthlyReportServiceTest, KeepTwo_OldestEvicted) {
    auto service = makeService(2);

    service->getOrCreateMonthlySnapshot(domain::Date(2025, 2, 5));
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 4, 5));

    auto months = cachedMonths();
    ASSERT_EQ(months.size(), 2u);
    EXPECT_EQ(months[0], domain::Date(2025, 3, 1));
    EXPECT_EQ(months[1], domain::Date(2025, 2, 1));
}

TEST_F(MonthlyReportServiceTest, KeepAll_NothingEvicted) {
    auto service = makeService(0);

    service->getOrCreateMonthlySnapshot(domain::Date(2025, 2, 5));
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 3, 5));
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 4, 5));

    EXPECT_EQ(cachedMonths().size(), 3u);
}

TEST_F(MonthlyReportServiceTest, BackfilledOlderMonth_KeptWithSingleSlot) {
    auto service = makeService(1);

    service->getOrCreateMonthlySnapshot(domain::Date(2025, 4, 5));
    service->getOrCreateMonthlySnapshot(domain::Date(2025, 2, 5));

    auto months = cachedMonths();
    ASSERT_EQ(months.size(), 1u);
    EXPECT_EQ(months[0], domain::Date(2025, 1, 1));
}

TEST_F(MonthlyReportServiceTest, CurrentCachedMonth_EmptyCache) {
    auto service = makeService(1);
    EXPECT_FALSE(service->currentCachedMonth().has_value());
}
