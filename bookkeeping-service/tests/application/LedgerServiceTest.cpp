/**
 * @file LedgerServiceTest.cpp
 * @brief Unit tests for LedgerService (posting, update, delete)
 */

#include "LedgerTestBase.hpp"

using namespace bookkeeping;
using namespace bookkeeping::tests;

class LedgerServiceTest : public LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        cash_ = createAccount("Cash", "CASH");
        bank_ = createAccount("Bank", "BANK");
        sales_ = createAccount("Sales", "INCOME");
        rent_ = createAccount("Rent", "EXPENSE");
    }

    std::string cash_;
    std::string bank_;
    std::string sales_;
    std::string rent_;
    const domain::Date today_{2025, 11, 20};
};

// ============================================================================
// POST
// ============================================================================

TEST_F(LedgerServiceTest, Post_UpdatesBalances) {
    auto posted = ledgerService_->postTransaction(
        transaction(today_, {split(cash_, "100.00"), split(sales_, "-100.00")}));

    EXPECT_EQ(posted.id.size(), 32u);
    ASSERT_EQ(posted.splits.size(), 2u);
    EXPECT_EQ(balanceOf(cash_), d("100"));
    EXPECT_EQ(balanceOf(sales_), d("-100"));
    expectBalancesMatchSplits();
}

TEST_F(LedgerServiceTest, Post_StoresAmountAsFraction) {
    auto posted = ledgerService_->postTransaction(
        transaction(today_, {split(cash_, "12.345"), split(sales_, "-12.345")}));

    auto stored = storedTransaction(posted.id);
    EXPECT_EQ(stored.splits[0].valueDenom, 1000);
    EXPECT_EQ(stored.splits[0].amount().abs(), d("12.345"));
    EXPECT_EQ(stored.splits[0].reconcileState, domain::reconcile::NEW);
}

TEST_F(LedgerServiceTest, Get_Missing_ReturnsNullopt) {
    ledgerService_->postTransaction(transaction(today_, {split(cash_, "5"), split(sales_, "-5")}));
    EXPECT_FALSE(ledgerService_->getTransaction("no-such-transaction").has_value());
}

TEST_F(LedgerServiceTest, Post_SameAccountTwice_AggregatesDelta) {
    ledgerService_->postTransaction(transaction(today_, {
        split(cash_, "30"), split(cash_, "20"), split(sales_, "-50")}));

    EXPECT_EQ(balanceOf(cash_), d("50"));
    expectBalancesMatchSplits();
}

TEST_F(LedgerServiceTest, Post_MultiSplit_BalanceLaw) {
    ledgerService_->postTransaction(transaction(today_, {
        split(cash_, "70"), split(bank_, "30"), split(sales_, "-100")}));
    ledgerService_->postTransaction(transaction(today_, {
        split(rent_, "45.50"), split(bank_, "-45.50")}));

    domain::Decimal total;
    for (const auto& account : accountService_->listAccounts(true)) {
        total += account.currentBalance;
    }
    EXPECT_TRUE(total.isZero());
    EXPECT_EQ(balanceOf(bank_), d("-15.50"));
}

TEST_F(LedgerServiceTest, Post_Unbalanced_Rejected) {
    try {
        ledgerService_->postTransaction(transaction(today_, {split(cash_, "100"), split(sales_, "-99.99")}));
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("not balanced"), std::string::npos);
    }

    EXPECT_EQ(store_->transactionCount(), 0u);
    EXPECT_TRUE(balanceOf(cash_).isZero());
}

TEST_F(LedgerServiceTest, Post_BalancedAfterStorageRounding_Accepted) {
    ledgerService_->postTransaction(transaction(today_, {
        split(cash_, "0.3333333"), split(sales_, "-0.3333333")}));

    EXPECT_EQ(balanceOf(cash_), d("0.333333"));
}

TEST_F(LedgerServiceTest, Post_SingleSplit_Rejected) {
    EXPECT_THROW(ledgerService_->postTransaction(transaction(today_, {split(cash_, "0")})), ValidationError);
}

TEST_F(LedgerServiceTest, Post_UnknownAccount_Rejected) {
    try {
        ledgerService_->postTransaction(transaction(today_, {split(cash_, "10"), split("missing", "-10")}));
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("missing"), std::string::npos);
    }
    EXPECT_TRUE(balanceOf(cash_).isZero());
}

// ============================================================================
// UPDATE
// ============================================================================

TEST_F(LedgerServiceTest, Update_ReplacesSplitsAndMovesBalances) {
    auto posted = ledgerService_->postTransaction(
        transaction(today_, {split(cash_, "100"), split(sales_, "-100")}));

    auto updated = ledgerService_->updateTransaction(posted.id,
        transaction(today_, {split(bank_, "80"), split(sales_, "-80")}, "corrected"));

    EXPECT_EQ(updated.id, posted.id);
    EXPECT_EQ(updated.createdAt, posted.createdAt);
    EXPECT_EQ(updated.description, "corrected");
    EXPECT_TRUE(balanceOf(cash_).isZero());
    EXPECT_EQ(balanceOf(bank_), d("80"));
    EXPECT_EQ(balanceOf(sales_), d("-80"));
    EXPECT_EQ(store_->transactionCount(), 1u);
    expectBalancesMatchSplits();
}

TEST_F(LedgerServiceTest, Update_InvalidSplits_LeavesOriginal) {
    auto posted = ledgerService_->postTransaction(
        transaction(today_, {split(cash_, "100"), split(sales_, "-100")}));

    EXPECT_THROW(ledgerService_->updateTransaction(posted.id,
        transaction(today_, {split(bank_, "80"), split(sales_, "-70")})), ValidationError);

    EXPECT_EQ(balanceOf(cash_), d("100"));
    EXPECT_TRUE(balanceOf(bank_).isZero());
    EXPECT_EQ(storedTransaction(posted.id).splits[0].accountId, posted.splits[0].accountId);
}

TEST_F(LedgerServiceTest, Update_Missing_NotFound) {
    EXPECT_THROW(ledgerService_->updateTransaction("nope",
        transaction(today_, {split(cash_, "1"), split(sales_, "-1")})), NotFoundError);
}

// ============================================================================
// DELETE
// ============================================================================

TEST_F(LedgerServiceTest, Delete_RevertsBalances) {
    auto first = ledgerService_->postTransaction(
        transaction(today_, {split(cash_, "100"), split(sales_, "-100")}));
    ledgerService_->postTransaction(transaction(today_, {split(rent_, "40"), split(cash_, "-40")}));

    ledgerService_->deleteTransaction(first.id);

    EXPECT_EQ(balanceOf(cash_), d("-40"));
    EXPECT_TRUE(balanceOf(sales_).isZero());
    EXPECT_FALSE(ledgerService_->getTransaction(first.id).has_value());
    expectBalancesMatchSplits();
}

TEST_F(LedgerServiceTest, Delete_Missing_NotFound) {
    EXPECT_THROW(ledgerService_->deleteTransaction("nope"), NotFoundError);
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(LedgerServiceTest, ListTransactions_NewestPostDateFirst) {
    ledgerService_->postTransaction(transaction(domain::Date(2025, 1, 5),
        {split(cash_, "1"), split(sales_, "-1")}, "old"));
    ledgerService_->postTransaction(transaction(domain::Date(2025, 3, 5),
        {split(cash_, "1"), split(sales_, "-1")}, "new"));

    auto transactions = ledgerService_->listTransactions(10);
    ASSERT_EQ(transactions.size(), 2u);
    EXPECT_EQ(transactions[0].description, "new");

    EXPECT_EQ(ledgerService_->listTransactions(1).size(), 1u);
}

TEST_F(LedgerServiceTest, ListTransactionDetails_DenormalizesNames) {
    auto typeId = createCashflowType("OP-IN", domain::FlowType::OPERATING, domain::CashflowDirection::INFLOW);
    auto posted = ledgerService_->postTransaction(
        transaction(today_, {split(cash_, "10", typeId), split(sales_, "-10")}));

    auto lines = ledgerService_->listTransactionDetails(posted.id, 100);
    ASSERT_EQ(lines.size(), 2u);

    auto cashLine = lines[0].accountId == cash_ ? lines[0] : lines[1];
    EXPECT_EQ(cashLine.accountName, "Cash");
    EXPECT_EQ(cashLine.cashflowTypeName, "OP-IN name");
    EXPECT_EQ(cashLine.amount, d("10"));
}
