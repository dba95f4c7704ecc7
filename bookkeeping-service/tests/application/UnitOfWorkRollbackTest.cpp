/**
 * @file UnitOfWorkRollbackTest.cpp
 * @brief Storage failures in the middle of a posting must leave the ledger untouched
 */

#include "LedgerTestBase.hpp"
#include "../mocks/MockUnitOfWork.hpp"
#include "application/FixedExpenseService.hpp"

using namespace bookkeeping;
using namespace bookkeeping::tests;
using ::testing::_;
using ::testing::DoDefault;
using ::testing::NiceMock;
using ::testing::Throw;

class UnitOfWorkRollbackTest : public LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        cash_ = createAccount("Cash", "CASH", true);
        capital_ = createAccount("Capital", "EQUITY");
        rent_ = createAccount("Rent", "EXPENSE");
    }

    /**
     * @brief Фабрика, оборачивающая каждый Unit of Work в mock; configure вызывается для каждого
     */
    std::shared_ptr<ScriptedUnitOfWorkFactory> mockedFactory(std::function<void(MockUnitOfWork&)> configure) {
        auto real = uowFactory_;
        return std::make_shared<ScriptedUnitOfWorkFactory>([real, configure]() {
            auto uow = std::make_unique<NiceMock<MockUnitOfWork>>(real->begin());
            configure(*uow);
            return std::unique_ptr<ports::output::IUnitOfWork>(std::move(uow));
        });
    }

    std::string cash_;
    std::string capital_;
    std::string rent_;
};

TEST_F(UnitOfWorkRollbackTest, BalanceUpdateFails_TransactionAndBalancesRolledBack) {
    auto factory = mockedFactory([](MockUnitOfWork& uow) {
        EXPECT_CALL(uow.mockAccounts(), applyBalanceDelta(_, _, _))
            .WillOnce(DoDefault())
            .WillOnce(Throw(std::runtime_error("connection lost")));
        EXPECT_CALL(uow, commit()).Times(0);
        EXPECT_CALL(uow, rollback()).Times(1);
    });
    application::LedgerService ledger(factory);

    EXPECT_THROW(ledger.postTransaction(transaction(domain::Date(2025, 3, 1),
                     {split(cash_, "100"), split(capital_, "-100")})),
                 std::runtime_error);

    EXPECT_EQ(factory->beginCount(), 1);
    EXPECT_EQ(store_->transactionCount(), 0u);
    EXPECT_TRUE(balanceOf(cash_).isZero());
    EXPECT_TRUE(balanceOf(capital_).isZero());
}

TEST_F(UnitOfWorkRollbackTest, CommitFails_NothingPublished) {
    auto factory = mockedFactory([](MockUnitOfWork& uow) {
        EXPECT_CALL(uow, commit()).WillOnce(Throw(std::runtime_error("serialization failure")));
        EXPECT_CALL(uow, rollback()).Times(1);
    });
    application::LedgerService ledger(factory);

    EXPECT_THROW(ledger.postTransaction(transaction(domain::Date(2025, 3, 1),
                     {split(cash_, "100"), split(capital_, "-100")})),
                 std::runtime_error);

    EXPECT_EQ(store_->transactionCount(), 0u);
    EXPECT_TRUE(balanceOf(cash_).isZero());
}

TEST_F(UnitOfWorkRollbackTest, UpdateFailsHalfway_OriginalTransactionKept) {
    auto original = ledgerService_->postTransaction(transaction(domain::Date(2025, 3, 1),
        {split(cash_, "100"), split(capital_, "-100")}));

    auto factory = mockedFactory([](MockUnitOfWork& uow) {
        EXPECT_CALL(uow.mockAccounts(), applyBalanceDelta(_, _, _))
            .WillOnce(DoDefault())
            .WillOnce(DoDefault())
            .WillOnce(Throw(std::runtime_error("connection lost")));
        EXPECT_CALL(uow, rollback()).Times(1);
    });
    application::LedgerService ledger(factory);

    EXPECT_THROW(ledger.updateTransaction(original.id, transaction(domain::Date(2025, 3, 2),
                     {split(cash_, "250"), split(capital_, "-250")})),
                 std::runtime_error);

    auto kept = storedTransaction(original.id);
    EXPECT_EQ(kept.postDate, domain::Date(2025, 3, 1));
    EXPECT_EQ(balanceOf(cash_), d("100"));
    EXPECT_EQ(balanceOf(capital_), d("-100"));
    expectBalancesMatchSplits();
}

TEST_F(UnitOfWorkRollbackTest, FixedExpenseChargeFails_MonthNotMarkedAsRun) {
    ledgerService_->postTransaction(transaction(domain::Date(2025, 1, 1),
        {split(cash_, "1000"), split(capital_, "-1000")}));

    application::FixedExpenseService setup(uowFactory_);
    domain::FixedExpenseRequest request;
    request.name = "Office rent";
    request.amount = d("300");
    request.expenseAccountId = rent_;
    request.primaryAccountId = cash_;
    request.dayOfMonth = 1;
    auto expense = setup.createFixedExpense(request);

    auto factory = mockedFactory([](MockUnitOfWork& uow) {
        ON_CALL(uow.mockAccounts(), applyBalanceDelta(_, _, _))
            .WillByDefault(Throw(std::runtime_error("connection lost")));
    });
    application::FixedExpenseService failing(factory);

    auto results = failing.executeAllDue(domain::Date(2025, 3, 5));

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].executed());
    ASSERT_EQ(results[0].warnings.size(), 1u);
    EXPECT_EQ(results[0].warnings[0], "Charge failed: connection lost");

    auto stored = setup.getFixedExpense(expense.id);
    EXPECT_FALSE(stored.lastRunMonth.has_value());
    EXPECT_EQ(balanceOf(cash_), d("1000"));
    EXPECT_EQ(store_->transactionCount(), 1u);
}
