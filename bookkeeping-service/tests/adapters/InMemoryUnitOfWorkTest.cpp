/**
 * @file InMemoryUnitOfWorkTest.cpp
 * @brief Tests for the in-memory Unit of Work (commit / rollback / isolation)
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/memory/InMemoryUnitOfWork.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace bookkeeping;
using namespace bookkeeping::adapters::secondary::memory;

class InMemoryUnitOfWorkTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>();
        factory_ = std::make_shared<InMemoryUnitOfWorkFactory>(store_);
    }

    static domain::Account makeAccount(const std::string& id, const std::string& name,
                                       std::optional<std::string> code = std::nullopt) {
        domain::Account account(id, name, "ASSET");
        account.code = std::move(code);
        return account;
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<InMemoryUnitOfWorkFactory> factory_;
};

// ============================================================================
// COMMIT / ROLLBACK
// ============================================================================

TEST_F(InMemoryUnitOfWorkTest, Commit_PublishesChanges) {
    {
        auto uow = factory_->begin();
        uow->accounts().save(makeAccount("a1", "Cash"));
        uow->commit();
    }

    EXPECT_EQ(store_->snapshot().accounts.count("a1"), 1u);
}

TEST_F(InMemoryUnitOfWorkTest, Rollback_DiscardsChanges) {
    {
        auto uow = factory_->begin();
        uow->accounts().save(makeAccount("a1", "Cash"));
        uow->rollback();
    }

    EXPECT_TRUE(store_->snapshot().accounts.empty());
}

TEST_F(InMemoryUnitOfWorkTest, Destructor_WithoutCommit_RollsBack) {
    {
        auto uow = factory_->begin();
        uow->accounts().save(makeAccount("a1", "Cash"));
    }

    EXPECT_TRUE(store_->snapshot().accounts.empty());
}

TEST_F(InMemoryUnitOfWorkTest, CommitTwice_Throws) {
    auto uow = factory_->begin();
    uow->commit();
    EXPECT_THROW(uow->commit(), std::logic_error);
}

TEST_F(InMemoryUnitOfWorkTest, ConcurrentUnitOfWork_WaitsForCommit) {
    auto first = factory_->begin();
    first->accounts().save(makeAccount("a1", "Cash"));

    std::atomic<bool> sawAccount{false};
    std::thread second([this, &sawAccount] {
        auto uow = factory_->begin();
        sawAccount = uow->accounts().findById("a1").has_value();
        uow->commit();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    first->commit();
    second.join();

    EXPECT_TRUE(sawAccount);
}

// ============================================================================
// REPOSITORY BEHAVIOUR
// ============================================================================

TEST_F(InMemoryUnitOfWorkTest, Accounts_OrderedByCodeWithNullsLast) {
    auto uow = factory_->begin();
    uow->accounts().save(makeAccount("a1", "Zeta", "2001"));
    uow->accounts().save(makeAccount("a2", "Alpha"));
    uow->accounts().save(makeAccount("a3", "Beta", "1001"));

    auto accounts = uow->accounts().findAll(true);

    ASSERT_EQ(accounts.size(), 3u);
    EXPECT_EQ(accounts[0].id, "a3");
    EXPECT_EQ(accounts[1].id, "a1");
    EXPECT_EQ(accounts[2].id, "a2");
}

TEST_F(InMemoryUnitOfWorkTest, ApplyBalanceDelta_UnknownAccount_ReturnsFalse) {
    auto uow = factory_->begin();
    uow->accounts().save(makeAccount("a1", "Cash"));

    EXPECT_TRUE(uow->accounts().applyBalanceDelta("a1", domain::Decimal::fromInt(5), domain::Timestamp::now()));
    EXPECT_FALSE(uow->accounts().applyBalanceDelta("nope", domain::Decimal::fromInt(5), domain::Timestamp::now()));
    EXPECT_EQ(uow->accounts().findById("a1")->currentBalance, domain::Decimal::fromInt(5));
}

TEST_F(InMemoryUnitOfWorkTest, CashflowTypes_AssignIds) {
    auto uow = factory_->begin();
    domain::CashflowType type;
    type.code = "OP-IN";
    type.name = "Sales receipts";

    auto saved = uow->cashflowTypes().save(type);
    EXPECT_GT(saved.id, 0);
    EXPECT_TRUE(uow->cashflowTypes().findByCode("OP-IN").has_value());
}
