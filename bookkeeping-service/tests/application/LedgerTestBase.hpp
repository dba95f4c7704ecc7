#pragma once

#include <gtest/gtest.h>
#include "application/AccountService.hpp"
#include "application/LedgerService.hpp"
#include "application/CashflowTypeService.hpp"
#include "adapters/secondary/persistence/memory/InMemoryUnitOfWork.hpp"

namespace bookkeeping::tests {

/**
 * @brief Общая фикстура: леджер в памяти, реестр счетов и движок проводок
 */
class LedgerTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::memory::InMemoryLedgerStore>();
        uowFactory_ = std::make_shared<adapters::secondary::memory::InMemoryUnitOfWorkFactory>(store_);

        accountService_ = std::make_shared<application::AccountService>(uowFactory_);
        ledgerService_ = std::make_shared<application::LedgerService>(uowFactory_);
        cashflowTypeService_ = std::make_shared<application::CashflowTypeService>(uowFactory_);
    }

    std::string createAccount(const std::string& name,
                              const std::string& type,
                              bool isCash = false,
                              std::optional<std::string> parentId = std::nullopt,
                              std::optional<std::string> code = std::nullopt)
    {
        domain::CreateAccountRequest request;
        request.name = name;
        request.accountType = type;
        request.isCash = isCash;
        request.parentId = std::move(parentId);
        request.code = std::move(code);
        return accountService_->createAccount(request).id;
    }

    int64_t createCashflowType(const std::string& code,
                               domain::FlowType flowType,
                               domain::CashflowDirection direction)
    {
        domain::CreateCashflowTypeRequest request;
        request.code = code;
        request.name = code + " name";
        request.flowType = flowType;
        request.direction = direction;
        return cashflowTypeService_->createCashflowType(request).id;
    }

    static domain::Decimal d(const char* text) {
        return domain::Decimal::fromString(text);
    }

    static domain::SplitRequest split(const std::string& accountId,
                                      const char* amount,
                                      std::optional<int64_t> cashflowTypeId = std::nullopt)
    {
        return domain::SplitRequest{accountId, d(amount), std::nullopt, cashflowTypeId};
    }

    static domain::TransactionRequest transaction(const domain::Date& date,
                                                  std::vector<domain::SplitRequest> splits,
                                                  const std::string& description = "test")
    {
        domain::TransactionRequest request;
        request.postDate = date;
        request.description = description;
        request.splits = std::move(splits);
        return request;
    }

    domain::Decimal balanceOf(const std::string& accountId) {
        auto account = accountService_->getAccount(accountId);
        EXPECT_TRUE(account.has_value()) << "no account " << accountId;
        return account ? account->currentBalance : domain::Decimal();
    }

    domain::Transaction storedTransaction(const std::string& id) {
        auto transaction = ledgerService_->getTransaction(id);
        if (!transaction) {
            ADD_FAILURE() << "no transaction " << id;
            return domain::Transaction{};
        }
        return *transaction;
    }

    /**
     * @brief Сальдо каждого счёта равно сумме его проводок
     */
    void expectBalancesMatchSplits() {
        for (const auto& balance : accountService_->listAccountBalances()) {
            EXPECT_FALSE(balance.drift) << balance.accountName << ": cached " << balance.cachedBalance
                                        << ", derived " << balance.derivedBalance;
        }
    }

    std::shared_ptr<adapters::secondary::memory::InMemoryLedgerStore> store_;
    std::shared_ptr<adapters::secondary::memory::InMemoryUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<application::AccountService> accountService_;
    std::shared_ptr<application::LedgerService> ledgerService_;
    std::shared_ptr<application::CashflowTypeService> cashflowTypeService_;
};

} // namespace bookkeeping::tests
