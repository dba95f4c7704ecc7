#pragma once

#include "adapters/secondary/persistence/memory/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/memory/InMemoryRepositories.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>

namespace bookkeeping::adapters::secondary::memory {

/**
 * @brief Unit of Work над InMemoryLedgerStore
 *
 * Захватывает mutex хранилища, копирует состояние и работает с копией.
 * commit() публикует копию, rollback() её отбрасывает. В обоих случаях
 * mutex освобождается.
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit InMemoryUnitOfWork(InMemoryLedgerStore& store)
        : store_(store)
        , lock_(store.mutex())
        , staged_(store.state())
        , accounts_(staged_)
        , transactions_(staged_)
        , cashflowTypes_(staged_)
        , documents_(staged_)
        , fixedExpenses_(staged_)
        , monthlyReports_(staged_)
        , ledgerQueries_(staged_)
    {}

    ~InMemoryUnitOfWork() override {
        rollback();
    }

    ports::output::IAccountRepository& accounts() override { return accounts_; }
    ports::output::ITransactionRepository& transactions() override { return transactions_; }
    ports::output::ICashflowTypeRepository& cashflowTypes() override { return cashflowTypes_; }
    ports::output::IBusinessDocumentRepository& documents() override { return documents_; }
    ports::output::IFixedExpenseRepository& fixedExpenses() override { return fixedExpenses_; }
    ports::output::IMonthlyReportRepository& monthlyReports() override { return monthlyReports_; }
    ports::output::ILedgerQueryRepository& ledgerQueries() override { return ledgerQueries_; }

    void commit() override {
        if (!lock_.owns_lock()) {
            throw std::logic_error("Unit of Work is already finished");
        }
        store_.state() = staged_;
        lock_.unlock();
    }

    void rollback() override {
        if (lock_.owns_lock()) {
            lock_.unlock();
        }
    }

private:
    InMemoryLedgerStore& store_;
    std::unique_lock<std::mutex> lock_;
    InMemoryLedgerState staged_;

    InMemoryAccountRepository accounts_;
    InMemoryTransactionRepository transactions_;
    InMemoryCashflowTypeRepository cashflowTypes_;
    InMemoryBusinessDocumentRepository documents_;
    InMemoryFixedExpenseRepository fixedExpenses_;
    InMemoryMonthlyReportRepository monthlyReports_;
    InMemoryLedgerQueryRepository ledgerQueries_;
};

/**
 * @brief Фабрика Unit of Work над общим InMemoryLedgerStore
 */
class InMemoryUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    InMemoryUnitOfWorkFactory() : store_(std::make_shared<InMemoryLedgerStore>()) {}

    explicit InMemoryUnitOfWorkFactory(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<InMemoryUnitOfWork>(*store_);
    }

    std::shared_ptr<InMemoryLedgerStore> store() const { return store_; }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;
};

} // namespace bookkeeping::adapters::secondary::memory
