#pragma once

#include "adapters/secondary/persistence/postgres/PostgresRepositories.hpp"
#include "adapters/secondary/persistence/postgres/PostgresSchema.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace bookkeeping::adapters::secondary::postgres {

/**
 * @brief Unit of Work над одной транзакцией PostgreSQL
 *
 * Владеет соединением и pqxx::work; все репозитории пишут в эту транзакцию.
 * Незакоммиченная транзакция откатывается деструктором pqxx::work.
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit PostgresUnitOfWork(const settings::DbSettings& settings)
        : connection_(std::make_unique<pqxx::connection>(settings.getConnectionString()))
        , txn_(std::make_unique<pqxx::work>(*connection_))
        , accounts_(*txn_)
        , transactions_(*txn_)
        , cashflowTypes_(*txn_)
        , documents_(*txn_)
        , fixedExpenses_(*txn_)
        , monthlyReports_(*txn_)
        , ledgerQueries_(*txn_)
    {}

    ~PostgresUnitOfWork() override {
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
        if (finished_) {
            throw std::logic_error("Unit of Work is already finished");
        }
        finished_ = true;
        try {
            txn_->commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUnitOfWork] commit failed: " << e.what() << std::endl;
            throw;
        }
    }

    void rollback() override {
        if (finished_) {
            return;
        }
        finished_ = true;
        try {
            txn_->abort();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUnitOfWork] rollback failed: " << e.what() << std::endl;
        }
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::unique_ptr<pqxx::work> txn_;
    bool finished_ = false;

    PostgresAccountRepository accounts_;
    PostgresTransactionRepository transactions_;
    PostgresCashflowTypeRepository cashflowTypes_;
    PostgresBusinessDocumentRepository documents_;
    PostgresFixedExpenseRepository fixedExpenses_;
    PostgresMonthlyReportRepository monthlyReports_;
    PostgresLedgerQueryRepository ledgerQueries_;
};

/**
 * @brief Фабрика Unit of Work: новое соединение на каждый Unit of Work
 *
 * При создании проверяет подключение и создаёт схему.
 */
class PostgresUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresUnitOfWorkFactory] Connecting to " << settings_->describe() << "..." << std::endl;
        PostgresSchema::init(*settings_);
    }

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<PostgresUnitOfWork>(*settings_);
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace bookkeeping::adapters::secondary::postgres
