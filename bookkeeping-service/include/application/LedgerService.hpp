#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/LedgerPosting.hpp"
#include "application/UnitOfWorkRunner.hpp"
#include <DomainException.hpp>
#include <iostream>
#include <memory>
#include <optional>

namespace bookkeeping::application {

/**
 * @brief Сервис леджера
 *
 * Каждая операция выполняется в собственном Unit of Work: проводки и
 * изменения сальдо фиксируются вместе или не фиксируются вовсе.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    explicit LedgerService(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
        : uowFactory_(std::move(uowFactory))
    {
        std::cout << "[LedgerService] Created" << std::endl;
    }

    domain::Transaction postTransaction(const domain::TransactionRequest& request) override {
        auto transaction = runInUnitOfWork(*uowFactory_, "LedgerService", [&](auto& uow) {
            return LedgerPosting(uow).post(request);
        });
        std::cout << "[LedgerService] Posted transaction " << transaction.id
                  << " (" << transaction.splits.size() << " splits)" << std::endl;
        return transaction;
    }

    domain::Transaction updateTransaction(const std::string& id,
                                          const domain::TransactionRequest& request) override
    {
        auto transaction = runInUnitOfWork(*uowFactory_, "LedgerService", [&](auto& uow) {
            return LedgerPosting(uow).update(id, request);
        });
        std::cout << "[LedgerService] Updated transaction " << id << std::endl;
        return transaction;
    }

    void deleteTransaction(const std::string& id) override {
        runInUnitOfWork(*uowFactory_, "LedgerService", [&](auto& uow) {
            LedgerPosting(uow).remove(id);
        });
        std::cout << "[LedgerService] Deleted transaction " << id << std::endl;
    }

    std::optional<domain::Transaction> getTransaction(const std::string& id) override {
        auto uow = uowFactory_->begin();
        return uow->transactions().findById(id);
    }

    std::vector<domain::Transaction> listTransactions(std::size_t limit) override {
        auto uow = uowFactory_->begin();
        return uow->transactions().findRecent(limit);
    }

    std::vector<domain::TransactionDetailLine> listTransactionDetails(
        const std::optional<std::string>& transactionId,
        std::size_t limit) override
    {
        auto uow = uowFactory_->begin();
        return uow->transactions().findDetails(transactionId, limit);
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
};

} // namespace bookkeeping::application
