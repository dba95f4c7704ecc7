#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "domain/Transaction.hpp"
#include "domain/TransactionRequest.hpp"
#include "domain/AmountCodec.hpp"
#include "utils/UuidGenerator.hpp"
#include <DomainException.hpp>
#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace bookkeeping::application {

/**
 * @brief Движок проводок: единственное место, где меняется сальдо счетов
 *
 * Работает внутри чужого Unit of Work, поэтому проведение документа или
 * фиксированного расхода вместе со своими записями фиксируется атомарно.
 * Commit/rollback выполняет владелец Unit of Work.
 *
 * Жизненный цикл транзакции: черновик (TransactionRequest) -> проведена -> удалена.
 * Каждая операция либо выполняется целиком, либо (после rollback) не оставляет следов.
 */
class LedgerPosting {
public:
    explicit LedgerPosting(ports::output::IUnitOfWork& uow) : uow_(uow) {}

    /**
     * @brief Провести новую транзакцию
     *
     * @throws ValidationError меньше двух проводок, ненулевая сумма,
     *         несуществующие счета
     */
    domain::Transaction post(const domain::TransactionRequest& request) {
        auto now = domain::Timestamp::now();

        domain::Transaction transaction;
        transaction.id = utils::UuidGenerator::generate();
        transaction.enteredAt = now;
        transaction.createdAt = now;
        applyHeader(transaction, request, now);
        transaction.splits = prepareSplits(request, transaction.id, now);

        uow_.transactions().save(transaction);
        applyDeltas(deltasOf(transaction.splits, 1), now);
        return transaction;
    }

    /**
     * @brief Заменить транзакцию: откат старых проводок, замена, применение новых
     *
     * enteredAt и createdAt сохраняются, updatedAt обновляется.
     *
     * @throws NotFoundError, ValidationError
     */
    domain::Transaction update(const std::string& id, const domain::TransactionRequest& request) {
        auto existing = uow_.transactions().findById(id);
        if (!existing) {
            throw NotFoundError("Transaction " + id + " does not exist, cannot update");
        }

        auto now = domain::Timestamp::now();
        auto newSplits = prepareSplits(request, id, now);

        applyDeltas(deltasOf(existing->splits, -1), now);

        domain::Transaction transaction = *existing;
        applyHeader(transaction, request, now);
        transaction.splits = std::move(newSplits);
        uow_.transactions().update(transaction);

        applyDeltas(deltasOf(transaction.splits, 1), now);
        return transaction;
    }

    /**
     * @brief Удалить транзакцию, вернув сальдо счетов
     *
     * @throws NotFoundError
     */
    void remove(const std::string& id) {
        auto existing = uow_.transactions().findById(id);
        if (!existing) {
            throw NotFoundError("Transaction " + id + " does not exist, cannot delete");
        }

        auto now = domain::Timestamp::now();
        applyDeltas(deltasOf(existing->splits, -1), now);
        uow_.transactions().deleteById(id);
    }

private:
    ports::output::IUnitOfWork& uow_;

    static void applyHeader(domain::Transaction& transaction,
                            const domain::TransactionRequest& request,
                            const domain::Timestamp& now)
    {
        transaction.num = request.num;
        transaction.postDate = request.postDate;
        transaction.description = request.description;
        transaction.businessType = request.businessType;
        transaction.referenceNo = request.referenceNo;
        transaction.updatedAt = now;
    }

    /**
     * @brief Проверить входные проводки и построить сохраняемые
     *
     * Баланс проверяется по суммам, приведённым к точности хранения: именно
     * они попадут в БД и будут складываться в сальдо.
     */
    std::vector<domain::Split> prepareSplits(const domain::TransactionRequest& request,
                                             const std::string& transactionId,
                                             const domain::Timestamp& now)
    {
        if (request.splits.size() < 2) {
            throw ValidationError("A transaction requires at least two splits");
        }

        std::vector<domain::Split> splits;
        splits.reserve(request.splits.size());
        domain::Decimal total;
        std::set<std::string> accountIds;

        for (const auto& input : request.splits) {
            if (input.accountId.empty()) {
                throw ValidationError("Split account is required");
            }

            auto fraction = domain::AmountCodec::toFraction(input.amount);
            total += domain::AmountCodec::fromFraction(fraction);
            accountIds.insert(input.accountId);

            domain::Split split;
            split.id = utils::UuidGenerator::generate();
            split.transactionId = transactionId;
            split.accountId = input.accountId;
            split.valueNum = fraction.numerator;
            split.valueDenom = fraction.denominator;
            split.memo = input.memo;
            split.reconcileState = domain::reconcile::NEW;
            split.cashflowTypeId = input.cashflowTypeId;
            split.createdAt = now;
            splits.push_back(std::move(split));
        }

        if (!total.isZero()) {
            throw ValidationError("Splits are not balanced: sum is " + total.toString());
        }

        requireAccounts(accountIds);
        return splits;
    }

    void requireAccounts(const std::set<std::string>& ids) {
        auto found = uow_.accounts().findByIds(ids);
        std::set<std::string> foundIds;
        for (const auto& account : found) {
            foundIds.insert(account.id);
        }

        std::string missing;
        for (const auto& id : ids) {
            if (!foundIds.count(id)) {
                missing += (missing.empty() ? "" : ", ") + id;
            }
        }
        if (!missing.empty()) {
            throw ValidationError("Accounts do not exist: " + missing);
        }
    }

    static std::map<std::string, domain::Decimal> deltasOf(const std::vector<domain::Split>& splits,
                                                           int sign)
    {
        std::map<std::string, domain::Decimal> deltas;
        for (const auto& split : splits) {
            auto amount = split.amount();
            deltas[split.accountId] += sign < 0 ? -amount : amount;
        }
        return deltas;
    }

    /**
     * @brief Применить дельты сальдо под блокировкой строк счетов
     *
     * std::map даёт отсортированный порядок id, одинаковый для всех
     * параллельных проводок.
     */
    void applyDeltas(const std::map<std::string, domain::Decimal>& deltas,
                     const domain::Timestamp& now)
    {
        std::vector<std::string> ids;
        ids.reserve(deltas.size());
        for (const auto& [accountId, delta] : deltas) {
            ids.push_back(accountId);
        }
        uow_.accounts().lockForUpdate(ids);

        for (const auto& [accountId, delta] : deltas) {
            if (!uow_.accounts().applyBalanceDelta(accountId, delta, now)) {
                throw ValidationError("Account " + accountId + " does not exist, cannot update balance");
            }
        }
    }
};

} // namespace bookkeeping::application
