#pragma once

#include "ports/input/IFixedExpenseService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/LedgerPosting.hpp"
#include "application/UnitOfWorkRunner.hpp"
#include <DomainException.hpp>
#include <algorithm>
#include <iostream>
#include <memory>

namespace bookkeeping::application {

/**
 * @brief Планировщик ежемесячных фиксированных расходов
 *
 * Списание: дебет счёта расходов, кредит счёта-источника. Источник выбирается
 * по сальдо: основной, если хватает средств, иначе запасной. Нехватка средств
 * не отменяет списание, а добавляет предупреждение.
 *
 * Транзакция и отметка lastRunMonth фиксируются одним Unit of Work, поэтому
 * повторный запуск в том же месяце ничего не спишет.
 */
class FixedExpenseService : public ports::input::IFixedExpenseService {
public:
    explicit FixedExpenseService(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
        : uowFactory_(std::move(uowFactory))
    {
        std::cout << "[FixedExpenseService] Created" << std::endl;
    }

    // ===== CRUD =====

    std::vector<domain::FixedExpense> listFixedExpenses() override {
        auto uow = uowFactory_->begin();
        return uow->fixedExpenses().findAll();
    }

    domain::FixedExpense getFixedExpense(int64_t id) override {
        auto uow = uowFactory_->begin();
        auto expense = uow->fixedExpenses().findById(id);
        if (!expense) {
            throw NotFoundError("Fixed expense " + std::to_string(id) + " does not exist");
        }
        return *expense;
    }

    domain::FixedExpense createFixedExpense(const domain::FixedExpenseRequest& request) override {
        auto created = runInUnitOfWork(*uowFactory_, "FixedExpenseService", [&](auto& uow) {
            validate(uow, request);

            domain::FixedExpense expense;
            assign(expense, request);
            expense.createdAt = domain::Timestamp::now();
            expense.updatedAt = expense.createdAt;
            return uow.fixedExpenses().save(expense);
        });

        std::cout << "[FixedExpenseService] Created fixed expense " << created.name
                  << " (" << created.id << ")" << std::endl;
        return created;
    }

    domain::FixedExpense updateFixedExpense(int64_t id, const domain::FixedExpenseRequest& request) override {
        auto updated = runInUnitOfWork(*uowFactory_, "FixedExpenseService", [&](auto& uow) {
            auto expense = uow.fixedExpenses().findById(id);
            if (!expense) {
                throw NotFoundError("Fixed expense " + std::to_string(id) + " does not exist");
            }
            validate(uow, request);

            assign(*expense, request);
            expense->updatedAt = domain::Timestamp::now();
            uow.fixedExpenses().update(*expense);
            return *expense;
        });

        std::cout << "[FixedExpenseService] Updated fixed expense " << id << std::endl;
        return updated;
    }

    void deleteFixedExpense(int64_t id) override {
        runInUnitOfWork(*uowFactory_, "FixedExpenseService", [&](auto& uow) {
            if (!uow.fixedExpenses().deleteById(id)) {
                throw NotFoundError("Fixed expense " + std::to_string(id) + " does not exist");
            }
        });
        std::cout << "[FixedExpenseService] Deleted fixed expense " << id << std::endl;
    }

    // ===== Списание =====

    /**
     * @brief Срок наступил: не списано в этом месяце и date >= день списания
     *
     * День списания ограничивается последним днём месяца.
     */
    bool isDue(const domain::FixedExpense& expense, const domain::Date& date) const override {
        auto monthStart = date.firstDayOfMonth();
        if (expense.lastRunMonth && *expense.lastRunMonth == monthStart) {
            return false;
        }
        return date >= monthStart.withDay(dueDay(expense, date));
    }

    domain::FixedExpenseRunResult execute(int64_t expenseId,
                                          const domain::Date& runDate,
                                          bool force) override
    {
        auto result = runInUnitOfWork(*uowFactory_, "FixedExpenseService", [&](auto& uow) {
            auto expense = uow.fixedExpenses().findById(expenseId);
            if (!expense) {
                throw NotFoundError("Fixed expense " + std::to_string(expenseId) + " does not exist");
            }
            return charge(uow, *expense, runDate, force);
        });

        logResult(result);
        return result;
    }

    /**
     * @brief Списать все активные расходы, срок которых наступил
     *
     * Каждый расход в своём Unit of Work: ошибка одного откатывает только его
     * и попадает в предупреждения результата.
     */
    std::vector<domain::FixedExpenseRunResult> executeAllDue(const domain::Date& runDate) override {
        std::vector<domain::FixedExpenseRunResult> results;

        for (const auto& expense : listFixedExpenses()) {
            if (!expense.active || !isDue(expense, runDate)) {
                continue;
            }

            try {
                results.push_back(execute(expense.id, runDate, true));
            } catch (const std::exception& e) {
                std::cerr << "[FixedExpenseService] Failed to charge " << expense.name
                          << ": " << e.what() << std::endl;
                domain::FixedExpenseRunResult failed;
                failed.expenseId = expense.id;
                failed.expenseName = expense.name;
                failed.warnings.push_back(std::string("Charge failed: ") + e.what());
                results.push_back(std::move(failed));
            }
        }

        std::cout << "[FixedExpenseService] Processed " << results.size()
                  << " due fixed expenses for " << runDate.toString() << std::endl;
        return results;
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;

    static unsigned dueDay(const domain::FixedExpense& expense, const domain::Date& date) {
        return std::min(static_cast<unsigned>(std::max(expense.dayOfMonth, 1)), date.daysInMonth());
    }

    domain::FixedExpenseRunResult charge(ports::output::IUnitOfWork& uow,
                                         domain::FixedExpense& expense,
                                         const domain::Date& runDate,
                                         bool force) const
    {
        domain::FixedExpenseRunResult result;
        result.expenseId = expense.id;
        result.expenseName = expense.name;

        if (!expense.active) {
            result.warnings.push_back("Fixed expense is inactive, not executed.");
            return result;
        }
        if (!force && !isDue(expense, runDate)) {
            result.warnings.push_back("Not yet due (day " + std::to_string(dueDay(expense, runDate)) +
                                      "), not executed.");
            return result;
        }
        if (expense.amount.signum() <= 0) {
            result.warnings.push_back("Amount must be greater than 0, not executed.");
            return result;
        }

        auto payAccountId = selectPaymentAccount(uow, expense, result.warnings);
        if (!payAccountId) {
            result.warnings.push_back("No usable payment account configured, not executed.");
            return result;
        }

        const std::string memo = expense.name + " auto charge";
        domain::TransactionRequest request;
        request.postDate = runDate;
        request.description = runDate.toMonthString() + " " + expense.name + " fixed expense";
        request.splits = {
            domain::SplitRequest{expense.expenseAccountId, expense.amount, memo, std::nullopt},
            domain::SplitRequest{*payAccountId, -expense.amount, memo, std::nullopt},
        };
        auto transaction = LedgerPosting(uow).post(request);

        expense.lastRunMonth = runDate.firstDayOfMonth();
        expense.lastRunAt = domain::Timestamp::now();
        uow.fixedExpenses().update(expense);

        result.transactionId = transaction.id;
        return result;
    }

    /**
     * @brief Выбрать счёт-источник по сальдо
     *
     * Основной, если его сальдо >= суммы; иначе запасной (даже если и его не
     * хватает); иначе снова основной. nullopt: не настроен ни один.
     */
    static std::optional<std::string> selectPaymentAccount(ports::output::IUnitOfWork& uow,
                                                           const domain::FixedExpense& expense,
                                                           std::vector<std::string>& warnings)
    {
        std::optional<domain::Account> primary;
        std::optional<domain::Account> fallback;
        if (expense.primaryAccountId) {
            primary = uow.accounts().findById(*expense.primaryAccountId);
        }
        if (expense.fallbackAccountId) {
            fallback = uow.accounts().findById(*expense.fallbackAccountId);
        }

        if (primary && primary->currentBalance >= expense.amount) {
            return primary->id;
        }

        if (primary) {
            warnings.push_back("Primary account " + primary->name + " has insufficient balance (current " +
                               primary->currentBalance.toString() + "), using fallback account.");
        } else {
            warnings.push_back("Primary payment account is not configured.");
        }

        if (fallback) {
            if (fallback->currentBalance < expense.amount) {
                warnings.push_back("Fallback account " + fallback->name +
                                   " also has insufficient balance (current " +
                                   fallback->currentBalance.toString() +
                                   "), balance may become negative after the charge.");
            }
            return fallback->id;
        }

        if (primary) {
            warnings.push_back("No fallback account configured, charging the primary account anyway.");
            return primary->id;
        }
        return std::nullopt;
    }

    static void validate(ports::output::IUnitOfWork& uow, const domain::FixedExpenseRequest& request) {
        if (request.name.empty()) {
            throw ValidationError("Fixed expense name is required");
        }
        if (request.amount.signum() <= 0) {
            throw ValidationError("Fixed expense amount must be greater than 0");
        }
        if (request.dayOfMonth < 1 || request.dayOfMonth > 31) {
            throw ValidationError("Day of month must be between 1 and 31, got " +
                                  std::to_string(request.dayOfMonth));
        }

        requireAccount(uow, "expense_account", request.expenseAccountId);
        if (request.primaryAccountId) {
            requireAccount(uow, "primary_account", *request.primaryAccountId);
        }
        if (request.fallbackAccountId) {
            requireAccount(uow, "fallback_account", *request.fallbackAccountId);
        }
    }

    static void requireAccount(ports::output::IUnitOfWork& uow, const std::string& field, const std::string& id) {
        if (id.empty() || !uow.accounts().findById(id)) {
            throw ValidationError(field + " refers to a non-existent account: " + id);
        }
    }

    static void assign(domain::FixedExpense& expense, const domain::FixedExpenseRequest& request) {
        expense.name = request.name;
        expense.amount = request.amount;
        expense.expenseAccountId = request.expenseAccountId;
        expense.primaryAccountId = request.primaryAccountId;
        expense.fallbackAccountId = request.fallbackAccountId;
        expense.dayOfMonth = request.dayOfMonth;
        expense.active = request.active;
    }

    static void logResult(const domain::FixedExpenseRunResult& result) {
        if (result.executed()) {
            std::cout << "[FixedExpenseService] Charged " << result.expenseName
                      << " -> transaction " << *result.transactionId << std::endl;
        } else {
            std::cout << "[FixedExpenseService] Skipped " << result.expenseName << std::endl;
        }
        for (const auto& warning : result.warnings) {
            std::cout << "[FixedExpenseService]   warning: " << warning << std::endl;
        }
    }
};

} // namespace bookkeeping::application
