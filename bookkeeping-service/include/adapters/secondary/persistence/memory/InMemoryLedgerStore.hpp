#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include "domain/CashflowType.hpp"
#include "domain/BusinessDocument.hpp"
#include "domain/FixedExpense.hpp"
#include "domain/MonthlyReport.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace bookkeeping::adapters::secondary::memory {

/**
 * @brief Таблицы хранилища в памяти
 *
 * Копируемое значение: Unit of Work работает на копии и при commit
 * публикует её целиком.
 */
struct InMemoryLedgerState {
    std::map<std::string, domain::Account> accounts;
    std::map<std::string, domain::Transaction> transactions;
    std::map<int64_t, domain::CashflowType> cashflowTypes;
    std::map<int64_t, domain::BusinessDocument> documents;
    std::map<int64_t, domain::FixedExpense> fixedExpenses;
    std::vector<domain::MonthlyReportRecord> monthlyReports;

    int64_t nextCashflowTypeId = 1;
    int64_t nextDocumentId = 1;
    int64_t nextDocumentItemId = 1;
    int64_t nextFixedExpenseId = 1;
    int64_t nextMonthlyReportId = 1;
};

/**
 * @brief Хранилище леджера в памяти (тесты, демо-режим LEDGER_STORAGE=memory)
 *
 * Unit of Work держит mutex хранилища всё время жизни, поэтому Unit of Work
 * выполняются строго последовательно: это и есть блокировка строк счетов и
 * нумерации документов для этого адаптера.
 *
 * @note Вложенный Unit of Work в том же потоке приведёт к взаимоблокировке
 */
class InMemoryLedgerStore {
public:
    InMemoryLedgerStore() = default;

    InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
    InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

    std::mutex& mutex() { return mutex_; }

    /**
     * @brief Опубликованное состояние (доступ только под mutex())
     */
    InMemoryLedgerState& state() { return state_; }

    // ===== Тестовые хелперы =====

    /**
     * @brief Снимок опубликованного состояния
     */
    InMemoryLedgerState snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = InMemoryLedgerState{};
    }

    std::size_t transactionCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.transactions.size();
    }

private:
    std::mutex mutex_;
    InMemoryLedgerState state_;
};

} // namespace bookkeeping::adapters::secondary::memory
