#pragma once

#include "adapters/secondary/persistence/memory/InMemoryLedgerStore.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "ports/output/ICashflowTypeRepository.hpp"
#include "ports/output/IBusinessDocumentRepository.hpp"
#include "ports/output/IFixedExpenseRepository.hpp"
#include "ports/output/IMonthlyReportRepository.hpp"
#include "ports/output/ILedgerQueryRepository.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <unordered_map>

namespace bookkeeping::adapters::secondary::memory {

// ============================================================================
// Accounts
// ============================================================================

class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    explicit InMemoryAccountRepository(InMemoryLedgerState& state) : state_(state) {}

    std::vector<domain::Account> findAll(bool includeHidden) override {
        std::vector<domain::Account> result;
        for (const auto& [id, account] : state_.accounts) {
            if (includeHidden || !account.hidden) {
                result.push_back(account);
            }
        }
        // ORDER BY code, name (NULL коды в конце, как в PostgreSQL)
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return std::make_tuple(!a.code.has_value(), a.code.value_or(""), a.name) <
                   std::make_tuple(!b.code.has_value(), b.code.value_or(""), b.name);
        });
        return result;
    }

    std::optional<domain::Account> findById(const std::string& id) override {
        auto it = state_.accounts.find(id);
        if (it == state_.accounts.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::Account> findByName(const std::string& name) override {
        for (const auto& [id, account] : state_.accounts) {
            if (account.name == name) {
                return account;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::Account> findByIds(const std::set<std::string>& ids) override {
        std::vector<domain::Account> result;
        for (const auto& id : ids) {
            auto it = state_.accounts.find(id);
            if (it != state_.accounts.end()) {
                result.push_back(it->second);
            }
        }
        return result;
    }

    std::vector<domain::Account> findChildren(const std::string& parentId) override {
        std::vector<domain::Account> result;
        for (const auto& [id, account] : state_.accounts) {
            if (account.parentId && *account.parentId == parentId) {
                result.push_back(account);
            }
        }
        return result;
    }

    void save(const domain::Account& account) override {
        state_.accounts[account.id] = account;
    }

    void update(const domain::Account& account) override {
        auto it = state_.accounts.find(account.id);
        if (it == state_.accounts.end()) {
            return;
        }
        auto balance = it->second.currentBalance;
        it->second = account;
        it->second.currentBalance = balance;
    }

    bool deleteById(const std::string& id) override {
        return state_.accounts.erase(id) > 0;
    }

    void lockForUpdate(const std::vector<std::string>&) override {
        // Unit of Work уже держит mutex всего хранилища
    }

    bool applyBalanceDelta(const std::string& id, const domain::Decimal& delta,
                           const domain::Timestamp& at) override
    {
        auto it = state_.accounts.find(id);
        if (it == state_.accounts.end()) {
            return false;
        }
        it->second.currentBalance += delta;
        it->second.updatedAt = at;
        return true;
    }

    void setBalance(const std::string& id, const domain::Decimal& balance,
                    const domain::Timestamp& at) override
    {
        auto it = state_.accounts.find(id);
        if (it != state_.accounts.end()) {
            it->second.currentBalance = balance;
            it->second.updatedAt = at;
        }
    }

private:
    InMemoryLedgerState& state_;
};

// ============================================================================
// Transactions
// ============================================================================

class InMemoryTransactionRepository : public ports::output::ITransactionRepository {
public:
    explicit InMemoryTransactionRepository(InMemoryLedgerState& state) : state_(state) {}

    void save(const domain::Transaction& transaction) override {
        state_.transactions[transaction.id] = transaction;
    }

    std::optional<domain::Transaction> findById(const std::string& id) override {
        auto it = state_.transactions.find(id);
        if (it == state_.transactions.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::Transaction> findRecent(std::size_t limit) override {
        auto result = ordered();
        if (result.size() > limit) {
            result.resize(limit);
        }
        return result;
    }

    void update(const domain::Transaction& transaction) override {
        state_.transactions[transaction.id] = transaction;
    }

    bool deleteById(const std::string& id) override {
        return state_.transactions.erase(id) > 0;
    }

    bool hasSplitsForAccount(const std::string& accountId) override {
        for (const auto& [id, transaction] : state_.transactions) {
            for (const auto& split : transaction.splits) {
                if (split.accountId == accountId) {
                    return true;
                }
            }
        }
        return false;
    }

    std::vector<domain::TransactionDetailLine> findDetails(
        const std::optional<std::string>& transactionId,
        std::size_t limit) override
    {
        std::vector<domain::TransactionDetailLine> lines;
        for (const auto& transaction : ordered()) {
            if (transactionId && transaction.id != *transactionId) {
                continue;
            }
            for (const auto& split : transaction.splits) {
                if (lines.size() >= limit) {
                    return lines;
                }
                domain::TransactionDetailLine line;
                line.transactionId = transaction.id;
                line.transactionNum = transaction.num;
                line.postDate = transaction.postDate;
                line.description = transaction.description;
                line.businessType = transaction.businessType;
                line.referenceNo = transaction.referenceNo;
                line.splitId = split.id;
                line.accountId = split.accountId;
                auto account = state_.accounts.find(split.accountId);
                if (account != state_.accounts.end()) {
                    line.accountName = account->second.name;
                    line.accountType = account->second.accountType;
                }
                line.amount = split.amount();
                line.memo = split.memo;
                line.cashflowTypeId = split.cashflowTypeId;
                if (split.cashflowTypeId) {
                    auto type = state_.cashflowTypes.find(*split.cashflowTypeId);
                    if (type != state_.cashflowTypes.end()) {
                        line.cashflowTypeName = type->second.name;
                    }
                }
                lines.push_back(std::move(line));
            }
        }
        return lines;
    }

private:
    InMemoryLedgerState& state_;

    // post_date DESC, created_at DESC
    std::vector<domain::Transaction> ordered() const {
        std::vector<domain::Transaction> result;
        for (const auto& [id, transaction] : state_.transactions) {
            result.push_back(transaction);
        }
        std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            if (a.postDate != b.postDate) {
                return a.postDate > b.postDate;
            }
            return a.createdAt > b.createdAt;
        });
        return result;
    }
};

// ============================================================================
// Cashflow types
// ============================================================================

class InMemoryCashflowTypeRepository : public ports::output::ICashflowTypeRepository {
public:
    explicit InMemoryCashflowTypeRepository(InMemoryLedgerState& state) : state_(state) {}

    std::vector<domain::CashflowType> findAll(bool activeOnly) override {
        std::vector<domain::CashflowType> result;
        for (const auto& [id, type] : state_.cashflowTypes) {
            if (!activeOnly || type.active) {
                result.push_back(type);
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return std::make_pair(a.sortOrder, a.id) < std::make_pair(b.sortOrder, b.id);
        });
        return result;
    }

    std::vector<domain::CashflowType> findByIds(const std::set<int64_t>& ids) override {
        std::vector<domain::CashflowType> result;
        for (auto id : ids) {
            auto it = state_.cashflowTypes.find(id);
            if (it != state_.cashflowTypes.end()) {
                result.push_back(it->second);
            }
        }
        return result;
    }

    std::optional<domain::CashflowType> findByCode(const std::string& code) override {
        for (const auto& [id, type] : state_.cashflowTypes) {
            if (type.code == code) {
                return type;
            }
        }
        return std::nullopt;
    }

    domain::CashflowType save(const domain::CashflowType& type) override {
        domain::CashflowType saved = type;
        saved.id = state_.nextCashflowTypeId++;
        state_.cashflowTypes[saved.id] = saved;
        return saved;
    }

private:
    InMemoryLedgerState& state_;
};

// ============================================================================
// Business documents
// ============================================================================

class InMemoryBusinessDocumentRepository : public ports::output::IBusinessDocumentRepository {
public:
    explicit InMemoryBusinessDocumentRepository(InMemoryLedgerState& state) : state_(state) {}

    domain::BusinessDocument save(const domain::BusinessDocument& document) override {
        domain::BusinessDocument saved = document;
        saved.id = state_.nextDocumentId++;
        for (auto& item : saved.items) {
            item.id = state_.nextDocumentItemId++;
            item.documentId = saved.id;
        }
        state_.documents[saved.id] = saved;
        return saved;
    }

    std::optional<domain::BusinessDocument> findById(int64_t id) override {
        auto it = state_.documents.find(id);
        if (it == state_.documents.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::BusinessDocument> findAll(
        const std::optional<domain::BusinessDocumentType>& type,
        std::size_t limit) override
    {
        std::vector<domain::BusinessDocument> result;
        for (const auto& [id, document] : state_.documents) {
            if (!type || document.docType == *type) {
                result.push_back(document);
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            if (a.docDate != b.docDate) {
                return a.docDate > b.docDate;
            }
            return a.id > b.id;
        });
        if (result.size() > limit) {
            result.resize(limit);
        }
        return result;
    }

    std::size_t countByTypeAndDate(domain::BusinessDocumentType type, const domain::Date& date) override {
        return static_cast<std::size_t>(std::count_if(
            state_.documents.begin(), state_.documents.end(), [&](const auto& entry) {
                return entry.second.docType == type && entry.second.docDate == date;
            }));
    }

    void lockNumbering(domain::BusinessDocumentType, const domain::Date&) override {
        // Unit of Work уже держит mutex всего хранилища
    }

private:
    InMemoryLedgerState& state_;
};

// ============================================================================
// Fixed expenses
// ============================================================================

class InMemoryFixedExpenseRepository : public ports::output::IFixedExpenseRepository {
public:
    explicit InMemoryFixedExpenseRepository(InMemoryLedgerState& state) : state_(state) {}

    std::vector<domain::FixedExpense> findAll() override {
        std::vector<domain::FixedExpense> result;
        for (const auto& [id, expense] : state_.fixedExpenses) {
            result.push_back(expense);
        }
        std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return std::make_pair(a.dayOfMonth, a.id) < std::make_pair(b.dayOfMonth, b.id);
        });
        return result;
    }

    std::optional<domain::FixedExpense> findById(int64_t id) override {
        auto it = state_.fixedExpenses.find(id);
        if (it == state_.fixedExpenses.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    domain::FixedExpense save(const domain::FixedExpense& expense) override {
        domain::FixedExpense saved = expense;
        saved.id = state_.nextFixedExpenseId++;
        state_.fixedExpenses[saved.id] = saved;
        return saved;
    }

    void update(const domain::FixedExpense& expense) override {
        state_.fixedExpenses[expense.id] = expense;
    }

    bool deleteById(int64_t id) override {
        return state_.fixedExpenses.erase(id) > 0;
    }

private:
    InMemoryLedgerState& state_;
};

// ============================================================================
// Monthly reports
// ============================================================================

class InMemoryMonthlyReportRepository : public ports::output::IMonthlyReportRepository {
public:
    explicit InMemoryMonthlyReportRepository(InMemoryLedgerState& state) : state_(state) {}

    std::vector<domain::MonthlyReportRecord> findByMonth(const domain::Date& month) override {
        std::vector<domain::MonthlyReportRecord> result;
        for (const auto& record : state_.monthlyReports) {
            if (record.reportMonth == month) {
                result.push_back(record);
            }
        }
        return result;
    }

    void replaceMonth(const domain::Date& month,
                      const std::vector<domain::MonthlyReportRecord>& records) override
    {
        deleteMonth(month);
        for (auto record : records) {
            record.id = state_.nextMonthlyReportId++;
            record.reportMonth = month;
            state_.monthlyReports.push_back(std::move(record));
        }
    }

    std::vector<domain::Date> findMonths() override {
        std::set<domain::Date> months;
        for (const auto& record : state_.monthlyReports) {
            months.insert(record.reportMonth);
        }
        return std::vector<domain::Date>(months.rbegin(), months.rend());
    }

    void deleteMonth(const domain::Date& month) override {
        auto& records = state_.monthlyReports;
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&](const auto& record) { return record.reportMonth == month; }),
                      records.end());
    }

private:
    InMemoryLedgerState& state_;
};

// ============================================================================
// Report queries
// ============================================================================

class InMemoryLedgerQueryRepository : public ports::output::ILedgerQueryRepository {
public:
    explicit InMemoryLedgerQueryRepository(InMemoryLedgerState& state) : state_(state) {}

    std::unordered_map<std::string, domain::Decimal> sumByAccountUpTo(const domain::Date& date) override {
        return sumWhere([&](const domain::Transaction& t) { return t.postDate <= date; });
    }

    std::unordered_map<std::string, domain::Decimal> sumByAccountBetween(
        const domain::Date& start, const domain::Date& end) override
    {
        return sumWhere([&](const domain::Transaction& t) {
            return t.postDate >= start && t.postDate <= end;
        });
    }

    std::unordered_map<std::string, domain::Decimal> sumByAccount() override {
        return sumWhere([](const domain::Transaction&) { return true; });
    }

    std::vector<ports::output::CashflowTypeTotal> cashflowTotalsBetween(
        const domain::Date& start, const domain::Date& end) override
    {
        std::map<int64_t, domain::Decimal> sums;
        for (const auto& [id, transaction] : state_.transactions) {
            if (transaction.postDate < start || transaction.postDate > end) {
                continue;
            }
            for (const auto& split : transaction.splits) {
                if (split.cashflowTypeId) {
                    sums[*split.cashflowTypeId] += split.amount();
                }
            }
        }

        std::vector<ports::output::CashflowTypeTotal> totals;
        for (const auto& [typeId, amount] : sums) {
            auto it = state_.cashflowTypes.find(typeId);
            if (it == state_.cashflowTypes.end()) {
                continue;
            }
            ports::output::CashflowTypeTotal total;
            total.cashflowTypeId = typeId;
            total.name = it->second.name;
            total.flowType = it->second.flowType;
            total.direction = it->second.direction;
            total.sortOrder = it->second.sortOrder;
            total.amount = amount;
            totals.push_back(std::move(total));
        }
        std::stable_sort(totals.begin(), totals.end(), [](const auto& a, const auto& b) {
            return std::make_pair(a.sortOrder, a.cashflowTypeId) < std::make_pair(b.sortOrder, b.cashflowTypeId);
        });
        return totals;
    }

private:
    InMemoryLedgerState& state_;

    template <typename Predicate>
    std::unordered_map<std::string, domain::Decimal> sumWhere(Predicate matches) const {
        std::unordered_map<std::string, domain::Decimal> sums;
        for (const auto& [id, transaction] : state_.transactions) {
            if (!matches(transaction)) {
                continue;
            }
            for (const auto& split : transaction.splits) {
                sums[split.accountId] += split.amount();
            }
        }
        return sums;
    }
};

} // namespace bookkeeping::adapters::secondary::memory
