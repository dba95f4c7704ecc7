#pragma once

#include "adapters/secondary/persistence/postgres/PostgresRows.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "ports/output/ICashflowTypeRepository.hpp"
#include "ports/output/IBusinessDocumentRepository.hpp"
#include "ports/output/IFixedExpenseRepository.hpp"
#include "ports/output/IMonthlyReportRepository.hpp"
#include "ports/output/ILedgerQueryRepository.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <set>
#include <unordered_map>

namespace bookkeeping::adapters::secondary::postgres {

// Сумма проводки; нулевой знаменатель трактуется как 1
inline constexpr const char* SPLIT_AMOUNT_SQL =
    "(s.value_num::numeric / CASE WHEN s.value_denom = 0 THEN 1 ELSE s.value_denom END)";

// ============================================================================
// Accounts
// ============================================================================

class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(pqxx::work& txn) : txn_(txn) {}

    std::vector<domain::Account> findAll(bool includeHidden) override {
        auto result = txn_.exec_params(
            std::string(SELECT_SQL) + " WHERE ($1 OR NOT hidden) ORDER BY code, name",
            includeHidden);
        return rowsToAccounts(result);
    }

    std::optional<domain::Account> findById(const std::string& id) override {
        auto result = txn_.exec_params(std::string(SELECT_SQL) + " WHERE guid = $1", id);
        if (result.empty()) return std::nullopt;
        return rowToAccount(result[0]);
    }

    std::optional<domain::Account> findByName(const std::string& name) override {
        auto result = txn_.exec_params(std::string(SELECT_SQL) + " WHERE name = $1", name);
        if (result.empty()) return std::nullopt;
        return rowToAccount(result[0]);
    }

    std::vector<domain::Account> findByIds(const std::set<std::string>& ids) override {
        std::vector<domain::Account> accounts;
        for (const auto& id : ids) {
            if (auto account = findById(id)) {
                accounts.push_back(std::move(*account));
            }
        }
        return accounts;
    }

    std::vector<domain::Account> findChildren(const std::string& parentId) override {
        auto result = txn_.exec_params(
            std::string(SELECT_SQL) + " WHERE parent_guid = $1 ORDER BY code, name", parentId);
        return rowsToAccounts(result);
    }

    void save(const domain::Account& a) override {
        txn_.exec_params(
            R"(INSERT INTO accounts (guid, name, account_type, parent_guid, code, description,
                                     hidden, placeholder, is_cash, current_balance, created_at, updated_at)
               VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10::numeric, to_timestamp($11), to_timestamp($12)))",
            a.id, a.name, a.accountType, a.parentId, a.code, a.description,
            a.hidden, a.placeholder, a.isCash, a.currentBalance.toString(),
            rows::epochOf(a.createdAt), rows::epochOf(a.updatedAt));
    }

    void update(const domain::Account& a) override {
        txn_.exec_params(
            R"(UPDATE accounts SET name = $2, account_type = $3, parent_guid = $4, code = $5,
                      description = $6, hidden = $7, placeholder = $8, is_cash = $9,
                      updated_at = to_timestamp($10)
               WHERE guid = $1)",
            a.id, a.name, a.accountType, a.parentId, a.code, a.description,
            a.hidden, a.placeholder, a.isCash, rows::epochOf(a.updatedAt));
    }

    bool deleteById(const std::string& id) override {
        auto result = txn_.exec_params("DELETE FROM accounts WHERE guid = $1", id);
        return result.affected_rows() > 0;
    }

    void lockForUpdate(const std::vector<std::string>& ids) override {
        std::vector<std::string> sorted(ids.begin(), ids.end());
        std::sort(sorted.begin(), sorted.end());
        for (const auto& id : sorted) {
            txn_.exec_params("SELECT guid FROM accounts WHERE guid = $1 FOR UPDATE", id);
        }
    }

    bool applyBalanceDelta(const std::string& id, const domain::Decimal& delta,
                           const domain::Timestamp& at) override
    {
        auto result = txn_.exec_params(
            R"(UPDATE accounts SET current_balance = current_balance + $2::numeric,
                                   updated_at = to_timestamp($3)
               WHERE guid = $1)",
            id, delta.toString(), rows::epochOf(at));
        return result.affected_rows() > 0;
    }

    void setBalance(const std::string& id, const domain::Decimal& balance,
                    const domain::Timestamp& at) override
    {
        txn_.exec_params(
            "UPDATE accounts SET current_balance = $2::numeric, updated_at = to_timestamp($3) WHERE guid = $1",
            id, balance.toString(), rows::epochOf(at));
    }

private:
    static constexpr const char* SELECT_SQL =
        R"(SELECT guid, name, account_type, parent_guid, code, description, hidden, placeholder, is_cash,
                  current_balance::text AS current_balance,
                  EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch,
                  EXTRACT(EPOCH FROM updated_at)::bigint AS updated_epoch
           FROM accounts)";

    pqxx::work& txn_;

    static std::vector<domain::Account> rowsToAccounts(const pqxx::result& result) {
        std::vector<domain::Account> accounts;
        for (const auto& row : result) {
            accounts.push_back(rowToAccount(row));
        }
        return accounts;
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["guid"].as<std::string>();
        account.name = row["name"].as<std::string>();
        account.accountType = row["account_type"].as<std::string>();
        account.parentId = rows::optionalString(row["parent_guid"]);
        account.code = rows::optionalString(row["code"]);
        account.description = rows::optionalString(row["description"]);
        account.hidden = row["hidden"].as<bool>();
        account.placeholder = row["placeholder"].as<bool>();
        account.isCash = row["is_cash"].as<bool>();
        account.currentBalance = rows::decimalOf(row["current_balance"]);
        account.createdAt = rows::timestampOf(row["created_epoch"]);
        account.updatedAt = rows::timestampOf(row["updated_epoch"]);
        return account;
    }
};

// ============================================================================
// Transactions
// ============================================================================

class PostgresTransactionRepository : public ports::output::ITransactionRepository {
public:
    explicit PostgresTransactionRepository(pqxx::work& txn) : txn_(txn) {}

    void save(const domain::Transaction& t) override {
        txn_.exec_params(
            R"(INSERT INTO transactions (guid, num, post_date, enter_date, description, business_type,
                                         reference_no, created_at, updated_at)
               VALUES ($1, $2, $3::date, to_timestamp($4), $5, $6, $7, to_timestamp($8), to_timestamp($9)))",
            t.id, t.num, t.postDate.toString(), rows::epochOf(t.enteredAt), t.description,
            t.businessType, t.referenceNo, rows::epochOf(t.createdAt), rows::epochOf(t.updatedAt));
        insertSplits(t.splits);
    }

    std::optional<domain::Transaction> findById(const std::string& id) override {
        auto result = txn_.exec_params(std::string(SELECT_SQL) + " WHERE guid = $1", id);
        if (result.empty()) return std::nullopt;
        auto transaction = rowToTransaction(result[0]);
        transaction.splits = loadSplits(id);
        return transaction;
    }

    std::vector<domain::Transaction> findRecent(std::size_t limit) override {
        auto result = txn_.exec_params(
            std::string(SELECT_SQL) + " ORDER BY post_date DESC, created_at DESC LIMIT $1",
            static_cast<int64_t>(limit));

        std::vector<domain::Transaction> transactions;
        for (const auto& row : result) {
            auto transaction = rowToTransaction(row);
            transaction.splits = loadSplits(transaction.id);
            transactions.push_back(std::move(transaction));
        }
        return transactions;
    }

    void update(const domain::Transaction& t) override {
        txn_.exec_params(
            R"(UPDATE transactions SET num = $2, post_date = $3::date, description = $4,
                      business_type = $5, reference_no = $6, updated_at = to_timestamp($7)
               WHERE guid = $1)",
            t.id, t.num, t.postDate.toString(), t.description, t.businessType, t.referenceNo,
            rows::epochOf(t.updatedAt));
        txn_.exec_params("DELETE FROM splits WHERE tx_guid = $1", t.id);
        insertSplits(t.splits);
    }

    bool deleteById(const std::string& id) override {
        auto result = txn_.exec_params("DELETE FROM transactions WHERE guid = $1", id);
        return result.affected_rows() > 0;
    }

    bool hasSplitsForAccount(const std::string& accountId) override {
        auto result = txn_.exec_params("SELECT 1 FROM splits WHERE account_guid = $1 LIMIT 1", accountId);
        return !result.empty();
    }

    std::vector<domain::TransactionDetailLine> findDetails(
        const std::optional<std::string>& transactionId,
        std::size_t limit) override
    {
        auto result = txn_.exec_params(
            R"(SELECT t.guid AS tx_guid, t.num, t.post_date::text AS post_date, t.description,
                      t.business_type, t.reference_no,
                      s.guid AS split_guid, s.account_guid, a.name AS account_name,
                      a.account_type, s.value_num, s.value_denom, s.memo,
                      s.cashflow_type_id, c.name AS cashflow_type_name
               FROM splits s
               JOIN transactions t ON t.guid = s.tx_guid
               JOIN accounts a ON a.guid = s.account_guid
               LEFT JOIN cashflow_types c ON c.id = s.cashflow_type_id
               WHERE ($1::varchar IS NULL OR t.guid = $1)
               ORDER BY t.post_date DESC, t.created_at DESC
               LIMIT $2)",
            transactionId, static_cast<int64_t>(limit));

        std::vector<domain::TransactionDetailLine> lines;
        for (const auto& row : result) {
            domain::TransactionDetailLine line;
            line.transactionId = row["tx_guid"].as<std::string>();
            line.transactionNum = rows::optionalString(row["num"]);
            line.postDate = rows::dateOf(row["post_date"]);
            line.description = rows::optionalString(row["description"]);
            line.businessType = rows::optionalString(row["business_type"]);
            line.referenceNo = rows::optionalString(row["reference_no"]);
            line.splitId = row["split_guid"].as<std::string>();
            line.accountId = row["account_guid"].as<std::string>();
            line.accountName = row["account_name"].as<std::string>();
            line.accountType = row["account_type"].as<std::string>();
            line.amount = domain::AmountCodec::fromFraction(row["value_num"].as<int64_t>(),
                                                           row["value_denom"].as<int64_t>());
            line.memo = rows::optionalString(row["memo"]);
            line.cashflowTypeId = rows::optionalInt(row["cashflow_type_id"]);
            line.cashflowTypeName = rows::optionalString(row["cashflow_type_name"]);
            lines.push_back(std::move(line));
        }
        return lines;
    }

private:
    static constexpr const char* SELECT_SQL =
        R"(SELECT guid, num, post_date::text AS post_date, description, business_type, reference_no,
                  EXTRACT(EPOCH FROM enter_date)::bigint AS entered_epoch,
                  EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch,
                  EXTRACT(EPOCH FROM updated_at)::bigint AS updated_epoch
           FROM transactions)";

    pqxx::work& txn_;

    void insertSplits(const std::vector<domain::Split>& splits) {
        for (const auto& s : splits) {
            txn_.exec_params(
                R"(INSERT INTO splits (guid, tx_guid, account_guid, memo, action, reconcile_state,
                                       reconcile_date, value_num, value_denom, cashflow_type_id, created_at)
                   VALUES ($1, $2, $3, $4, $5, $6, $7::date, $8, $9, $10, to_timestamp($11)))",
                s.id, s.transactionId, s.accountId, s.memo, s.action, std::string(1, s.reconcileState),
                rows::optionalText(s.reconcileDate), s.valueNum, s.valueDenom, s.cashflowTypeId,
                rows::epochOf(s.createdAt));
        }
    }

    std::vector<domain::Split> loadSplits(const std::string& transactionId) {
        auto result = txn_.exec_params(
            R"(SELECT guid, tx_guid, account_guid, memo, action, reconcile_state,
                      reconcile_date::text AS reconcile_date, value_num, value_denom, cashflow_type_id,
                      EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch
               FROM splits WHERE tx_guid = $1 ORDER BY created_at, guid)",
            transactionId);

        std::vector<domain::Split> splits;
        for (const auto& row : result) {
            domain::Split split;
            split.id = row["guid"].as<std::string>();
            split.transactionId = row["tx_guid"].as<std::string>();
            split.accountId = row["account_guid"].as<std::string>();
            split.memo = rows::optionalString(row["memo"]);
            split.action = rows::optionalString(row["action"]);
            auto state = row["reconcile_state"].as<std::string>();
            split.reconcileState = state.empty() ? domain::reconcile::NEW : state[0];
            split.reconcileDate = rows::optionalDate(row["reconcile_date"]);
            split.valueNum = row["value_num"].as<int64_t>();
            split.valueDenom = row["value_denom"].as<int64_t>();
            split.cashflowTypeId = rows::optionalInt(row["cashflow_type_id"]);
            split.createdAt = rows::timestampOf(row["created_epoch"]);
            splits.push_back(std::move(split));
        }
        return splits;
    }

    static domain::Transaction rowToTransaction(const pqxx::row& row) {
        domain::Transaction transaction;
        transaction.id = row["guid"].as<std::string>();
        transaction.num = rows::optionalString(row["num"]);
        transaction.postDate = rows::dateOf(row["post_date"]);
        transaction.description = rows::optionalString(row["description"]);
        transaction.businessType = rows::optionalString(row["business_type"]);
        transaction.referenceNo = rows::optionalString(row["reference_no"]);
        transaction.enteredAt = rows::timestampOf(row["entered_epoch"]);
        transaction.createdAt = rows::timestampOf(row["created_epoch"]);
        transaction.updatedAt = rows::timestampOf(row["updated_epoch"]);
        return transaction;
    }
};

// ============================================================================
// Cashflow types
// ============================================================================

class PostgresCashflowTypeRepository : public ports::output::ICashflowTypeRepository {
public:
    explicit PostgresCashflowTypeRepository(pqxx::work& txn) : txn_(txn) {}

    std::vector<domain::CashflowType> findAll(bool activeOnly) override {
        auto result = txn_.exec_params(
            std::string(SELECT_SQL) + " WHERE (NOT $1 OR is_active) ORDER BY sort_order, id", activeOnly);
        std::vector<domain::CashflowType> types;
        for (const auto& row : result) {
            types.push_back(rowToType(row));
        }
        return types;
    }

    std::vector<domain::CashflowType> findByIds(const std::set<int64_t>& ids) override {
        std::vector<domain::CashflowType> types;
        for (auto id : ids) {
            auto result = txn_.exec_params(std::string(SELECT_SQL) + " WHERE id = $1", id);
            if (!result.empty()) {
                types.push_back(rowToType(result[0]));
            }
        }
        return types;
    }

    std::optional<domain::CashflowType> findByCode(const std::string& code) override {
        auto result = txn_.exec_params(std::string(SELECT_SQL) + " WHERE code = $1", code);
        if (result.empty()) return std::nullopt;
        return rowToType(result[0]);
    }

    domain::CashflowType save(const domain::CashflowType& type) override {
        auto result = txn_.exec_params(
            R"(INSERT INTO cashflow_types (code, name, category, flow_type, direction, is_active,
                                           sort_order, created_at)
               VALUES ($1, $2, $3, $4, $5, $6, $7, to_timestamp($8))
               RETURNING id)",
            type.code, type.name, type.category, domain::toString(type.flowType),
            domain::toString(type.direction), type.active, type.sortOrder, rows::epochOf(type.createdAt));

        domain::CashflowType saved = type;
        saved.id = result[0][0].as<int64_t>();
        return saved;
    }

private:
    static constexpr const char* SELECT_SQL =
        R"(SELECT id, code, name, category, flow_type, direction, is_active, sort_order,
                  EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch
           FROM cashflow_types)";

    pqxx::work& txn_;

    static domain::CashflowType rowToType(const pqxx::row& row) {
        domain::CashflowType type;
        type.id = row["id"].as<int64_t>();
        type.code = row["code"].as<std::string>();
        type.name = row["name"].as<std::string>();
        type.category = rows::optionalString(row["category"]);
        type.flowType = domain::flowTypeFromString(row["flow_type"].as<std::string>());
        type.direction = domain::cashflowDirectionFromString(row["direction"].as<std::string>());
        type.active = row["is_active"].as<bool>();
        type.sortOrder = row["sort_order"].as<int>();
        type.createdAt = rows::timestampOf(row["created_epoch"]);
        return type;
    }
};

// ============================================================================
// Business documents
// ============================================================================

class PostgresBusinessDocumentRepository : public ports::output::IBusinessDocumentRepository {
public:
    explicit PostgresBusinessDocumentRepository(pqxx::work& txn) : txn_(txn) {}

    domain::BusinessDocument save(const domain::BusinessDocument& d) override {
        auto result = txn_.exec_params(
            R"(INSERT INTO business_documents (doc_type, doc_no, doc_date, partner_name, reference_no,
                                               description, currency, total_amount, status,
                                               transaction_guid, created_at, updated_at)
               VALUES ($1, $2, $3::date, $4, $5, $6, $7, $8::numeric, $9, $10,
                       to_timestamp($11), to_timestamp($12))
               RETURNING id)",
            domain::toString(d.docType), d.docNo, d.docDate.toString(), d.partnerName, d.referenceNo,
            d.description, d.currency, d.totalAmount.toString(), d.status, d.transactionId,
            rows::epochOf(d.createdAt), rows::epochOf(d.updatedAt));

        domain::BusinessDocument saved = d;
        saved.id = result[0][0].as<int64_t>();

        for (auto& item : saved.items) {
            auto itemResult = txn_.exec_params(
                R"(INSERT INTO business_document_items (document_id, line_no, description, memo,
                                                        debit_account_guid, credit_account_guid,
                                                        quantity, unit_price, amount, cashflow_type_id,
                                                        created_at)
                   VALUES ($1, $2, $3, $4, $5, $6, $7::numeric, $8::numeric, $9::numeric, $10,
                           to_timestamp($11))
                   RETURNING id)",
                saved.id, item.lineNo, item.description, item.memo, item.debitAccountId,
                item.creditAccountId, rows::optionalText(item.quantity), rows::optionalText(item.unitPrice),
                item.amount.toString(), item.cashflowTypeId, rows::epochOf(item.createdAt));
            item.id = itemResult[0][0].as<int64_t>();
            item.documentId = saved.id;
        }
        return saved;
    }

    std::optional<domain::BusinessDocument> findById(int64_t id) override {
        auto result = txn_.exec_params(std::string(SELECT_SQL) + " WHERE id = $1", id);
        if (result.empty()) return std::nullopt;
        auto document = rowToDocument(result[0]);
        document.items = loadItems(document.id);
        return document;
    }

    std::vector<domain::BusinessDocument> findAll(
        const std::optional<domain::BusinessDocumentType>& type,
        std::size_t limit) override
    {
        std::optional<std::string> typeName;
        if (type) {
            typeName = domain::toString(*type);
        }
        auto result = txn_.exec_params(
            std::string(SELECT_SQL) +
                " WHERE ($1::varchar IS NULL OR doc_type = $1) ORDER BY doc_date DESC, id DESC LIMIT $2",
            typeName, static_cast<int64_t>(limit));

        std::vector<domain::BusinessDocument> documents;
        for (const auto& row : result) {
            auto document = rowToDocument(row);
            document.items = loadItems(document.id);
            documents.push_back(std::move(document));
        }
        return documents;
    }

    std::size_t countByTypeAndDate(domain::BusinessDocumentType type, const domain::Date& date) override {
        auto result = txn_.exec_params(
            "SELECT COUNT(*) FROM business_documents WHERE doc_type = $1 AND doc_date = $2::date",
            domain::toString(type), date.toString());
        return static_cast<std::size_t>(result[0][0].as<int64_t>());
    }

    void lockNumbering(domain::BusinessDocumentType type, const domain::Date& date) override {
        txn_.exec_params("SELECT pg_advisory_xact_lock(hashtext($1))",
                         "doc_no:" + domain::toString(type) + ":" + date.toString());
    }

private:
    static constexpr const char* SELECT_SQL =
        R"(SELECT id, doc_type, doc_no, doc_date::text AS doc_date, partner_name, reference_no,
                  description, currency, total_amount::text AS total_amount, status, transaction_guid,
                  EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch,
                  EXTRACT(EPOCH FROM updated_at)::bigint AS updated_epoch
           FROM business_documents)";

    pqxx::work& txn_;

    std::vector<domain::BusinessDocumentItem> loadItems(int64_t documentId) {
        auto result = txn_.exec_params(
            R"(SELECT id, document_id, line_no, description, memo, debit_account_guid, credit_account_guid,
                      quantity::text AS quantity, unit_price::text AS unit_price, amount::text AS amount,
                      cashflow_type_id, EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch
               FROM business_document_items WHERE document_id = $1 ORDER BY line_no, id)",
            documentId);

        std::vector<domain::BusinessDocumentItem> items;
        for (const auto& row : result) {
            domain::BusinessDocumentItem item;
            item.id = row["id"].as<int64_t>();
            item.documentId = row["document_id"].as<int64_t>();
            item.lineNo = row["line_no"].as<int>();
            item.description = rows::optionalString(row["description"]);
            item.memo = rows::optionalString(row["memo"]);
            item.debitAccountId = row["debit_account_guid"].as<std::string>();
            item.creditAccountId = row["credit_account_guid"].as<std::string>();
            item.quantity = rows::optionalDecimal(row["quantity"]);
            item.unitPrice = rows::optionalDecimal(row["unit_price"]);
            item.amount = rows::decimalOf(row["amount"]);
            item.cashflowTypeId = rows::optionalInt(row["cashflow_type_id"]);
            item.createdAt = rows::timestampOf(row["created_epoch"]);
            items.push_back(std::move(item));
        }
        return items;
    }

    static domain::BusinessDocument rowToDocument(const pqxx::row& row) {
        domain::BusinessDocument document;
        document.id = row["id"].as<int64_t>();
        document.docType = domain::businessDocumentTypeFromString(row["doc_type"].as<std::string>());
        document.docNo = row["doc_no"].as<std::string>();
        document.docDate = rows::dateOf(row["doc_date"]);
        document.partnerName = rows::optionalString(row["partner_name"]);
        document.referenceNo = rows::optionalString(row["reference_no"]);
        document.description = rows::optionalString(row["description"]);
        document.currency = row["currency"].as<std::string>();
        document.totalAmount = rows::decimalOf(row["total_amount"]);
        document.status = row["status"].as<std::string>();
        document.transactionId = rows::optionalString(row["transaction_guid"]).value_or("");
        document.createdAt = rows::timestampOf(row["created_epoch"]);
        document.updatedAt = rows::timestampOf(row["updated_epoch"]);
        return document;
    }
};

// ============================================================================
// Fixed expenses
// ============================================================================

class PostgresFixedExpenseRepository : public ports::output::IFixedExpenseRepository {
public:
    explicit PostgresFixedExpenseRepository(pqxx::work& txn) : txn_(txn) {}

    std::vector<domain::FixedExpense> findAll() override {
        auto result = txn_.exec(std::string(SELECT_SQL) + " ORDER BY day_of_month, id");
        std::vector<domain::FixedExpense> expenses;
        for (const auto& row : result) {
            expenses.push_back(rowToExpense(row));
        }
        return expenses;
    }

    std::optional<domain::FixedExpense> findById(int64_t id) override {
        auto result = txn_.exec_params(std::string(SELECT_SQL) + " WHERE id = $1", id);
        if (result.empty()) return std::nullopt;
        return rowToExpense(result[0]);
    }

    domain::FixedExpense save(const domain::FixedExpense& e) override {
        auto result = txn_.exec_params(
            R"(INSERT INTO fixed_expenses (name, amount, expense_account_guid, primary_account_guid,
                                           fallback_account_guid, day_of_month, is_active,
                                           last_run_month, last_run_at, created_at, updated_at)
               VALUES ($1, $2::numeric, $3, $4, $5, $6, $7, $8::date, to_timestamp($9),
                       to_timestamp($10), to_timestamp($11))
               RETURNING id)",
            e.name, e.amount.toString(), e.expenseAccountId, e.primaryAccountId, e.fallbackAccountId,
            e.dayOfMonth, e.active, rows::optionalText(e.lastRunMonth), lastRunEpoch(e),
            rows::epochOf(e.createdAt), rows::epochOf(e.updatedAt));

        domain::FixedExpense saved = e;
        saved.id = result[0][0].as<int64_t>();
        return saved;
    }

    void update(const domain::FixedExpense& e) override {
        txn_.exec_params(
            R"(UPDATE fixed_expenses SET name = $2, amount = $3::numeric, expense_account_guid = $4,
                      primary_account_guid = $5, fallback_account_guid = $6, day_of_month = $7,
                      is_active = $8, last_run_month = $9::date, last_run_at = to_timestamp($10),
                      updated_at = to_timestamp($11)
               WHERE id = $1)",
            e.id, e.name, e.amount.toString(), e.expenseAccountId, e.primaryAccountId,
            e.fallbackAccountId, e.dayOfMonth, e.active, rows::optionalText(e.lastRunMonth),
            lastRunEpoch(e), rows::epochOf(e.updatedAt));
    }

    bool deleteById(int64_t id) override {
        auto result = txn_.exec_params("DELETE FROM fixed_expenses WHERE id = $1", id);
        return result.affected_rows() > 0;
    }

private:
    static constexpr const char* SELECT_SQL =
        R"(SELECT id, name, amount::text AS amount, expense_account_guid, primary_account_guid,
                  fallback_account_guid, day_of_month, is_active, last_run_month::text AS last_run_month,
                  EXTRACT(EPOCH FROM last_run_at)::bigint AS last_run_epoch,
                  EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch,
                  EXTRACT(EPOCH FROM updated_at)::bigint AS updated_epoch
           FROM fixed_expenses)";

    pqxx::work& txn_;

    static std::optional<int64_t> lastRunEpoch(const domain::FixedExpense& e) {
        if (!e.lastRunAt) return std::nullopt;
        return rows::epochOf(*e.lastRunAt);
    }

    static domain::FixedExpense rowToExpense(const pqxx::row& row) {
        domain::FixedExpense expense;
        expense.id = row["id"].as<int64_t>();
        expense.name = row["name"].as<std::string>();
        expense.amount = rows::decimalOf(row["amount"]);
        expense.expenseAccountId = row["expense_account_guid"].as<std::string>();
        expense.primaryAccountId = rows::optionalString(row["primary_account_guid"]);
        expense.fallbackAccountId = rows::optionalString(row["fallback_account_guid"]);
        expense.dayOfMonth = row["day_of_month"].as<int>();
        expense.active = row["is_active"].as<bool>();
        expense.lastRunMonth = rows::optionalDate(row["last_run_month"]);
        expense.lastRunAt = rows::optionalTimestamp(row["last_run_epoch"]);
        expense.createdAt = rows::timestampOf(row["created_epoch"]);
        expense.updatedAt = rows::timestampOf(row["updated_epoch"]);
        return expense;
    }
};

// ============================================================================
// Monthly reports
// ============================================================================

class PostgresMonthlyReportRepository : public ports::output::IMonthlyReportRepository {
public:
    explicit PostgresMonthlyReportRepository(pqxx::work& txn) : txn_(txn) {}

    std::vector<domain::MonthlyReportRecord> findByMonth(const domain::Date& month) override {
        auto result = txn_.exec_params(
            R"(SELECT id, report_month::text AS report_month, report_type, payload,
                      EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch
               FROM monthly_reports WHERE report_month = $1::date)",
            month.toString());

        std::vector<domain::MonthlyReportRecord> records;
        for (const auto& row : result) {
            domain::MonthlyReportRecord record;
            record.id = row["id"].as<int64_t>();
            record.reportMonth = rows::dateOf(row["report_month"]);
            record.reportType = domain::reportTypeFromString(row["report_type"].as<std::string>());
            record.payload = row["payload"].as<std::string>();
            record.createdAt = rows::timestampOf(row["created_epoch"]);
            records.push_back(std::move(record));
        }
        return records;
    }

    void replaceMonth(const domain::Date& month,
                      const std::vector<domain::MonthlyReportRecord>& records) override
    {
        deleteMonth(month);
        for (const auto& record : records) {
            txn_.exec_params(
                R"(INSERT INTO monthly_reports (report_month, report_type, payload, created_at)
                   VALUES ($1::date, $2, $3, to_timestamp($4)))",
                month.toString(), domain::toString(record.reportType), record.payload,
                rows::epochOf(record.createdAt));
        }
    }

    std::vector<domain::Date> findMonths() override {
        auto result = txn_.exec(
            "SELECT DISTINCT report_month::text AS report_month FROM monthly_reports ORDER BY report_month DESC");
        std::vector<domain::Date> months;
        for (const auto& row : result) {
            months.push_back(rows::dateOf(row["report_month"]));
        }
        return months;
    }

    void deleteMonth(const domain::Date& month) override {
        txn_.exec_params("DELETE FROM monthly_reports WHERE report_month = $1::date", month.toString());
    }

private:
    pqxx::work& txn_;
};

// ============================================================================
// Report queries
// ============================================================================

class PostgresLedgerQueryRepository : public ports::output::ILedgerQueryRepository {
public:
    explicit PostgresLedgerQueryRepository(pqxx::work& txn) : txn_(txn) {}

    std::unordered_map<std::string, domain::Decimal> sumByAccountUpTo(const domain::Date& date) override {
        return toMap(txn_.exec_params(
            std::string("SELECT s.account_guid, SUM(") + SPLIT_AMOUNT_SQL + ")::text AS total "
            "FROM splits s JOIN transactions t ON t.guid = s.tx_guid "
            "WHERE t.post_date <= $1::date GROUP BY s.account_guid",
            date.toString()));
    }

    std::unordered_map<std::string, domain::Decimal> sumByAccountBetween(
        const domain::Date& start, const domain::Date& end) override
    {
        return toMap(txn_.exec_params(
            std::string("SELECT s.account_guid, SUM(") + SPLIT_AMOUNT_SQL + ")::text AS total "
            "FROM splits s JOIN transactions t ON t.guid = s.tx_guid "
            "WHERE t.post_date >= $1::date AND t.post_date <= $2::date GROUP BY s.account_guid",
            start.toString(), end.toString()));
    }

    std::unordered_map<std::string, domain::Decimal> sumByAccount() override {
        return toMap(txn_.exec(
            std::string("SELECT s.account_guid, SUM(") + SPLIT_AMOUNT_SQL + ")::text AS total "
            "FROM splits s GROUP BY s.account_guid"));
    }

    std::vector<ports::output::CashflowTypeTotal> cashflowTotalsBetween(
        const domain::Date& start, const domain::Date& end) override
    {
        auto result = txn_.exec_params(
            std::string("SELECT c.id, c.name, c.flow_type, c.direction, c.sort_order, SUM(") +
                SPLIT_AMOUNT_SQL + ")::text AS total "
            "FROM cashflow_types c "
            "JOIN splits s ON s.cashflow_type_id = c.id "
            "JOIN transactions t ON t.guid = s.tx_guid "
            "WHERE t.post_date >= $1::date AND t.post_date <= $2::date "
            "GROUP BY c.id, c.name, c.flow_type, c.direction, c.sort_order "
            "ORDER BY c.sort_order, c.id",
            start.toString(), end.toString());

        std::vector<ports::output::CashflowTypeTotal> totals;
        for (const auto& row : result) {
            ports::output::CashflowTypeTotal total;
            total.cashflowTypeId = row["id"].as<int64_t>();
            total.name = row["name"].as<std::string>();
            total.flowType = domain::flowTypeFromString(row["flow_type"].as<std::string>());
            total.direction = domain::cashflowDirectionFromString(row["direction"].as<std::string>());
            total.sortOrder = row["sort_order"].as<int>();
            total.amount = rows::decimalOf(row["total"]);
            totals.push_back(std::move(total));
        }
        return totals;
    }

private:
    pqxx::work& txn_;

    static std::unordered_map<std::string, domain::Decimal> toMap(const pqxx::result& result) {
        std::unordered_map<std::string, domain::Decimal> sums;
        for (const auto& row : result) {
            sums[row["account_guid"].as<std::string>()] = rows::decimalOf(row["total"]);
        }
        return sums;
    }
};

} // namespace bookkeeping::adapters::secondary::postgres
