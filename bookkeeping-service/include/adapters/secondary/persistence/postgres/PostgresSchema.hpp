#pragma once

#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>

namespace bookkeeping::adapters::secondary::postgres {

/**
 * @brief Создание схемы леджера (CREATE TABLE IF NOT EXISTS)
 *
 * Суммы проводок хранятся дробью BIGINT value_num / value_denom, сальдо и
 * суммы документов: NUMERIC(20, 6).
 */
class PostgresSchema {
public:
    static void init(const settings::DbSettings& settings) {
        pqxx::connection connection(settings.getConnectionString());
        pqxx::work txn(connection);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS accounts (
                guid VARCHAR(32) PRIMARY KEY,
                name VARCHAR(255) NOT NULL UNIQUE,
                account_type VARCHAR(50) NOT NULL,
                parent_guid VARCHAR(32) REFERENCES accounts(guid),
                code VARCHAR(50),
                description TEXT,
                hidden BOOLEAN NOT NULL DEFAULT FALSE,
                placeholder BOOLEAN NOT NULL DEFAULT FALSE,
                is_cash BOOLEAN NOT NULL DEFAULT FALSE,
                current_balance NUMERIC(20, 6) NOT NULL DEFAULT 0,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS cashflow_types (
                id BIGSERIAL PRIMARY KEY,
                code VARCHAR(50) NOT NULL UNIQUE,
                name VARCHAR(255) NOT NULL,
                category VARCHAR(100),
                flow_type VARCHAR(20) NOT NULL,
                direction VARCHAR(10) NOT NULL,
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                sort_order INTEGER NOT NULL DEFAULT 100,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS transactions (
                guid VARCHAR(32) PRIMARY KEY,
                num VARCHAR(50),
                post_date DATE NOT NULL,
                enter_date TIMESTAMPTZ NOT NULL,
                description TEXT,
                business_type VARCHAR(50),
                reference_no VARCHAR(100),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS splits (
                guid VARCHAR(32) PRIMARY KEY,
                tx_guid VARCHAR(32) NOT NULL REFERENCES transactions(guid) ON DELETE CASCADE,
                account_guid VARCHAR(32) NOT NULL REFERENCES accounts(guid),
                memo TEXT,
                action VARCHAR(50),
                reconcile_state CHAR(1) NOT NULL DEFAULT 'n',
                reconcile_date DATE,
                value_num BIGINT NOT NULL,
                value_denom BIGINT NOT NULL,
                cashflow_type_id BIGINT REFERENCES cashflow_types(id),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_splits_tx ON splits(tx_guid)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_splits_account ON splits(account_guid)");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS business_documents (
                id BIGSERIAL PRIMARY KEY,
                doc_type VARCHAR(20) NOT NULL,
                doc_no VARCHAR(50) NOT NULL,
                doc_date DATE NOT NULL,
                partner_name VARCHAR(255),
                reference_no VARCHAR(100),
                description TEXT,
                currency VARCHAR(10) NOT NULL DEFAULT 'CNY',
                total_amount NUMERIC(20, 6) NOT NULL,
                status VARCHAR(20) NOT NULL DEFAULT 'POSTED',
                transaction_guid VARCHAR(32) REFERENCES transactions(guid),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS business_document_items (
                id BIGSERIAL PRIMARY KEY,
                document_id BIGINT NOT NULL REFERENCES business_documents(id) ON DELETE CASCADE,
                line_no INTEGER NOT NULL,
                description TEXT,
                memo TEXT,
                debit_account_guid VARCHAR(32) NOT NULL REFERENCES accounts(guid),
                credit_account_guid VARCHAR(32) NOT NULL REFERENCES accounts(guid),
                quantity NUMERIC(20, 6),
                unit_price NUMERIC(20, 6),
                amount NUMERIC(20, 6) NOT NULL,
                cashflow_type_id BIGINT REFERENCES cashflow_types(id),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS fixed_expenses (
                id BIGSERIAL PRIMARY KEY,
                name VARCHAR(255) NOT NULL,
                amount NUMERIC(20, 6) NOT NULL,
                expense_account_guid VARCHAR(32) NOT NULL REFERENCES accounts(guid),
                primary_account_guid VARCHAR(32) REFERENCES accounts(guid),
                fallback_account_guid VARCHAR(32) REFERENCES accounts(guid),
                day_of_month INTEGER NOT NULL DEFAULT 1,
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                last_run_month DATE,
                last_run_at TIMESTAMPTZ,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS monthly_reports (
                id BIGSERIAL PRIMARY KEY,
                report_month DATE NOT NULL,
                report_type VARCHAR(50) NOT NULL,
                payload TEXT NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                UNIQUE (report_month, report_type)
            )
        )");

        txn.commit();
        std::cout << "[PostgresSchema] Schema ready in " << settings.describe() << std::endl;
    }
};

} // namespace bookkeeping::adapters::secondary::postgres
