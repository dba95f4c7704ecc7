/**
 * @file LedgerSettingsTest.cpp
 * @brief Tests for environment-based settings
 */

#include <gtest/gtest.h>
#include "settings/LedgerSettings.hpp"
#include "settings/DbSettings.hpp"
#include <cstdlib>

using namespace bookkeeping::settings;

class LedgerSettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        unsetenv("LEDGER_STORAGE");
        unsetenv("LEDGER_REPORT_RETENTION_MONTHS");
        unsetenv("LEDGER_TRANSACTION_LIST_LIMIT");
        unsetenv("LEDGER_DB_HOST");
        unsetenv("LEDGER_DB_PORT");
        unsetenv("LEDGER_DB_CONNECT_TIMEOUT");
        unsetenv("LEDGER_DATABASE_URL");
    }
};

TEST_F(LedgerSettingsTest, Defaults) {
    LedgerSettings settings;
    EXPECT_EQ(settings.getStorage(), "postgres");
    EXPECT_FALSE(settings.useInMemoryStorage());
    EXPECT_EQ(settings.getRetentionPolicy().keepLastMonths, 1u);
    EXPECT_EQ(settings.getTransactionListLimit(), 50u);
}

TEST_F(LedgerSettingsTest, MemoryStorage_And_KeepAll) {
    setenv("LEDGER_STORAGE", "memory", 1);
    setenv("LEDGER_REPORT_RETENTION_MONTHS", "0", 1);

    LedgerSettings settings;
    EXPECT_TRUE(settings.useInMemoryStorage());
    EXPECT_TRUE(settings.getRetentionPolicy().keepAll());
}

TEST_F(LedgerSettingsTest, InvalidValues_Throw) {
    setenv("LEDGER_STORAGE", "sqlite", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);

    setenv("LEDGER_STORAGE", "memory", 1);
    setenv("LEDGER_TRANSACTION_LIST_LIMIT", "0", 1);
    EXPECT_THROW(LedgerSettings{}, std::invalid_argument);
}

TEST_F(LedgerSettingsTest, DbSettings_ConnectionString) {
    setenv("LEDGER_DB_HOST", "localhost", 1);
    setenv("LEDGER_DB_PORT", "6543", 1);

    DbSettings settings;
    EXPECT_EQ(settings.getConnectionString(),
              "host=localhost port=6543 dbname=ledger_db user=ledger_user password=ledger_secret_password"
              " connect_timeout=10");
    EXPECT_EQ(settings.describe(), "ledger_user@localhost:6543/ledger_db");
}

TEST_F(LedgerSettingsTest, DbSettings_UrlOverridesParts) {
    setenv("LEDGER_DB_HOST", "localhost", 1);
    setenv("LEDGER_DATABASE_URL", "postgresql://books@db.internal/ledger", 1);

    DbSettings settings;
    EXPECT_EQ(settings.getConnectionString(), "postgresql://books@db.internal/ledger");
    EXPECT_EQ(settings.describe(), "LEDGER_DATABASE_URL");
}

TEST_F(LedgerSettingsTest, DbSettings_NegativeTimeout_Throws) {
    setenv("LEDGER_DB_CONNECT_TIMEOUT", "-1", 1);
    EXPECT_THROW(DbSettings{}, std::invalid_argument);
}
