// include/settings/LedgerSettings.hpp
#pragma once

#include "domain/MonthlyReport.hpp"
#include <string>
#include <cstdlib>
#include <stdexcept>

namespace bookkeeping::settings
{

    /**
     * @brief Настройки леджера
     *
     * LEDGER_STORAGE                  postgres | memory
     * LEDGER_REPORT_RETENTION_MONTHS  сколько месяцев снимков хранить (0 = все)
     * LEDGER_TRANSACTION_LIST_LIMIT   размер страницы списка транзакций
     */
    class LedgerSettings
    {
    public:
        LedgerSettings()
        {
            storage_ = getEnvOrDefault("LEDGER_STORAGE", "postgres");
            if (storage_ != "postgres" && storage_ != "memory") {
                throw std::invalid_argument("LEDGER_STORAGE must be 'postgres' or 'memory', got: " + storage_);
            }

            int retention = std::stoi(getEnvOrDefault("LEDGER_REPORT_RETENTION_MONTHS", "1"));
            if (retention < 0) {
                throw std::invalid_argument("LEDGER_REPORT_RETENTION_MONTHS must be >= 0");
            }
            retention_.keepLastMonths = static_cast<unsigned>(retention);

            int limit = std::stoi(getEnvOrDefault("LEDGER_TRANSACTION_LIST_LIMIT", "50"));
            if (limit <= 0) {
                throw std::invalid_argument("LEDGER_TRANSACTION_LIST_LIMIT must be > 0");
            }
            transactionListLimit_ = static_cast<std::size_t>(limit);
        }

        std::string getStorage() const { return storage_; }
        bool useInMemoryStorage() const { return storage_ == "memory"; }
        domain::ReportRetentionPolicy getRetentionPolicy() const { return retention_; }
        std::size_t getTransactionListLimit() const { return transactionListLimit_; }

    private:
        std::string storage_;
        domain::ReportRetentionPolicy retention_;
        std::size_t transactionListLimit_ = 50;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace bookkeeping::settings
