#pragma once

#include "enums/ReportType.hpp"
#include "statements/BalanceSheet.hpp"
#include "statements/IncomeStatement.hpp"
#include "statements/CashflowStatement.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include <string>

namespace bookkeeping::domain {

/**
 * @brief Строка кеша месячных отчётов
 *
 * Ключ: (reportMonth, reportType). payload: JSON-снимок отчёта, который
 * восстанавливается целиком и не предназначен для запросов.
 */
struct MonthlyReportRecord {
    int64_t id = 0;
    Date reportMonth;                ///< Первое число месяца
    ReportType reportType = ReportType::BALANCE_SHEET;
    std::string payload;
    Timestamp createdAt;
};

/**
 * @brief Три отчёта за прошедший месяц
 */
struct MonthlySnapshot {
    Date month;
    BalanceSheet balanceSheet;
    IncomeStatement incomeStatement;
    CashflowStatement cashflowStatement;
    bool fromCache = false;
};

/**
 * @brief Политика хранения месячных снимков
 *
 * keepLastMonths = 0: хранить все месяцы.
 * keepLastMonths = 1: единственный слот (новый месяц вытесняет остальные).
 */
struct ReportRetentionPolicy {
    unsigned keepLastMonths = 1;

    bool keepAll() const { return keepLastMonths == 0; }
};

} // namespace bookkeeping::domain
