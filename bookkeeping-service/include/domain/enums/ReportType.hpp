#pragma once

#include <array>
#include <string>
#include <stdexcept>

namespace bookkeeping::domain {

/**
 * @brief Тип отчёта в месячном снимке
 */
enum class ReportType {
    BALANCE_SHEET,
    INCOME_STATEMENT,
    CASHFLOW_STATEMENT
};

/**
 * @brief Все типы, которые должен содержать полный снимок месяца
 */
inline constexpr std::array<ReportType, 3> ALL_REPORT_TYPES = {
    ReportType::BALANCE_SHEET,
    ReportType::INCOME_STATEMENT,
    ReportType::CASHFLOW_STATEMENT
};

inline std::string toString(ReportType type) {
    switch (type) {
        case ReportType::BALANCE_SHEET:      return "balance_sheet";
        case ReportType::INCOME_STATEMENT:   return "income_statement";
        case ReportType::CASHFLOW_STATEMENT: return "cashflow_statement";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ReportType reportTypeFromString(const std::string& str) {
    if (str == "balance_sheet")      return ReportType::BALANCE_SHEET;
    if (str == "income_statement")   return ReportType::INCOME_STATEMENT;
    if (str == "cashflow_statement") return ReportType::CASHFLOW_STATEMENT;
    throw std::invalid_argument("Unknown ReportType: " + str);
}

} // namespace bookkeeping::domain
