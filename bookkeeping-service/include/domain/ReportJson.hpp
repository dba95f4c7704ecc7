#pragma once

#include "statements/BalanceSheet.hpp"
#include "statements/IncomeStatement.hpp"
#include "statements/CashflowStatement.hpp"
#include <nlohmann/json.hpp>

namespace bookkeeping::domain {

/**
 * @brief Сериализация отчётов для кеша месячных снимков
 *
 * Суммы пишутся строками ("1234.50"), даты в формате "YYYY-MM-DD",
 * чтобы восстановленный отчёт совпадал с исходным до последнего знака.
 *
 * @throws nlohmann::json::exception / std::invalid_argument при разборе
 *         повреждённого payload
 */
nlohmann::json toJson(const BalanceSheet& sheet);
nlohmann::json toJson(const IncomeStatement& statement);
nlohmann::json toJson(const CashflowStatement& statement);

BalanceSheet balanceSheetFromJson(const nlohmann::json& j);
IncomeStatement incomeStatementFromJson(const nlohmann::json& j);
CashflowStatement cashflowStatementFromJson(const nlohmann::json& j);

} // namespace bookkeeping::domain
