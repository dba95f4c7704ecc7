#pragma once

#include "ReportLine.hpp"
#include "domain/Date.hpp"
#include <vector>

namespace bookkeeping::domain {

/**
 * @brief Бухгалтерский баланс на дату
 *
 * Итоги обязательств и капитала приведены к положительному виду
 * (в леджере у них кредитовое, отрицательное сальдо).
 *
 * Проверка: assetTotal == liabilityTotal + equityWithIncome (допуск 0.01).
 * Дисбаланс не исключение, а флаг isBalanced: исторические данные могут быть
 * неидеальны, отчёт всё равно должен строиться.
 */
struct BalanceSheet {
    Date reportDate;
    std::vector<ReportLine> assets;
    std::vector<ReportLine> liabilities;
    std::vector<ReportLine> equity;
    Decimal assetTotal;
    Decimal liabilityTotal;
    Decimal equityTotal;
    Decimal netIncome;               ///< Нераспределённая прибыль на дату
    Decimal equityWithIncome;
    Decimal totalLiabilityEquity;
    bool isBalanced = true;
};

} // namespace bookkeeping::domain
