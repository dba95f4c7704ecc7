#pragma once

#include "domain/enums/CashflowDirection.hpp"
#include "domain/Decimal.hpp"
#include "domain/Date.hpp"
#include <string>
#include <vector>

namespace bookkeeping::domain {

/**
 * @brief Строка ОДДС: оборот по одной статье за период (по модулю)
 */
struct CashflowLine {
    int64_t cashflowTypeId = 0;
    std::string categoryName;
    CashflowDirection direction = CashflowDirection::INFLOW;
    Decimal amount;
};

/**
 * @brief Раздел ОДДС (операционная / инвестиционная / финансовая деятельность)
 */
struct CashflowSection {
    std::vector<CashflowLine> items;
    Decimal inflow;
    Decimal outflow;
    Decimal net;                     ///< inflow - outflow
};

/**
 * @brief Отчёт о движении денежных средств за период
 */
struct CashflowStatement {
    Date startDate;
    Date endDate;
    CashflowSection operating;
    CashflowSection investing;
    CashflowSection financing;
    Decimal totalNet;
};

} // namespace bookkeeping::domain
