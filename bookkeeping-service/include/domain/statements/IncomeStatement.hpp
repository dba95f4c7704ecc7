#pragma once

#include "ReportLine.hpp"
#include "domain/Date.hpp"
#include <vector>

namespace bookkeeping::domain {

/**
 * @brief Отчёт о прибылях и убытках за период [startDate, endDate]
 */
struct IncomeStatement {
    Date startDate;
    Date endDate;
    std::vector<ReportLine> revenues;
    std::vector<ReportLine> expenses;
    Decimal revenueTotal;
    Decimal expenseTotal;
    Decimal netIncome;               ///< revenueTotal - expenseTotal
};

} // namespace bookkeeping::domain
