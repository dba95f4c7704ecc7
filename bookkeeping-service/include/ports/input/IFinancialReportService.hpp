#pragma once

#include "domain/statements/BalanceSheet.hpp"
#include "domain/statements/IncomeStatement.hpp"
#include "domain/statements/CashflowStatement.hpp"
#include "domain/Date.hpp"
#include <optional>

namespace bookkeeping::ports::input {

/**
 * @brief Интерфейс финансовой отчётности
 *
 * Отчёты строятся по истории проводок на момент запроса.
 */
class IFinancialReportService {
public:
    virtual ~IFinancialReportService() = default;

    virtual domain::BalanceSheet balanceSheet(const domain::Date& reportDate,
                                              bool includeChildren = true) = 0;

    /**
     * @param startDate По умолчанию 1 января года endDate
     * @param endDate По умолчанию сегодня
     */
    virtual domain::IncomeStatement incomeStatement(const std::optional<domain::Date>& startDate,
                                                    const std::optional<domain::Date>& endDate,
                                                    bool includeChildren = true) = 0;

    virtual domain::CashflowStatement cashflowStatement(const std::optional<domain::Date>& startDate,
                                                        const std::optional<domain::Date>& endDate) = 0;

    virtual domain::BalanceSheet currentBalanceSheet() = 0;
    virtual domain::IncomeStatement currentIncomeStatement() = 0;
    virtual domain::CashflowStatement currentCashflowStatement() = 0;
};

} // namespace bookkeeping::ports::input
