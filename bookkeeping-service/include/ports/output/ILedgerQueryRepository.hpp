#pragma once

#include "domain/enums/FlowType.hpp"
#include "domain/enums/CashflowDirection.hpp"
#include "domain/Decimal.hpp"
#include "domain/Date.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace bookkeeping::ports::output {

/**
 * @brief Оборот по статье ДДС за период
 */
struct CashflowTypeTotal {
    int64_t cashflowTypeId = 0;
    std::string name;
    domain::FlowType flowType = domain::FlowType::OPERATING;
    domain::CashflowDirection direction = domain::CashflowDirection::INFLOW;
    int sortOrder = 100;
    domain::Decimal amount;          ///< Сумма проводок со знаком
};

/**
 * @brief Агрегирующие запросы к истории проводок для отчётности
 *
 * Считаются по проводкам, а не по accounts.current_balance: отчёты не зависят
 * от кешированного сальдо.
 */
class ILedgerQueryRepository {
public:
    virtual ~ILedgerQueryRepository() = default;

    /**
     * @brief Сумма проводок по счетам с датой проводки <= date
     */
    virtual std::unordered_map<std::string, domain::Decimal> sumByAccountUpTo(const domain::Date& date) = 0;

    /**
     * @brief Сумма проводок по счетам с датой проводки в [start, end]
     */
    virtual std::unordered_map<std::string, domain::Decimal> sumByAccountBetween(
        const domain::Date& start, const domain::Date& end) = 0;

    /**
     * @brief Сумма всех проводок по счетам
     */
    virtual std::unordered_map<std::string, domain::Decimal> sumByAccount() = 0;

    /**
     * @brief Обороты по статьям ДДС за [start, end], по sort_order, затем id
     *
     * Проводки без статьи не учитываются.
     */
    virtual std::vector<CashflowTypeTotal> cashflowTotalsBetween(
        const domain::Date& start, const domain::Date& end) = 0;
};

} // namespace bookkeeping::ports::output
