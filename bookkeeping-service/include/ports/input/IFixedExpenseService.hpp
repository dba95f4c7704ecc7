#pragma once

#include "domain/FixedExpense.hpp"
#include <vector>

namespace bookkeeping::ports::input {

/**
 * @brief Интерфейс планировщика фиксированных расходов
 */
class IFixedExpenseService {
public:
    virtual ~IFixedExpenseService() = default;

    virtual std::vector<domain::FixedExpense> listFixedExpenses() = 0;
    virtual domain::FixedExpense getFixedExpense(int64_t id) = 0;
    virtual domain::FixedExpense createFixedExpense(const domain::FixedExpenseRequest& request) = 0;
    virtual domain::FixedExpense updateFixedExpense(int64_t id, const domain::FixedExpenseRequest& request) = 0;
    virtual void deleteFixedExpense(int64_t id) = 0;

    /**
     * @brief Наступил ли срок списания в месяце даты date
     */
    virtual bool isDue(const domain::FixedExpense& expense, const domain::Date& date) const = 0;

    /**
     * @brief Выполнить списание одного расхода
     *
     * @param force Игнорировать срок (но не признак активности)
     */
    virtual domain::FixedExpenseRunResult execute(int64_t expenseId,
                                                  const domain::Date& runDate,
                                                  bool force = false) = 0;

    /**
     * @brief Выполнить все активные расходы, срок которых наступил
     */
    virtual std::vector<domain::FixedExpenseRunResult> executeAllDue(const domain::Date& runDate) = 0;
};

} // namespace bookkeeping::ports::input
