#pragma once

#include "Decimal.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bookkeeping::domain {

/**
 * @brief Ежемесячный фиксированный расход (аренда, подписки, связь)
 *
 * lastRunMonth (первое число месяца) гарантирует не более одного списания за
 * календарный месяц.
 */
struct FixedExpense {
    int64_t id = 0;
    std::string name;
    Decimal amount;
    std::string expenseAccountId;                 ///< Дебет: счёт расходов
    std::optional<std::string> primaryAccountId;  ///< Кредит: основной источник (касса)
    std::optional<std::string> fallbackAccountId; ///< Кредит: запасной источник (банк)
    int dayOfMonth = 1;                           ///< 1..31, в коротком месяце сдвигается на последний день
    bool active = true;
    std::optional<Date> lastRunMonth;
    std::optional<Timestamp> lastRunAt;
    Timestamp createdAt;
    Timestamp updatedAt;
};

/**
 * @brief Запрос на создание/замену фиксированного расхода
 */
struct FixedExpenseRequest {
    std::string name;
    Decimal amount;
    std::string expenseAccountId;
    std::optional<std::string> primaryAccountId;
    std::optional<std::string> fallbackAccountId;
    int dayOfMonth = 1;
    bool active = true;
};

/**
 * @brief Результат одного запуска списания
 *
 * transactionId пуст, если списание не выполнено; warnings объясняют почему,
 * либо сообщают о нехватке средств (списание при этом выполнено).
 */
struct FixedExpenseRunResult {
    int64_t expenseId = 0;
    std::string expenseName;
    std::optional<std::string> transactionId;
    std::vector<std::string> warnings;

    bool executed() const { return transactionId.has_value(); }
};

} // namespace bookkeeping::domain
