#pragma once

#include "Decimal.hpp"
#include "Date.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bookkeeping::domain {

/**
 * @brief Проводка во входных данных транзакции
 */
struct SplitRequest {
    std::string accountId;
    Decimal amount;                          ///< Дебет > 0, кредит < 0
    std::optional<std::string> memo;
    std::optional<int64_t> cashflowTypeId;
};

/**
 * @brief Входные данные для проведения/изменения транзакции
 */
struct TransactionRequest {
    Date postDate;
    std::optional<std::string> num;
    std::optional<std::string> description;
    std::optional<std::string> businessType;
    std::optional<std::string> referenceNo;
    std::vector<SplitRequest> splits;        ///< Минимум две, сумма = 0
};

} // namespace bookkeeping::domain
