#pragma once

#include "enums/FlowType.hpp"
#include "enums/CashflowDirection.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace bookkeeping::domain {

/**
 * @brief Статья движения денежных средств
 *
 * Проводки по денежным счетам помечаются статьёй, чтобы отчёт о движении
 * денежных средств мог разнести их по видам деятельности.
 */
struct CashflowType {
    int64_t id = 0;
    std::string code;                   ///< Уникальный код ("OP-IN-01")
    std::string name;                   ///< "Поступления от покупателей"
    std::optional<std::string> category;
    FlowType flowType = FlowType::OPERATING;
    CashflowDirection direction = CashflowDirection::INFLOW;
    bool active = true;
    int sortOrder = 100;
    Timestamp createdAt;
};

/**
 * @brief Запрос на создание статьи
 */
struct CreateCashflowTypeRequest {
    std::string code;
    std::string name;
    std::optional<std::string> category;
    FlowType flowType = FlowType::OPERATING;
    CashflowDirection direction = CashflowDirection::INFLOW;
    bool active = true;
    int sortOrder = 100;
};

} // namespace bookkeeping::domain
