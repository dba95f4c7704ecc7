#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace bookkeeping::domain {

/**
 * @brief Счёт плана счетов
 *
 * Счета образуют лес через parentId. currentBalance хранит сальдо со знаком
 * (дебет положительный) и меняется только леджером через дельты.
 */
struct Account {
    std::string id;                         ///< GUID (32 hex)
    std::string name;                       ///< Уникальное название
    std::string accountType;                ///< Тип из плана счетов ("CASH", "REVENUE", ...)
    std::optional<std::string> parentId;    ///< Родительский счёт
    std::optional<std::string> code;        ///< Код счёта ("1001")
    std::optional<std::string> description; ///< Описание
    bool hidden = false;                    ///< Скрыт из списков и отчётов
    bool placeholder = false;               ///< Группирующий узел
    bool isCash = false;                    ///< Денежный счёт: проводкам нужен вид денежного потока
    Decimal currentBalance;                 ///< Текущее сальдо
    Timestamp createdAt;
    Timestamp updatedAt;

    Account() = default;

    Account(
        const std::string& id,
        const std::string& name,
        const std::string& accountType,
        std::optional<std::string> parentId = std::nullopt
    ) : id(id), name(name), accountType(accountType), parentId(std::move(parentId)),
        createdAt(Timestamp::now()), updatedAt(createdAt) {}
};

/**
 * @brief Сальдо счёта: кешированное и пересчитанное по проводкам
 */
struct AccountBalance {
    std::string accountId;
    std::string accountName;
    std::string accountType;
    Decimal cachedBalance;   ///< accounts.current_balance
    Decimal derivedBalance;  ///< Сумма проводок
    bool drift = false;      ///< cachedBalance != derivedBalance
};

} // namespace bookkeeping::domain
