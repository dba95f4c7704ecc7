#pragma once

#include "AmountCodec.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bookkeeping::domain {

/**
 * @brief Состояние сверки проводки
 */
namespace reconcile {
    inline constexpr char NEW = 'n';
    inline constexpr char CLEARED = 'c';
    inline constexpr char RECONCILED = 'y';
}

/**
 * @brief Проводка (одна строка транзакции)
 *
 * Сумма хранится дробью valueNum / valueDenom; дебет положительный, кредит отрицательный.
 */
struct Split {
    std::string id;
    std::string transactionId;
    std::string accountId;
    int64_t valueNum = 0;
    int64_t valueDenom = 1;
    std::optional<std::string> memo;
    std::optional<std::string> action;
    char reconcileState = reconcile::NEW;
    std::optional<Date> reconcileDate;
    std::optional<int64_t> cashflowTypeId;
    Timestamp createdAt;

    Decimal amount() const {
        return AmountCodec::fromFraction(valueNum, valueDenom);
    }
};

/**
 * @brief Транзакция (бухгалтерская запись)
 *
 * Владеет своими проводками: удаление транзакции удаляет все проводки.
 * Сумма проводок всегда равна нулю.
 */
struct Transaction {
    std::string id;
    std::optional<std::string> num;           ///< Номер (номер документа-основания)
    Date postDate;                            ///< Дата проводки
    Timestamp enteredAt;                      ///< Момент ввода
    std::optional<std::string> description;
    std::optional<std::string> businessType;  ///< "SALE", "EXPENSE", ...
    std::optional<std::string> referenceNo;   ///< Внешний номер
    Timestamp createdAt;
    Timestamp updatedAt;
    std::vector<Split> splits;
};

/**
 * @brief Строка детализации транзакции
 *
 * Только для чтения: денормализует имена счёта и статьи ДДС.
 * Источником истины для сальдо не является.
 */
struct TransactionDetailLine {
    std::string transactionId;
    std::optional<std::string> transactionNum;
    Date postDate;
    std::optional<std::string> description;
    std::optional<std::string> businessType;
    std::optional<std::string> referenceNo;
    std::string splitId;
    std::string accountId;
    std::string accountName;
    std::string accountType;
    Decimal amount;
    std::optional<std::string> memo;
    std::optional<int64_t> cashflowTypeId;
    std::optional<std::string> cashflowTypeName;
};

} // namespace bookkeeping::domain
