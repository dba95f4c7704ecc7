#pragma once

#include "enums/BusinessDocumentType.hpp"
#include "Decimal.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bookkeeping::domain {

/**
 * @brief Строка хозяйственного документа: пара дебет/кредит и сумма
 */
struct BusinessDocumentItem {
    int64_t id = 0;
    int64_t documentId = 0;
    int lineNo = 0;
    std::optional<std::string> description;
    std::optional<std::string> memo;
    std::string debitAccountId;
    std::string creditAccountId;
    std::optional<Decimal> quantity;
    std::optional<Decimal> unitPrice;
    Decimal amount;                          ///< Всегда > 0
    std::optional<int64_t> cashflowTypeId;
    Timestamp createdAt;
};

/**
 * @brief Хозяйственный документ (продажа, закупка, расход, движение денег)
 *
 * Каждый документ порождает ровно одну транзакцию: N строк -> 2N проводок.
 * После проведения документ не изменяется.
 */
struct BusinessDocument {
    int64_t id = 0;
    BusinessDocumentType docType = BusinessDocumentType::SALE;
    std::string docNo;                       ///< XS-20251120-001
    Date docDate;
    std::optional<std::string> partnerName;
    std::optional<std::string> referenceNo;
    std::optional<std::string> description;
    std::string currency = "CNY";
    Decimal totalAmount;                     ///< Сумма строк
    std::string status = "POSTED";
    std::string transactionId;               ///< Порождённая транзакция
    Timestamp createdAt;
    Timestamp updatedAt;
    std::vector<BusinessDocumentItem> items;
};

/**
 * @brief Строка во входных данных документа
 */
struct BusinessDocumentItemRequest {
    std::optional<int> lineNo;
    std::optional<std::string> description;
    std::optional<std::string> memo;
    std::string debitAccountId;
    std::string creditAccountId;
    Decimal amount;
    std::optional<Decimal> quantity;
    std::optional<Decimal> unitPrice;
    std::optional<int64_t> cashflowTypeId;   ///< Если не задан, берётся из документа
};

/**
 * @brief Входные данные документа
 */
struct BusinessDocumentRequest {
    std::optional<std::string> docNo;        ///< Пусто -> номер генерируется
    Date docDate;
    std::optional<std::string> partnerName;
    std::optional<std::string> referenceNo;
    std::optional<std::string> description;
    std::string currency = "CNY";
    std::optional<int64_t> cashflowTypeId;   ///< Статья ДДС по умолчанию для строк
    std::vector<BusinessDocumentItemRequest> items;
};

} // namespace bookkeeping::domain
