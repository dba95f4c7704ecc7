#pragma once

#include <string>
#include <stdexcept>

namespace bookkeeping::domain {

/**
 * @brief Тип хозяйственного документа
 */
enum class BusinessDocumentType {
    SALE,      ///< Продажа
    PURCHASE,  ///< Закупка
    EXPENSE,   ///< Расход
    CASHFLOW   ///< Поступление/выплата денег
};

inline std::string toString(BusinessDocumentType type) {
    switch (type) {
        case BusinessDocumentType::SALE:     return "SALE";
        case BusinessDocumentType::PURCHASE: return "PURCHASE";
        case BusinessDocumentType::EXPENSE:  return "EXPENSE";
        case BusinessDocumentType::CASHFLOW: return "CASHFLOW";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline BusinessDocumentType businessDocumentTypeFromString(const std::string& str) {
    if (str == "SALE")     return BusinessDocumentType::SALE;
    if (str == "PURCHASE") return BusinessDocumentType::PURCHASE;
    if (str == "EXPENSE")  return BusinessDocumentType::EXPENSE;
    if (str == "CASHFLOW") return BusinessDocumentType::CASHFLOW;
    throw std::invalid_argument("Unknown BusinessDocumentType: " + str);
}

/**
 * @brief Префикс номера документа: XS-20251120-001
 */
inline std::string getNumberPrefix(BusinessDocumentType type) {
    switch (type) {
        case BusinessDocumentType::SALE:     return "XS";
        case BusinessDocumentType::PURCHASE: return "CG";
        case BusinessDocumentType::EXPENSE:  return "FY";
        case BusinessDocumentType::CASHFLOW: return "SF";
    }
    return "DOC";
}

} // namespace bookkeeping::domain
