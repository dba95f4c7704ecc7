#pragma once

#include <string>
#include <stdexcept>

namespace bookkeeping::domain {

/**
 * @brief Направление денежного потока
 */
enum class CashflowDirection {
    INFLOW,   ///< Поступление
    OUTFLOW   ///< Выбытие
};

inline std::string toString(CashflowDirection direction) {
    switch (direction) {
        case CashflowDirection::INFLOW:  return "INFLOW";
        case CashflowDirection::OUTFLOW: return "OUTFLOW";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline CashflowDirection cashflowDirectionFromString(const std::string& str) {
    if (str == "INFLOW")  return CashflowDirection::INFLOW;
    if (str == "OUTFLOW") return CashflowDirection::OUTFLOW;
    throw std::invalid_argument("Unknown CashflowDirection: " + str);
}

} // namespace bookkeeping::domain
