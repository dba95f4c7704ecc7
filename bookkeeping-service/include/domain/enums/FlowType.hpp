#pragma once

#include <string>
#include <stdexcept>

namespace bookkeeping::domain {

/**
 * @brief Вид деятельности в отчёте о движении денежных средств
 */
enum class FlowType {
    OPERATING,  ///< Операционная
    INVESTING,  ///< Инвестиционная
    FINANCING   ///< Финансовая
};

inline std::string toString(FlowType type) {
    switch (type) {
        case FlowType::OPERATING: return "OPERATING";
        case FlowType::INVESTING: return "INVESTING";
        case FlowType::FINANCING: return "FINANCING";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline FlowType flowTypeFromString(const std::string& str) {
    if (str == "OPERATING") return FlowType::OPERATING;
    if (str == "INVESTING") return FlowType::INVESTING;
    if (str == "FINANCING") return FlowType::FINANCING;
    throw std::invalid_argument("Unknown FlowType: " + str);
}

} // namespace bookkeeping::domain
