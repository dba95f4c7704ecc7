#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_map>

namespace bookkeeping::domain {

/**
 * @brief Раздел финансовой отчётности, в который попадает счёт
 */
enum class StatementSection {
    ASSET,      ///< Активы (дебетовое сальдо)
    LIABILITY,  ///< Обязательства (кредитовое сальдо)
    EQUITY,     ///< Капитал (кредитовое сальдо)
    REVENUE,    ///< Доходы (кредитовые обороты)
    EXPENSE     ///< Расходы (дебетовые обороты)
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(StatementSection section) {
    switch (section) {
        case StatementSection::ASSET:     return "asset";
        case StatementSection::LIABILITY: return "liability";
        case StatementSection::EQUITY:    return "equity";
        case StatementSection::REVENUE:   return "revenue";
        case StatementSection::EXPENSE:   return "expense";
    }
    return "unknown";
}

/**
 * @brief Классифицировать тип счёта (без учёта регистра)
 *
 * Типы плана счетов хранятся строками ("CASH", "current_asset", "COGS", ...).
 * Нераспознанный тип не попадает ни в один раздел и исключается из итогов.
 *
 * @return Раздел отчётности или nullopt
 */
inline std::optional<StatementSection> classifyAccountType(const std::string& accountType) {
    static const std::unordered_map<std::string, StatementSection> mapping = {
        // Активы
        {"ASSET", StatementSection::ASSET},
        {"CURRENT_ASSET", StatementSection::ASSET},
        {"FIXED_ASSET", StatementSection::ASSET},
        {"NON_CURRENT_ASSET", StatementSection::ASSET},
        {"CASH", StatementSection::ASSET},
        {"BANK", StatementSection::ASSET},
        {"RECEIVABLE", StatementSection::ASSET},
        {"INVENTORY", StatementSection::ASSET},
        // Обязательства
        {"LIABILITY", StatementSection::LIABILITY},
        {"CURRENT_LIABILITY", StatementSection::LIABILITY},
        {"NON_CURRENT_LIABILITY", StatementSection::LIABILITY},
        {"PAYABLE", StatementSection::LIABILITY},
        // Капитал
        {"EQUITY", StatementSection::EQUITY},
        {"CAPITAL", StatementSection::EQUITY},
        {"RETAINED_EARNINGS", StatementSection::EQUITY},
        // Доходы
        {"INCOME", StatementSection::REVENUE},
        {"REVENUE", StatementSection::REVENUE},
        {"SALES", StatementSection::REVENUE},
        // Расходы
        {"EXPENSE", StatementSection::EXPENSE},
        {"COST", StatementSection::EXPENSE},
        {"OPERATING_EXPENSE", StatementSection::EXPENSE},
        {"COGS", StatementSection::EXPENSE},
    };

    std::string upper = accountType;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto it = mapping.find(upper);
    if (it == mapping.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace bookkeeping::domain
