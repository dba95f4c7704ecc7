#pragma once

#include "domain/Decimal.hpp"
#include <optional>
#include <string>

namespace bookkeeping::domain {

/**
 * @brief Строка баланса или отчёта о прибылях и убытках
 *
 * value: сальдо на дату (баланс) либо оборот за период (ОПУ), в знаке леджера.
 * Строки-подытоги родительских счетов помечены isSubtotal.
 */
struct ReportLine {
    std::string accountId;
    std::string code;
    std::string name;
    Decimal value;
    std::string accountType;
    std::optional<std::string> parentId;
    bool placeholder = false;
    bool isSubtotal = false;
};

} // namespace bookkeeping::domain
