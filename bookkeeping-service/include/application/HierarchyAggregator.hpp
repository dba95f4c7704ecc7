#pragma once

#include "domain/statements/ReportLine.hpp"
#include <map>
#include <set>
#include <vector>

namespace bookkeeping::application {

/**
 * @brief Подытоги родительских счетов в строках отчёта
 *
 * Для каждой строки, у которой в том же наборе есть дочерние строки,
 * сразу после неё вставляется подытог: сумма значений прямых потомков.
 * Один уровень, нулевые подытоги пропускаются.
 */
class HierarchyAggregator {
public:
    static std::vector<domain::ReportLine> aggregate(const std::vector<domain::ReportLine>& lines) {
        std::set<std::string> present;
        for (const auto& line : lines) {
            present.insert(line.accountId);
        }

        std::map<std::string, domain::Decimal> childTotals;
        for (const auto& line : lines) {
            if (line.parentId && present.count(*line.parentId)) {
                childTotals[*line.parentId] += line.value;
            }
        }

        std::vector<domain::ReportLine> result;
        result.reserve(lines.size() + childTotals.size());
        std::set<std::string> emitted;

        for (const auto& line : lines) {
            result.push_back(line);

            auto it = childTotals.find(line.accountId);
            if (it == childTotals.end() || !emitted.insert(line.accountId).second) {
                continue;
            }
            if (it->second.isZero()) {
                continue;
            }

            domain::ReportLine subtotal;
            subtotal.accountId = line.accountId + "_subtotal";
            subtotal.name = "  └─ " + line.name + " subtotal";
            subtotal.value = it->second;
            subtotal.accountType = line.accountType;
            subtotal.parentId = line.accountId;
            subtotal.placeholder = true;
            subtotal.isSubtotal = true;
            result.push_back(std::move(subtotal));
        }
        return result;
    }
};

} // namespace bookkeeping::application
