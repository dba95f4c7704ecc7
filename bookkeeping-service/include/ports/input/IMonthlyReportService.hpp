#pragma once

#include "domain/MonthlyReport.hpp"
#include <optional>

namespace bookkeeping::ports::input {

/**
 * @brief Интерфейс кеша месячных отчётов
 */
class IMonthlyReportService {
public:
    virtual ~IMonthlyReportService() = default;

    /**
     * @brief Отчёты за прошлый полный месяц относительно today
     *
     * Берутся из кеша, если все три сохранены, иначе строятся и сохраняются.
     */
    virtual domain::MonthlySnapshot getOrCreateMonthlySnapshot(const domain::Date& today) = 0;

    /**
     * @brief Самый новый месяц в кеше
     */
    virtual std::optional<domain::Date> currentCachedMonth() = 0;
};

} // namespace bookkeeping::ports::input
