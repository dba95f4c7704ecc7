#pragma once

#include "domain/MonthlyReport.hpp"
#include <vector>

namespace bookkeeping::ports::output {

/**
 * @brief Хранилище месячных снимков отчётов
 */
class IMonthlyReportRepository {
public:
    virtual ~IMonthlyReportRepository() = default;

    /**
     * @brief Все сохранённые отчёты месяца
     */
    virtual std::vector<domain::MonthlyReportRecord> findByMonth(const domain::Date& month) = 0;

    /**
     * @brief Заменить отчёты месяца целиком
     */
    virtual void replaceMonth(const domain::Date& month,
                              const std::vector<domain::MonthlyReportRecord>& records) = 0;

    /**
     * @brief Месяцы, для которых есть снимки, по убыванию
     */
    virtual std::vector<domain::Date> findMonths() = 0;

    virtual void deleteMonth(const domain::Date& month) = 0;
};

} // namespace bookkeeping::ports::output
