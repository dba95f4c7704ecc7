#pragma once

#include "ports/input/IFinancialReportService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/FinancialReportGenerator.hpp"
#include <memory>

namespace bookkeeping::application {

/**
 * @brief Финансовые отчёты по запросу
 *
 * Каждый отчёт читается в одном Unit of Work, поэтому видит согласованный
 * срез леджера.
 */
class FinancialReportService : public ports::input::IFinancialReportService {
public:
    explicit FinancialReportService(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
        : uowFactory_(std::move(uowFactory)) {}

    domain::BalanceSheet balanceSheet(const domain::Date& reportDate, bool includeChildren) override {
        auto uow = uowFactory_->begin();
        return FinancialReportGenerator(*uow).balanceSheet(reportDate, includeChildren);
    }

    domain::IncomeStatement incomeStatement(const std::optional<domain::Date>& startDate,
                                            const std::optional<domain::Date>& endDate,
                                            bool includeChildren) override
    {
        auto [start, end] = resolvePeriod(startDate, endDate);
        auto uow = uowFactory_->begin();
        return FinancialReportGenerator(*uow).incomeStatement(start, end, includeChildren);
    }

    domain::CashflowStatement cashflowStatement(const std::optional<domain::Date>& startDate,
                                                const std::optional<domain::Date>& endDate) override
    {
        auto [start, end] = resolvePeriod(startDate, endDate);
        auto uow = uowFactory_->begin();
        return FinancialReportGenerator(*uow).cashflowStatement(start, end);
    }

    domain::BalanceSheet currentBalanceSheet() override {
        return balanceSheet(domain::Date::today(), true);
    }

    domain::IncomeStatement currentIncomeStatement() override {
        return incomeStatement(std::nullopt, std::nullopt, true);
    }

    domain::CashflowStatement currentCashflowStatement() override {
        return cashflowStatement(std::nullopt, std::nullopt);
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;

    /**
     * @brief Период по умолчанию: с 1 января года endDate по endDate (сегодня)
     */
    static std::pair<domain::Date, domain::Date> resolvePeriod(const std::optional<domain::Date>& startDate,
                                                               const std::optional<domain::Date>& endDate)
    {
        domain::Date end = endDate ? *endDate : domain::Date::today();
        domain::Date start = startDate ? *startDate : domain::Date(end.year(), 1, 1);
        return {start, end};
    }
};

} // namespace bookkeeping::application
