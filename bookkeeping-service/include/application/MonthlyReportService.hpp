#pragma once

#include "ports/input/IMonthlyReportService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/FinancialReportGenerator.hpp"
#include "application/UnitOfWorkRunner.hpp"
#include "domain/ReportJson.hpp"
#include <iostream>
#include <map>
#include <memory>

namespace bookkeeping::application {

/**
 * @brief Кеш отчётов за прошлый полный месяц
 *
 * Снимок месяца: три отчёта в JSON, ключ (month, report_type). Снимок не
 * изменяется после записи; правка истории задним числом его не обновляет.
 *
 * Политика хранения: после записи месяца остаются только keepLastMonths
 * самых новых месяцев, включая записанный (0 = хранить все).
 */
class MonthlyReportService : public ports::input::IMonthlyReportService {
public:
    MonthlyReportService(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
                         domain::ReportRetentionPolicy retention)
        : uowFactory_(std::move(uowFactory))
        , retention_(retention)
    {
        std::cout << "[MonthlyReportService] Created (keep last "
                  << retention_.keepLastMonths << " months)" << std::endl;
    }

    domain::MonthlySnapshot getOrCreateMonthlySnapshot(const domain::Date& today) override {
        const domain::Date month = today.previousMonth();

        auto snapshot = runInUnitOfWork(*uowFactory_, "MonthlyReportService", [&](auto& uow) {
            if (auto cached = loadCached(uow, month)) {
                return *cached;
            }
            return generateAndStore(uow, month);
        });

        std::cout << "[MonthlyReportService] Snapshot for " << month.toMonthString()
                  << (snapshot.fromCache ? " served from cache" : " generated") << std::endl;
        return snapshot;
    }

    std::optional<domain::Date> currentCachedMonth() override {
        auto uow = uowFactory_->begin();
        auto months = uow->monthlyReports().findMonths();
        if (months.empty()) {
            return std::nullopt;
        }
        return months.front();
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    domain::ReportRetentionPolicy retention_;

    /**
     * @brief Восстановить снимок, если сохранены все три отчёта месяца
     */
    static std::optional<domain::MonthlySnapshot> loadCached(ports::output::IUnitOfWork& uow,
                                                             const domain::Date& month)
    {
        std::map<domain::ReportType, std::string> payloads;
        for (const auto& record : uow.monthlyReports().findByMonth(month)) {
            payloads[record.reportType] = record.payload;
        }
        for (auto type : domain::ALL_REPORT_TYPES) {
            if (!payloads.count(type)) {
                return std::nullopt;
            }
        }

        try {
            domain::MonthlySnapshot snapshot;
            snapshot.month = month;
            snapshot.balanceSheet = domain::balanceSheetFromJson(
                nlohmann::json::parse(payloads[domain::ReportType::BALANCE_SHEET]));
            snapshot.incomeStatement = domain::incomeStatementFromJson(
                nlohmann::json::parse(payloads[domain::ReportType::INCOME_STATEMENT]));
            snapshot.cashflowStatement = domain::cashflowStatementFromJson(
                nlohmann::json::parse(payloads[domain::ReportType::CASHFLOW_STATEMENT]));
            snapshot.fromCache = true;
            return snapshot;
        } catch (const std::exception& e) {
            std::cerr << "[MonthlyReportService] Corrupted snapshot for " << month.toMonthString()
                      << ", regenerating: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    domain::MonthlySnapshot generateAndStore(ports::output::IUnitOfWork& uow, const domain::Date& month) {
        const domain::Date monthEnd = month.lastDayOfMonth();

        FinancialReportGenerator generator(uow);
        domain::MonthlySnapshot snapshot;
        snapshot.month = month;
        snapshot.balanceSheet = generator.balanceSheet(monthEnd, true);
        snapshot.incomeStatement = generator.incomeStatement(month, monthEnd, true);
        snapshot.cashflowStatement = generator.cashflowStatement(month, monthEnd);

        auto now = domain::Timestamp::now();
        std::vector<domain::MonthlyReportRecord> records = {
            makeRecord(month, domain::ReportType::BALANCE_SHEET, domain::toJson(snapshot.balanceSheet), now),
            makeRecord(month, domain::ReportType::INCOME_STATEMENT, domain::toJson(snapshot.incomeStatement), now),
            makeRecord(month, domain::ReportType::CASHFLOW_STATEMENT, domain::toJson(snapshot.cashflowStatement), now),
        };
        uow.monthlyReports().replaceMonth(month, records);
        applyRetention(uow, month);
        return snapshot;
    }

    static domain::MonthlyReportRecord makeRecord(const domain::Date& month,
                                                  domain::ReportType type,
                                                  const nlohmann::json& payload,
                                                  const domain::Timestamp& now)
    {
        domain::MonthlyReportRecord record;
        record.reportMonth = month;
        record.reportType = type;
        record.payload = payload.dump();
        record.createdAt = now;
        return record;
    }

    /**
     * @brief Удалить месяцы сверх лимита; только что записанный месяц сохраняется всегда
     */
    void applyRetention(ports::output::IUnitOfWork& uow, const domain::Date& written) {
        if (retention_.keepAll()) {
            return;
        }

        std::size_t kept = 1;
        for (const auto& month : uow.monthlyReports().findMonths()) {
            if (month == written) {
                continue;
            }
            if (kept < retention_.keepLastMonths) {
                ++kept;
                continue;
            }
            uow.monthlyReports().deleteMonth(month);
            std::cout << "[MonthlyReportService] Evicted snapshot " << month.toMonthString() << std::endl;
        }
    }
};

} // namespace bookkeeping::application
