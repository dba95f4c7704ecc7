#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "application/HierarchyAggregator.hpp"
#include "domain/enums/StatementSection.hpp"
#include "domain/statements/BalanceSheet.hpp"
#include "domain/statements/IncomeStatement.hpp"
#include "domain/statements/CashflowStatement.hpp"
#include <unordered_map>

namespace bookkeeping::application {

/**
 * @brief Построение финансовых отчётов по истории проводок
 *
 * Работает внутри Unit of Work вызывающего: MonthlyReportService строит и
 * сохраняет снимок в одной транзакции хранилища.
 *
 * Знаки: сальдо в леджере дебетовое-положительное. Обязательства, капитал и
 * доходы имеют кредитовое (отрицательное) сальдо и в итогах переворачиваются.
 */
class FinancialReportGenerator {
public:
    explicit FinancialReportGenerator(ports::output::IUnitOfWork& uow) : uow_(uow) {}

    /**
     * @brief Баланс на дату reportDate (проводки с датой <= reportDate)
     *
     * @param includeChildren true: все счета и подытоги родителей;
     *                        false: только ненулевые строки, без подытогов
     */
    domain::BalanceSheet balanceSheet(const domain::Date& reportDate, bool includeChildren) {
        auto balances = uow_.ledgerQueries().sumByAccountUpTo(reportDate);

        domain::BalanceSheet sheet;
        sheet.reportDate = reportDate;

        for (const auto& account : uow_.accounts().findAll(false)) {
            auto balance = valueOf(balances, account.id);
            if (balance.isZero() && !includeChildren) {
                continue;
            }

            auto section = domain::classifyAccountType(account.accountType);
            if (!section) {
                continue;
            }

            switch (*section) {
                case domain::StatementSection::ASSET:
                    sheet.assets.push_back(lineOf(account, balance));
                    sheet.assetTotal += balance;
                    break;
                case domain::StatementSection::LIABILITY:
                    sheet.liabilities.push_back(lineOf(account, balance));
                    sheet.liabilityTotal -= balance;
                    break;
                case domain::StatementSection::EQUITY:
                    sheet.equity.push_back(lineOf(account, balance));
                    sheet.equityTotal -= balance;
                    break;
                case domain::StatementSection::REVENUE:
                case domain::StatementSection::EXPENSE:
                    sheet.netIncome -= balance;
                    break;
            }
        }

        if (includeChildren) {
            sheet.assets = HierarchyAggregator::aggregate(sheet.assets);
            sheet.liabilities = HierarchyAggregator::aggregate(sheet.liabilities);
            sheet.equity = HierarchyAggregator::aggregate(sheet.equity);
        }

        sheet.equityWithIncome = sheet.equityTotal + sheet.netIncome;
        sheet.totalLiabilityEquity = sheet.liabilityTotal + sheet.equityWithIncome;
        sheet.isBalanced = (sheet.assetTotal - sheet.totalLiabilityEquity).abs() < BALANCE_TOLERANCE;
        return sheet;
    }

    /**
     * @brief Отчёт о прибылях и убытках за [startDate, endDate]
     */
    domain::IncomeStatement incomeStatement(const domain::Date& startDate,
                                            const domain::Date& endDate,
                                            bool includeChildren)
    {
        auto amounts = uow_.ledgerQueries().sumByAccountBetween(startDate, endDate);

        domain::IncomeStatement statement;
        statement.startDate = startDate;
        statement.endDate = endDate;

        for (const auto& account : uow_.accounts().findAll(false)) {
            auto amount = valueOf(amounts, account.id);
            if (amount.isZero() && !includeChildren) {
                continue;
            }

            auto section = domain::classifyAccountType(account.accountType);
            if (section == domain::StatementSection::REVENUE) {
                statement.revenues.push_back(lineOf(account, amount));
                statement.revenueTotal -= amount;
            } else if (section == domain::StatementSection::EXPENSE) {
                statement.expenses.push_back(lineOf(account, amount));
                statement.expenseTotal += amount;
            }
        }

        if (includeChildren) {
            statement.revenues = HierarchyAggregator::aggregate(statement.revenues);
            statement.expenses = HierarchyAggregator::aggregate(statement.expenses);
        }

        statement.netIncome = statement.revenueTotal - statement.expenseTotal;
        return statement;
    }

    /**
     * @brief Отчёт о движении денежных средств за [startDate, endDate]
     *
     * Обороты по статьям берутся по модулю и раскладываются по виду
     * деятельности и направлению статьи. Проводки без статьи не учитываются.
     */
    domain::CashflowStatement cashflowStatement(const domain::Date& startDate, const domain::Date& endDate) {
        domain::CashflowStatement statement;
        statement.startDate = startDate;
        statement.endDate = endDate;

        for (const auto& total : uow_.ledgerQueries().cashflowTotalsBetween(startDate, endDate)) {
            domain::CashflowLine line;
            line.cashflowTypeId = total.cashflowTypeId;
            line.categoryName = total.name;
            line.direction = total.direction;
            line.amount = total.amount.abs();

            auto& section = sectionOf(statement, total.flowType);
            if (line.direction == domain::CashflowDirection::INFLOW) {
                section.inflow += line.amount;
            } else {
                section.outflow += line.amount;
            }
            section.items.push_back(std::move(line));
        }

        for (auto* section : {&statement.operating, &statement.investing, &statement.financing}) {
            section->net = section->inflow - section->outflow;
        }
        statement.totalNet = statement.operating.net + statement.investing.net + statement.financing.net;
        return statement;
    }

private:
    inline static const domain::Decimal BALANCE_TOLERANCE = domain::Decimal::fromString("0.01");

    ports::output::IUnitOfWork& uow_;

    static domain::Decimal valueOf(const std::unordered_map<std::string, domain::Decimal>& sums,
                                   const std::string& accountId)
    {
        auto it = sums.find(accountId);
        return it == sums.end() ? domain::Decimal() : it->second;
    }

    static domain::ReportLine lineOf(const domain::Account& account, const domain::Decimal& value) {
        domain::ReportLine line;
        line.accountId = account.id;
        line.code = account.code.value_or("");
        line.name = account.name;
        line.value = value;
        line.accountType = account.accountType;
        line.parentId = account.parentId;
        line.placeholder = account.placeholder;
        return line;
    }

    static domain::CashflowSection& sectionOf(domain::CashflowStatement& statement, domain::FlowType flowType) {
        switch (flowType) {
            case domain::FlowType::INVESTING: return statement.investing;
            case domain::FlowType::FINANCING: return statement.financing;
            case domain::FlowType::OPERATING: break;
        }
        return statement.operating;
    }
};

} // namespace bookkeeping::application
