#pragma once

#include "domain/Date.hpp"
#include <atomic>
#include <memory>

// Forward declarations - Ports
namespace bookkeeping::ports::input {
    class IAccountService;
    class ILedgerService;
    class IBusinessDocumentService;
    class IFixedExpenseService;
    class IFinancialReportService;
    class IMonthlyReportService;
    class ICashflowTypeService;
}

namespace bookkeeping::ports::output {
    class IUnitOfWorkFactory;
}

namespace bookkeeping::settings {
    class DbSettings;
    class LedgerSettings;
}

/**
 * @class BookkeepingApp
 * @brief Приложение бухгалтерского леджера
 *
 * 1. configureInjection() - чтение настроек и сборка графа через Boost.DI
 * 2. runBatch() - списание фиксированных расходов и обновление месячного снимка
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: PostgresUnitOfWork или InMemoryUnitOfWork (LEDGER_STORAGE)
 * - Application Services: синглтоны поверх IUnitOfWorkFactory
 */
class BookkeepingApp
{
public:
    BookkeepingApp();
    ~BookkeepingApp();

    /**
     * @brief Собрать граф объектов
     * @throws std::invalid_argument при неверной конфигурации
     * @throws pqxx::failure если PostgreSQL недоступен
     */
    void configureInjection();

    /**
     * @brief Выполнить пакетную обработку на дату
     * @return Количество неуспешных шагов (0 = всё прошло)
     */
    int runBatch(const bookkeeping::domain::Date& today);

    /**
     * @brief Запросить остановку (из обработчика сигнала)
     *
     * Текущий шаг доводится до конца, следующие пропускаются.
     */
    void stop();

    std::shared_ptr<bookkeeping::ports::input::IAccountService> accounts() const { return accountService_; }
    std::shared_ptr<bookkeeping::ports::input::ILedgerService> ledger() const { return ledgerService_; }
    std::shared_ptr<bookkeeping::ports::input::IBusinessDocumentService> documents() const { return documentService_; }
    std::shared_ptr<bookkeeping::ports::input::IFixedExpenseService> fixedExpenses() const { return fixedExpenseService_; }
    std::shared_ptr<bookkeeping::ports::input::IFinancialReportService> reports() const { return reportService_; }
    std::shared_ptr<bookkeeping::ports::input::IMonthlyReportService> monthlyReports() const { return monthlyReportService_; }
    std::shared_ptr<bookkeeping::ports::input::ICashflowTypeService> cashflowTypes() const { return cashflowTypeService_; }

private:
    std::atomic<bool> stopRequested_{false};

    std::shared_ptr<bookkeeping::settings::LedgerSettings> ledgerSettings_;
    std::shared_ptr<bookkeeping::settings::DbSettings> dbSettings_;
    std::shared_ptr<bookkeeping::ports::output::IUnitOfWorkFactory> uowFactory_;

    std::shared_ptr<bookkeeping::ports::input::IAccountService> accountService_;
    std::shared_ptr<bookkeeping::ports::input::ILedgerService> ledgerService_;
    std::shared_ptr<bookkeeping::ports::input::IBusinessDocumentService> documentService_;
    std::shared_ptr<bookkeeping::ports::input::IFixedExpenseService> fixedExpenseService_;
    std::shared_ptr<bookkeeping::ports::input::IFinancialReportService> reportService_;
    std::shared_ptr<bookkeeping::ports::input::IMonthlyReportService> monthlyReportService_;
    std::shared_ptr<bookkeeping::ports::input::ICashflowTypeService> cashflowTypeService_;

    void printStartupBanner();
};
