#include "BookkeepingApp.hpp"

// Application Services
#include "application/AccountService.hpp"
#include "application/LedgerService.hpp"
#include "application/BusinessDocumentService.hpp"
#include "application/FixedExpenseService.hpp"
#include "application/FinancialReportService.hpp"
#include "application/MonthlyReportService.hpp"
#include "application/CashflowTypeService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/memory/InMemoryUnitOfWork.hpp"
#include "adapters/secondary/persistence/postgres/PostgresUnitOfWork.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

using namespace bookkeeping;

// ============================================================================
// BookkeepingApp Implementation
// ============================================================================

BookkeepingApp::BookkeepingApp()
{
    std::cout << "[BookkeepingApp] Application created" << std::endl;
}

BookkeepingApp::~BookkeepingApp()
{
    std::cout << "[BookkeepingApp] Application destroyed" << std::endl;
}

void BookkeepingApp::configureInjection()
{
    printStartupBanner();

    ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
    dbSettings_ = std::make_shared<settings::DbSettings>();

    // Хранилище выбирается в рантайме, поэтому фабрика создаётся до инжектора
    if (ledgerSettings_->useInMemoryStorage()) {
        std::cout << "[BookkeepingApp] Storage: in-memory (data is lost on exit)" << std::endl;
        uowFactory_ = std::make_shared<adapters::secondary::memory::InMemoryUnitOfWorkFactory>();
    } else {
        std::cout << "[BookkeepingApp] Storage: PostgreSQL " << dbSettings_->describe() << std::endl;
        uowFactory_ = std::make_shared<adapters::secondary::postgres::PostgresUnitOfWorkFactory>(dbSettings_);
    }

    std::cout << "[BookkeepingApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings and Secondary Adapters
        // ====================================================================

        di::bind<settings::LedgerSettings>().to(ledgerSettings_),
        di::bind<settings::DbSettings>().to(dbSettings_),
        di::bind<ports::output::IUnitOfWorkFactory>().to(uowFactory_),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::IAccountService>()
            .to<application::AccountService>()
            .in(di::singleton),

        di::bind<ports::input::ILedgerService>()
            .to<application::LedgerService>()
            .in(di::singleton),

        di::bind<ports::input::IBusinessDocumentService>()
            .to<application::BusinessDocumentService>()
            .in(di::singleton),

        di::bind<ports::input::IFixedExpenseService>()
            .to<application::FixedExpenseService>()
            .in(di::singleton),

        di::bind<ports::input::IFinancialReportService>()
            .to<application::FinancialReportService>()
            .in(di::singleton),

        di::bind<ports::input::ICashflowTypeService>()
            .to<application::CashflowTypeService>()
            .in(di::singleton),

        // Политика хранения приходит из настроек значением
        di::bind<ports::input::IMonthlyReportService>()
            .to(std::make_shared<application::MonthlyReportService>(
                uowFactory_, ledgerSettings_->getRetentionPolicy())));

    accountService_ = injector.create<std::shared_ptr<ports::input::IAccountService>>();
    ledgerService_ = injector.create<std::shared_ptr<ports::input::ILedgerService>>();
    documentService_ = injector.create<std::shared_ptr<ports::input::IBusinessDocumentService>>();
    fixedExpenseService_ = injector.create<std::shared_ptr<ports::input::IFixedExpenseService>>();
    reportService_ = injector.create<std::shared_ptr<ports::input::IFinancialReportService>>();
    monthlyReportService_ = injector.create<std::shared_ptr<ports::input::IMonthlyReportService>>();
    cashflowTypeService_ = injector.create<std::shared_ptr<ports::input::ICashflowTypeService>>();

    std::cout << "[BookkeepingApp] Boost.DI injector configured: 7 application services" << std::endl;
}

int BookkeepingApp::runBatch(const domain::Date& today)
{
    int failures = 0;

    // ========================================================================
    // Step 1: due fixed expenses
    // ========================================================================
    if (!stopRequested_) {
        std::cout << "[BookkeepingApp] Executing fixed expenses due on " << today.toString() << std::endl;
        try {
            auto results = fixedExpenseService_->executeAllDue(today);
            for (const auto& result : results) {
                if (result.executed()) {
                    std::cout << "  ✓ " << result.expenseName << " -> transaction "
                              << *result.transactionId << std::endl;
                } else {
                    std::cout << "  ✗ " << result.expenseName << " not executed" << std::endl;
                }
                for (const auto& warning : result.warnings) {
                    std::cout << "    ! " << warning << std::endl;
                }
            }
            std::cout << "[BookkeepingApp] Fixed expenses processed: " << results.size() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[BookkeepingApp] Fixed expense run failed: " << e.what() << std::endl;
            ++failures;
        }
    }

    // ========================================================================
    // Step 2: previous month snapshot
    // ========================================================================
    if (!stopRequested_) {
        try {
            auto snapshot = monthlyReportService_->getOrCreateMonthlySnapshot(today);
            std::cout << "[BookkeepingApp] Monthly snapshot " << snapshot.month.toMonthString()
                      << (snapshot.fromCache ? " (cached)" : " (generated)") << std::endl;
            std::cout << "  Assets: " << snapshot.balanceSheet.assetTotal
                      << ", Liabilities + Equity: " << snapshot.balanceSheet.totalLiabilityEquity
                      << (snapshot.balanceSheet.isBalanced ? "" : " [NOT BALANCED]") << std::endl;
            std::cout << "  Net income: " << snapshot.incomeStatement.netIncome
                      << ", Net cash flow: " << snapshot.cashflowStatement.totalNet << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[BookkeepingApp] Monthly snapshot failed: " << e.what() << std::endl;
            ++failures;
        }
    }

    // ========================================================================
    // Step 3: recent transactions
    // ========================================================================
    if (!stopRequested_) {
        try {
            auto transactions = ledgerService_->listTransactions(ledgerSettings_->getTransactionListLimit());
            std::cout << "[BookkeepingApp] Recent transactions: " << transactions.size() << std::endl;
            for (const auto& transaction : transactions) {
                std::cout << "  " << transaction.postDate.toString() << "  "
                          << transaction.description.value_or("") << "  ("
                          << transaction.splits.size() << " splits)" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[BookkeepingApp] Listing transactions failed: " << e.what() << std::endl;
            ++failures;
        }
    }

    if (stopRequested_) {
        std::cout << "[BookkeepingApp] Stop requested, remaining steps skipped" << std::endl;
    }
    return failures;
}

void BookkeepingApp::stop()
{
    stopRequested_ = true;
}

void BookkeepingApp::printStartupBanner()
{
    std::cout << R"(
╔══════════════════════════════════════════════════════════╗
║              Double-Entry Bookkeeping Ledger             ║
║          Hexagonal Architecture + Boost.DI + pqxx        ║
╚══════════════════════════════════════════════════════════╝
)" << std::endl;
}
