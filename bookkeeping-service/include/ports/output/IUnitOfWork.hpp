#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "ports/output/ICashflowTypeRepository.hpp"
#include "ports/output/IBusinessDocumentRepository.hpp"
#include "ports/output/IFixedExpenseRepository.hpp"
#include "ports/output/IMonthlyReportRepository.hpp"
#include "ports/output/ILedgerQueryRepository.hpp"
#include <memory>

namespace bookkeeping::ports::output {

/**
 * @brief Unit of Work: одна транзакция хранилища
 *
 * Output Port. Все репозитории, полученные из одного Unit of Work, видят и
 * пишут одно и то же транзакционное состояние. Изменения становятся видимы
 * другим Unit of Work только после commit().
 *
 * Незакоммиченный Unit of Work откатывается в деструкторе, поэтому
 * соединение освобождается на любом пути выхода.
 *
 * @example
 * ```cpp
 * auto uow = factory->begin();
 * uow->accounts().save(account);
 * uow->commit();
 * ```
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual IAccountRepository& accounts() = 0;
    virtual ITransactionRepository& transactions() = 0;
    virtual ICashflowTypeRepository& cashflowTypes() = 0;
    virtual IBusinessDocumentRepository& documents() = 0;
    virtual IFixedExpenseRepository& fixedExpenses() = 0;
    virtual IMonthlyReportRepository& monthlyReports() = 0;
    virtual ILedgerQueryRepository& ledgerQueries() = 0;

    /**
     * @brief Зафиксировать изменения
     * @throws std::exception при ошибке хранилища (изменения откатываются)
     */
    virtual void commit() = 0;

    /**
     * @brief Отменить изменения (повторный вызов безопасен)
     */
    virtual void rollback() = 0;
};

/**
 * @brief Фабрика Unit of Work
 */
class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    /**
     * @brief Начать новый Unit of Work
     */
    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace bookkeeping::ports::output
