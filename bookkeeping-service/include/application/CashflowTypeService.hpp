#pragma once

#include "ports/input/ICashflowTypeService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/UnitOfWorkRunner.hpp"
#include <DomainException.hpp>
#include <iostream>
#include <memory>

namespace bookkeeping::application {

/**
 * @brief Справочник статей движения денежных средств
 */
class CashflowTypeService : public ports::input::ICashflowTypeService {
public:
    explicit CashflowTypeService(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
        : uowFactory_(std::move(uowFactory))
    {
        std::cout << "[CashflowTypeService] Created" << std::endl;
    }

    std::vector<domain::CashflowType> listCashflowTypes(bool activeOnly) override {
        auto uow = uowFactory_->begin();
        return uow->cashflowTypes().findAll(activeOnly);
    }

    domain::CashflowType createCashflowType(const domain::CreateCashflowTypeRequest& request) override {
        if (request.code.empty() || request.name.empty()) {
            throw ValidationError("Cashflow type code and name are required");
        }

        auto created = runInUnitOfWork(*uowFactory_, "CashflowTypeService", [&](auto& uow) {
            if (uow.cashflowTypes().findByCode(request.code)) {
                throw ValidationError("Cashflow type code '" + request.code + "' already exists");
            }

            domain::CashflowType type;
            type.code = request.code;
            type.name = request.name;
            type.category = request.category;
            type.flowType = request.flowType;
            type.direction = request.direction;
            type.active = request.active;
            type.sortOrder = request.sortOrder;
            type.createdAt = domain::Timestamp::now();
            return uow.cashflowTypes().save(type);
        });

        std::cout << "[CashflowTypeService] Created cashflow type " << created.code
                  << " (" << created.id << ")" << std::endl;
        return created;
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
};

} // namespace bookkeeping::application
