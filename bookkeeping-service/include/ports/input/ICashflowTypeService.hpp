#pragma once

#include "domain/CashflowType.hpp"
#include <vector>

namespace bookkeeping::ports::input {

/**
 * @brief Интерфейс справочника статей ДДС
 */
class ICashflowTypeService {
public:
    virtual ~ICashflowTypeService() = default;

    virtual std::vector<domain::CashflowType> listCashflowTypes(bool activeOnly = true) = 0;

    /**
     * @throws ValidationError дубликат кода
     */
    virtual domain::CashflowType createCashflowType(const domain::CreateCashflowTypeRequest& request) = 0;
};

} // namespace bookkeeping::ports::input
