#pragma once

#include "domain/CashflowType.hpp"
#include <optional>
#include <set>
#include <vector>

namespace bookkeeping::ports::output {

/**
 * @brief Справочник статей движения денежных средств
 */
class ICashflowTypeRepository {
public:
    virtual ~ICashflowTypeRepository() = default;

    /**
     * @brief Статьи, упорядоченные по sort_order, затем по id
     */
    virtual std::vector<domain::CashflowType> findAll(bool activeOnly) = 0;

    virtual std::vector<domain::CashflowType> findByIds(const std::set<int64_t>& ids) = 0;

    virtual std::optional<domain::CashflowType> findByCode(const std::string& code) = 0;

    /**
     * @brief Вставить статью
     * @return Статья с присвоенным id
     */
    virtual domain::CashflowType save(const domain::CashflowType& type) = 0;
};

} // namespace bookkeeping::ports::output
