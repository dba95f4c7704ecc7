#pragma once

#include "domain/FixedExpense.hpp"
#include <optional>
#include <vector>

namespace bookkeeping::ports::output {

/**
 * @brief Репозиторий фиксированных ежемесячных расходов
 */
class IFixedExpenseRepository {
public:
    virtual ~IFixedExpenseRepository() = default;

    /**
     * @brief Все расходы по дню списания, затем по id
     */
    virtual std::vector<domain::FixedExpense> findAll() = 0;

    virtual std::optional<domain::FixedExpense> findById(int64_t id) = 0;

    /**
     * @return Расход с присвоенным id
     */
    virtual domain::FixedExpense save(const domain::FixedExpense& expense) = 0;

    virtual void update(const domain::FixedExpense& expense) = 0;

    virtual bool deleteById(int64_t id) = 0;
};

} // namespace bookkeeping::ports::output
