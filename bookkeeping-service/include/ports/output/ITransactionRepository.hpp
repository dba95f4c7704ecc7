#pragma once

#include "domain/Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bookkeeping::ports::output {

/**
 * @brief Репозиторий транзакций и их проводок
 *
 * Транзакция сохраняется и удаляется вместе с проводками.
 */
class ITransactionRepository {
public:
    virtual ~ITransactionRepository() = default;

    /**
     * @brief Вставить транзакцию со всеми проводками
     */
    virtual void save(const domain::Transaction& transaction) = 0;

    /**
     * @brief Транзакция с проводками или nullopt
     */
    virtual std::optional<domain::Transaction> findById(const std::string& id) = 0;

    /**
     * @brief Последние транзакции: post_date DESC, created_at DESC
     */
    virtual std::vector<domain::Transaction> findRecent(std::size_t limit) = 0;

    /**
     * @brief Перезаписать заголовок и заменить набор проводок
     */
    virtual void update(const domain::Transaction& transaction) = 0;

    /**
     * @brief Удалить транзакцию и её проводки
     * @return false если транзакция не найдена
     */
    virtual bool deleteById(const std::string& id) = 0;

    /**
     * @brief Есть ли хотя бы одна проводка по счёту
     */
    virtual bool hasSplitsForAccount(const std::string& accountId) = 0;

    /**
     * @brief Детализация проводок (с именами счетов и статей ДДС)
     *
     * @param transactionId Фильтр по транзакции (nullopt: все)
     * @param limit Максимум строк
     */
    virtual std::vector<domain::TransactionDetailLine> findDetails(
        const std::optional<std::string>& transactionId,
        std::size_t limit
    ) = 0;
};

} // namespace bookkeeping::ports::output
