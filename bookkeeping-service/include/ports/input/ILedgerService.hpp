#pragma once

#include "domain/Transaction.hpp"
#include "domain/TransactionRequest.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bookkeeping::ports::input {

/**
 * @brief Интерфейс леджера: проведение, изменение и удаление транзакций
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Провести транзакцию
     * @throws ValidationError меньше двух проводок, сумма != 0, неизвестные счета
     */
    virtual domain::Transaction postTransaction(const domain::TransactionRequest& request) = 0;

    /**
     * @brief Заменить заголовок и проводки транзакции
     * @throws NotFoundError, ValidationError
     */
    virtual domain::Transaction updateTransaction(const std::string& id,
                                                  const domain::TransactionRequest& request) = 0;

    /**
     * @throws NotFoundError
     */
    virtual void deleteTransaction(const std::string& id) = 0;

    virtual std::optional<domain::Transaction> getTransaction(const std::string& id) = 0;

    /**
     * @brief Последние транзакции (по дате проводки, затем по времени создания)
     */
    virtual std::vector<domain::Transaction> listTransactions(std::size_t limit = 50) = 0;

    /**
     * @brief Детализация проводок для отображения
     */
    virtual std::vector<domain::TransactionDetailLine> listTransactionDetails(
        const std::optional<std::string>& transactionId = std::nullopt,
        std::size_t limit = 100) = 0;
};

} // namespace bookkeeping::ports::input
