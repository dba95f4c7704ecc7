#pragma once

#include "domain/Account.hpp"
#include "domain/AccountRequest.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bookkeeping::ports::input {

/**
 * @brief Интерфейс реестра счетов
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Счета по коду, затем по названию
     */
    virtual std::vector<domain::Account> listAccounts(bool includeHidden = false) = 0;

    /**
     * @return std::nullopt, если счёта нет
     */
    virtual std::optional<domain::Account> getAccount(const std::string& id) = 0;

    /**
     * @throws ValidationError дубликат имени или несуществующий родитель
     */
    virtual domain::Account createAccount(const domain::CreateAccountRequest& request) = 0;

    /**
     * @throws NotFoundError, ValidationError
     */
    virtual domain::Account updateAccount(const std::string& id,
                                          const domain::UpdateAccountRequest& request) = 0;

    /**
     * @throws NotFoundError, ValidationError (есть дочерние счета, сальдо или проводки)
     */
    virtual void deleteAccount(const std::string& id) = 0;

    /**
     * @brief Кешированное и пересчитанное по проводкам сальдо каждого счёта
     */
    virtual std::vector<domain::AccountBalance> listAccountBalances() = 0;

    /**
     * @brief Пересчитать current_balance всех счетов по проводкам
     * @return Количество исправленных счетов
     */
    virtual std::size_t rebuildBalances() = 0;
};

} // namespace bookkeeping::ports::input
