#pragma once

#include "domain/Account.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bookkeeping::ports::output {

/**
 * @brief Репозиторий плана счетов
 *
 * Output Port. Все вызовы выполняются внутри Unit of Work, который его выдал.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Все счета, упорядоченные по коду, затем по названию
     *
     * @param includeHidden Включать скрытые счета
     */
    virtual std::vector<domain::Account> findAll(bool includeHidden) = 0;

    virtual std::optional<domain::Account> findById(const std::string& id) = 0;

    /**
     * @brief Найти счёт по точному названию (с учётом регистра)
     */
    virtual std::optional<domain::Account> findByName(const std::string& name) = 0;

    /**
     * @brief Пакетная выборка; отсутствующие id просто не попадают в результат
     */
    virtual std::vector<domain::Account> findByIds(const std::set<std::string>& ids) = 0;

    /**
     * @brief Прямые дочерние счета
     */
    virtual std::vector<domain::Account> findChildren(const std::string& parentId) = 0;

    virtual void save(const domain::Account& account) = 0;

    /**
     * @brief Обновить атрибуты счёта (сальдо не трогает)
     */
    virtual void update(const domain::Account& account) = 0;

    virtual bool deleteById(const std::string& id) = 0;

    /**
     * @brief Заблокировать строки счетов до конца Unit of Work
     *
     * Вызывается леджером перед изменением сальдо. id блокируются в
     * отсортированном порядке, чтобы параллельные проводки не взаимоблокировались.
     */
    virtual void lockForUpdate(const std::vector<std::string>& ids) = 0;

    /**
     * @brief current_balance += delta, updated_at = at
     *
     * @return false если счёт не найден
     */
    virtual bool applyBalanceDelta(const std::string& id, const domain::Decimal& delta,
                                   const domain::Timestamp& at) = 0;

    /**
     * @brief Перезаписать сальдо (пересчёт по истории проводок)
     */
    virtual void setBalance(const std::string& id, const domain::Decimal& balance,
                            const domain::Timestamp& at) = 0;
};

} // namespace bookkeeping::ports::output
