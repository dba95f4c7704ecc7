#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/UnitOfWorkRunner.hpp"
#include "utils/UuidGenerator.hpp"
#include <DomainException.hpp>
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <set>

namespace bookkeeping::application {

/**
 * @brief Реестр счетов (план счетов)
 *
 * Сальдо здесь не меняется: это делает только LedgerPosting. Исключение:
 * rebuildBalances(), который пересчитывает кеш сальдо по проводкам.
 */
class AccountService : public ports::input::IAccountService {
public:
    explicit AccountService(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
        : uowFactory_(std::move(uowFactory))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    std::vector<domain::Account> listAccounts(bool includeHidden) override {
        auto uow = uowFactory_->begin();
        return uow->accounts().findAll(includeHidden);
    }

    std::optional<domain::Account> getAccount(const std::string& id) override {
        auto uow = uowFactory_->begin();
        return uow->accounts().findById(id);
    }

    domain::Account createAccount(const domain::CreateAccountRequest& request) override {
        if (request.name.empty()) {
            throw ValidationError("Account name is required");
        }
        if (request.accountType.empty()) {
            throw ValidationError("Account type is required");
        }

        auto account = runInUnitOfWork(*uowFactory_, "AccountService", [&](auto& uow) {
            if (uow.accounts().findByName(request.name)) {
                throw ValidationError("Account name '" + request.name + "' already exists");
            }
            if (request.parentId && !request.parentId->empty() &&
                !uow.accounts().findById(*request.parentId)) {
                throw ValidationError("Parent account does not exist: " + *request.parentId);
            }

            domain::Account account(utils::UuidGenerator::generate(), request.name, request.accountType);
            if (request.parentId && !request.parentId->empty()) {
                account.parentId = request.parentId;
            }
            account.code = request.code;
            account.description = request.description;
            account.hidden = request.hidden;
            account.placeholder = request.placeholder;
            account.isCash = request.isCash;

            uow.accounts().save(account);
            return account;
        });

        std::cout << "[AccountService] Created account " << account.name
                  << " (" << account.id << ")" << std::endl;
        return account;
    }

    domain::Account updateAccount(const std::string& id,
                                  const domain::UpdateAccountRequest& request) override
    {
        auto account = runInUnitOfWork(*uowFactory_, "AccountService", [&](auto& uow) {
            auto existing = uow.accounts().findById(id);
            if (!existing) {
                throw NotFoundError("Account not found: " + id);
            }
            domain::Account account = *existing;

            if (request.name && !request.name->empty() && *request.name != account.name) {
                auto clash = uow.accounts().findByName(*request.name);
                if (clash && clash->id != id) {
                    throw ValidationError("Account name '" + *request.name + "' already exists");
                }
                account.name = *request.name;
            }

            if (request.parentId) {
                if (*request.parentId == id) {
                    throw ValidationError("An account cannot be its own parent");
                }
                if (request.parentId->empty()) {
                    account.parentId.reset();
                } else {
                    requireAcyclicParent(uow, id, *request.parentId);
                    account.parentId = request.parentId;
                }
            }

            if (request.accountType) account.accountType = *request.accountType;
            if (request.code) account.code = request.code;
            if (request.description) account.description = request.description;
            if (request.hidden) account.hidden = *request.hidden;
            if (request.placeholder) account.placeholder = *request.placeholder;
            if (request.isCash) account.isCash = *request.isCash;
            account.updatedAt = domain::Timestamp::now();

            uow.accounts().update(account);
            return account;
        });

        std::cout << "[AccountService] Updated account " << id << std::endl;
        return account;
    }

    void deleteAccount(const std::string& id) override {
        runInUnitOfWork(*uowFactory_, "AccountService", [&](auto& uow) {
            auto account = uow.accounts().findById(id);
            if (!account) {
                throw NotFoundError("Account not found: " + id);
            }

            auto children = uow.accounts().findChildren(id);
            if (!children.empty()) {
                std::string names;
                for (const auto& child : children) {
                    names += (names.empty() ? "" : ", ") + child.name;
                }
                throw ValidationError("Account has child accounts and cannot be deleted. Children: " + names);
            }

            if (!account->currentBalance.isZero()) {
                throw ValidationError("Account balance is not zero (current balance: " +
                                      account->currentBalance.toString() + "), cannot delete");
            }

            if (uow.transactions().hasSplitsForAccount(id)) {
                throw ValidationError("Account is in use (referenced by splits) and cannot be deleted. "
                                      "Hide the account instead.");
            }

            uow.accounts().deleteById(id);
        });

        std::cout << "[AccountService] Deleted account " << id << std::endl;
    }

    std::vector<domain::AccountBalance> listAccountBalances() override {
        auto uow = uowFactory_->begin();
        auto accounts = uow->accounts().findAll(true);
        auto sums = uow->ledgerQueries().sumByAccount();

        std::vector<domain::AccountBalance> balances;
        balances.reserve(accounts.size());
        for (const auto& account : accounts) {
            domain::AccountBalance balance;
            balance.accountId = account.id;
            balance.accountName = account.name;
            balance.accountType = account.accountType;
            balance.cachedBalance = account.currentBalance;
            auto it = sums.find(account.id);
            if (it != sums.end()) {
                balance.derivedBalance = it->second;
            }
            balance.drift = balance.cachedBalance != balance.derivedBalance;
            balances.push_back(std::move(balance));
        }
        return balances;
    }

    std::size_t rebuildBalances() override {
        auto corrected = runInUnitOfWork(*uowFactory_, "AccountService", [&](auto& uow) {
            auto accounts = uow.accounts().findAll(true);
            auto sums = uow.ledgerQueries().sumByAccount();

            std::vector<std::string> ids;
            for (const auto& account : accounts) {
                ids.push_back(account.id);
            }
            std::sort(ids.begin(), ids.end());
            uow.accounts().lockForUpdate(ids);

            auto now = domain::Timestamp::now();
            std::size_t count = 0;
            for (const auto& account : accounts) {
                domain::Decimal derived;
                auto it = sums.find(account.id);
                if (it != sums.end()) {
                    derived = it->second;
                }
                if (derived != account.currentBalance) {
                    std::cout << "[AccountService] Balance drift on " << account.name << ": cached "
                              << account.currentBalance << ", derived " << derived << std::endl;
                    uow.accounts().setBalance(account.id, derived, now);
                    ++count;
                }
            }
            return count;
        });

        std::cout << "[AccountService] Rebuilt balances, corrected " << corrected << " accounts" << std::endl;
        return corrected;
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;

    /**
     * @brief Проверить, что parentId существует и не является потомком id
     */
    static void requireAcyclicParent(ports::output::IUnitOfWork& uow,
                                     const std::string& id,
                                     const std::string& parentId)
    {
        auto parent = uow.accounts().findById(parentId);
        if (!parent) {
            throw ValidationError("Parent account does not exist: " + parentId);
        }

        std::set<std::string> visited;
        std::optional<std::string> cursor = parent->parentId;
        while (cursor) {
            if (*cursor == id) {
                throw ValidationError("Moving account under " + parentId + " would create a cycle");
            }
            if (!visited.insert(*cursor).second) {
                break;
            }
            auto ancestor = uow.accounts().findById(*cursor);
            cursor = ancestor ? ancestor->parentId : std::nullopt;
        }
    }
};

} // namespace bookkeeping::application
