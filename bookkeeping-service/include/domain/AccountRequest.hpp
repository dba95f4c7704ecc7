#pragma once

#include <optional>
#include <string>

namespace bookkeeping::domain {

/**
 * @brief Запрос на создание счёта
 */
struct CreateAccountRequest {
    std::string name;
    std::string accountType;
    std::optional<std::string> code;
    std::optional<std::string> parentId;
    std::optional<std::string> description;
    bool hidden = false;
    bool placeholder = false;
    bool isCash = false;
};

/**
 * @brief Запрос на изменение счёта
 *
 * Незаданные поля не меняются. parentId = "" отвязывает счёт от родителя.
 */
struct UpdateAccountRequest {
    std::optional<std::string> name;
    std::optional<std::string> accountType;
    std::optional<std::string> code;
    std::optional<std::string> parentId;
    std::optional<std::string> description;
    std::optional<bool> hidden;
    std::optional<bool> placeholder;
    std::optional<bool> isCash;
};

} // namespace bookkeeping::domain
