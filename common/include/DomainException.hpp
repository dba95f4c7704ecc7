#pragma once

#include <stdexcept>
#include <string>

/**
 * @file DomainException.hpp
 * @brief Исключения прикладного уровня
 * @author Anton Tobolkin
 * @version 1.0
 */

/**
 * @brief Входные данные нарушают инвариант (дубликат имени, несбалансированные
 * проводки, ссылка на несуществующую сущность и т.п.)
 *
 * Сообщение предназначено для вызывающей стороны и передаётся ей без изменений.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Идентификатор не найден
 *
 * Отделено от ValidationError, чтобы вызывающий мог отличить отсутствие
 * сущности от некорректного запроса.
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message)
        : std::runtime_error(message) {}
};
