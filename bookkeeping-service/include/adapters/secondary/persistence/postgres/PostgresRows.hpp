#pragma once

#include "domain/Decimal.hpp"
#include "domain/Date.hpp"
#include "domain/Timestamp.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <optional>
#include <string>

namespace bookkeeping::adapters::secondary::postgres {

/**
 * @brief Преобразования между колонками PostgreSQL и доменными типами
 *
 * NUMERIC и DATE передаются текстом, TIMESTAMPTZ: секундами эпохи
 * (EXTRACT(EPOCH FROM ...)::bigint / to_timestamp($n)).
 */
namespace rows {

inline int64_t epochOf(const domain::Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.value.time_since_epoch()).count();
}

inline domain::Timestamp timestampOf(const pqxx::field& field) {
    return domain::Timestamp(std::chrono::system_clock::time_point(
        std::chrono::seconds(field.as<int64_t>())));
}

inline std::optional<domain::Timestamp> optionalTimestamp(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return timestampOf(field);
}

inline domain::Decimal decimalOf(const pqxx::field& field) {
    return field.is_null() ? domain::Decimal() : domain::Decimal::fromString(field.as<std::string>());
}

inline std::optional<domain::Decimal> optionalDecimal(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return domain::Decimal::fromString(field.as<std::string>());
}

inline domain::Date dateOf(const pqxx::field& field) {
    return domain::Date::fromString(field.as<std::string>());
}

inline std::optional<domain::Date> optionalDate(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return dateOf(field);
}

inline std::optional<std::string> optionalString(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<std::string>();
}

inline std::optional<int64_t> optionalInt(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<int64_t>();
}

inline std::optional<std::string> optionalText(const std::optional<domain::Decimal>& value) {
    if (!value) return std::nullopt;
    return value->toString();
}

inline std::optional<std::string> optionalText(const std::optional<domain::Date>& value) {
    if (!value) return std::nullopt;
    return value->toString();
}

} // namespace rows

} // namespace bookkeeping::adapters::secondary::postgres
