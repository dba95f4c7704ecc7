#pragma once

#include "Date.hpp"
#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace bookkeeping::domain {

/**
 * @brief Временная метка в ISO 8601 формате (UTC)
 *
 * createdAt / updatedAt сущностей, enteredAt проводки, lastRunAt фиксированного расхода.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    /**
     * @brief Создать Timestamp с текущим временем
     */
    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Создать Timestamp из ISO 8601 строки
     * @param isoString Строка формата "2025-12-16T10:30:00Z" или "2025-12-16 10:30:00"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        const char* format = isoString.find('T') != std::string::npos
            ? "%Y-%m-%dT%H:%M:%S"
            : "%Y-%m-%d %H:%M:%S";
        ss >> std::get_time(&tm, format);

        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: '" + isoString + "'");
        }

        auto days = std::chrono::sys_days(std::chrono::year_month_day(
            std::chrono::year{tm.tm_year + 1900},
            std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
            std::chrono::day{static_cast<unsigned>(tm.tm_mday)}));
        auto tp = days + std::chrono::hours(tm.tm_hour) + std::chrono::minutes(tm.tm_min) +
                  std::chrono::seconds(tm.tm_sec);
        return Timestamp(std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp));
    }

    /**
     * @brief Преобразовать в ISO 8601 строку
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Календарная дата метки (UTC)
     */
    Date toDate() const {
        return Date(std::chrono::floor<std::chrono::days>(value));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace bookkeeping::domain
