#pragma once

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace bookkeeping::domain {

/**
 * @brief Календарная дата (без времени)
 *
 * Дата проводки, дата документа, месяц отчёта. Обёртка над
 * std::chrono::year_month_day с операциями, которые нужны леджеру:
 * первый/последний день месяца, предыдущий месяц, формат ISO 8601.
 */
class Date {
public:
    Date() : ymd_(std::chrono::year{1970}, std::chrono::month{1}, std::chrono::day{1}) {}

    /**
     * @throws std::invalid_argument если дата не существует (например, 2025-02-30)
     */
    Date(int year, unsigned month, unsigned day)
        : ymd_(std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day})
    {
        if (!ymd_.ok()) {
            throw std::invalid_argument("Invalid date: " + std::to_string(year) + "-" +
                                        std::to_string(month) + "-" + std::to_string(day));
        }
    }

    explicit Date(std::chrono::sys_days days) : ymd_(days) {}

    /**
     * @brief Сегодняшняя дата (UTC)
     */
    static Date today() {
        return Date(std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now()));
    }

    /**
     * @brief Создать из строки "YYYY-MM-DD"
     * @throws std::invalid_argument при неверном формате
     */
    static Date fromString(const std::string& iso) {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        char tail = 0;
        if (std::sscanf(iso.c_str(), "%d-%u-%u%c", &year, &month, &day, &tail) != 3) {
            throw std::invalid_argument("Invalid date: '" + iso + "'");
        }
        return Date(year, month, day);
    }

    int year() const { return static_cast<int>(ymd_.year()); }
    unsigned month() const { return static_cast<unsigned>(ymd_.month()); }
    unsigned day() const { return static_cast<unsigned>(ymd_.day()); }

    std::chrono::sys_days toSysDays() const { return std::chrono::sys_days(ymd_); }

    /**
     * @brief Количество дней в месяце этой даты (учитывает високосный год)
     */
    unsigned daysInMonth() const {
        std::chrono::year_month_day_last last(ymd_.year(), std::chrono::month_day_last(ymd_.month()));
        return static_cast<unsigned>(last.day());
    }

    Date firstDayOfMonth() const { return Date(year(), month(), 1); }
    Date lastDayOfMonth() const { return Date(year(), month(), daysInMonth()); }

    /**
     * @brief Первый день предыдущего месяца
     */
    Date previousMonth() const {
        return Date(firstDayOfMonth().toSysDays() - std::chrono::days{1}).firstDayOfMonth();
    }

    /**
     * @brief Та же дата, но с другим днём месяца
     */
    Date withDay(unsigned day) const { return Date(year(), month(), day); }

    Date addDays(int days) const { return Date(toSysDays() + std::chrono::days{days}); }

    /**
     * @brief "YYYY-MM-DD"
     */
    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year(), month(), day());
        return buf;
    }

    /**
     * @brief "YYYYMMDD" (для номеров документов)
     */
    std::string toCompactString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d%02u%02u", year(), month(), day());
        return buf;
    }

    /**
     * @brief "YYYY-MM"
     */
    std::string toMonthString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u", year(), month());
        return buf;
    }

    bool operator==(const Date& other) const { return ymd_ == other.ymd_; }
    bool operator!=(const Date& other) const { return ymd_ != other.ymd_; }
    bool operator<(const Date& other) const { return toSysDays() < other.toSysDays(); }
    bool operator>(const Date& other) const { return toSysDays() > other.toSysDays(); }
    bool operator<=(const Date& other) const { return toSysDays() <= other.toSysDays(); }
    bool operator>=(const Date& other) const { return toSysDays() >= other.toSysDays(); }

private:
    std::chrono::year_month_day ymd_;
};

} // namespace bookkeeping::domain
