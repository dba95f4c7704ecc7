#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <ostream>
#include <string>

namespace bookkeeping::domain {

/**
 * @brief Десятичное число произвольной точности
 *
 * Хранится как целый коэффициент и масштаб: value = coefficient / 10^scale.
 * Все денежные суммы в леджере (балансы, проводки, итоги отчётов) считаются
 * в Decimal, чтобы сумма проводок сходилась к нулю без ошибок округления.
 *
 * Сравнение выполняется по числовому значению: 1.0 == 1.00.
 *
 * @example
 * ```cpp
 * auto a = Decimal::fromString("100.10");
 * auto b = Decimal::fromString("-100.1");
 * assert((a + b).isZero());
 * ```
 */
class Decimal {
public:
    using Coefficient = boost::multiprecision::cpp_int;

    Decimal() = default;

    Decimal(Coefficient coefficient, unsigned scale)
        : coefficient_(std::move(coefficient)), scale_(scale) {}

    /**
     * @brief Создать из строки вида "-123.4500"
     * @throws std::invalid_argument если строка не является десятичным числом
     */
    static Decimal fromString(const std::string& text);

    /**
     * @brief Создать из целого числа (масштаб 0)
     */
    static Decimal fromInt(int64_t value) {
        return Decimal(Coefficient(value), 0);
    }

    /**
     * @brief Поделить num / den, округлив половину вверх до scale знаков
     * @throws std::invalid_argument если den == 0
     */
    static Decimal divide(const Coefficient& num, const Coefficient& den, unsigned scale);

    /**
     * @brief 10^exponent
     */
    static Coefficient pow10(unsigned exponent);

    std::string toString() const;

    const Coefficient& coefficient() const { return coefficient_; }
    unsigned scale() const { return scale_; }

    /**
     * @brief Привести к заданному числу знаков после запятой
     *
     * При уменьшении масштаба округляет половину от нуля (ROUND_HALF_UP).
     */
    Decimal rescale(unsigned newScale) const;

    Decimal abs() const;
    bool isZero() const { return coefficient_.is_zero(); }
    int signum() const { return coefficient_.sign(); }

    Decimal operator-() const { return Decimal(-coefficient_, scale_); }
    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return compare(other) != 0; }
    bool operator<(const Decimal& other) const { return compare(other) < 0; }
    bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
    bool operator>(const Decimal& other) const { return compare(other) > 0; }
    bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

private:
    int compare(const Decimal& other) const;

    Coefficient coefficient_{0};
    unsigned scale_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace bookkeeping::domain
