#pragma once

#include "Decimal.hpp"
#include <DomainException.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace bookkeeping::domain {

/**
 * @brief Сумма в виде дроби numerator / denominator
 *
 * Так суммы проводок хранятся в БД (две колонки BIGINT): без потери точности
 * и без зависимости от типа NUMERIC конкретной СУБД.
 */
struct Fraction {
    int64_t numerator = 0;
    int64_t denominator = 1;

    bool operator==(const Fraction& other) const {
        return numerator == other.numerator && denominator == other.denominator;
    }
};

/**
 * @brief Преобразование денежных сумм Decimal <-> Fraction
 */
class AmountCodec {
public:
    static constexpr unsigned DEFAULT_MIN_SCALE = 2;
    static constexpr unsigned DEFAULT_MAX_SCALE = 6;

    /**
     * @brief Decimal -> (numerator, denominator)
     *
     * Знаменатель = 10^scale, где scale = собственная точность суммы,
     * ограниченная [minScale, maxScale]. Лишние знаки округляются половиной
     * вверх: 1.2345675 -> 1234568 / 10^6.
     *
     * @throws ValidationError если числитель не помещается в int64
     */
    static Fraction toFraction(const Decimal& amount,
                               unsigned minScale = DEFAULT_MIN_SCALE,
                               unsigned maxScale = DEFAULT_MAX_SCALE) {
        unsigned scale = std::min(std::max(amount.scale(), minScale), maxScale);
        Decimal scaled = amount.rescale(scale);

        const Decimal::Coefficient& coefficient = scaled.coefficient();
        if (coefficient > Decimal::Coefficient(std::numeric_limits<int64_t>::max()) ||
            coefficient < Decimal::Coefficient(std::numeric_limits<int64_t>::min())) {
            throw ValidationError("Amount out of range: " + amount.toString());
        }

        return Fraction{
            coefficient.convert_to<int64_t>(),
            Decimal::pow10(scale).convert_to<int64_t>()
        };
    }

    /**
     * @brief (numerator, denominator) -> Decimal
     *
     * Нулевой знаменатель трактуется как 1. Знаменатель-степень десяти делится
     * точно; произвольный знаменатель делится до 18 знаков.
     */
    static Decimal fromFraction(int64_t numerator, int64_t denominator) {
        if (denominator == 0) {
            denominator = 1;
        }

        if (denominator > 0) {
            unsigned exponent = 0;
            int64_t rest = denominator;
            while (rest % 10 == 0) {
                rest /= 10;
                ++exponent;
            }
            if (rest == 1) {
                return Decimal(Decimal::Coefficient(numerator), exponent);
            }
        }

        return Decimal::divide(Decimal::Coefficient(numerator),
                               Decimal::Coefficient(denominator), 18);
    }

    static Decimal fromFraction(const Fraction& fraction) {
        return fromFraction(fraction.numerator, fraction.denominator);
    }

    /**
     * @brief Привести сумму к точности хранения (то, что реально окажется в БД)
     */
    static Decimal normalize(const Decimal& amount) {
        return fromFraction(toFraction(amount));
    }
};

} // namespace bookkeeping::domain
