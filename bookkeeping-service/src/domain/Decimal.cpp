#include "domain/Decimal.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace bookkeeping::domain {

Decimal Decimal::fromString(const std::string& text) {
    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }

    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    unsigned scale = 0;
    bool seenPoint = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
            if (seenPoint) {
                ++scale;
            }
        } else if (c == '.' && !seenPoint) {
            seenPoint = true;
        } else {
            break;
        }
    }

    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }

    if (digits.empty() || pos != text.size()) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }

    // Строковый конструктор cpp_int читает ведущий 0 как восьмеричный префикс
    Coefficient coefficient = 0;
    for (char c : digits) {
        coefficient = coefficient * 10 + (c - '0');
    }
    if (negative) {
        coefficient = -coefficient;
    }
    return Decimal(std::move(coefficient), scale);
}

Decimal::Coefficient Decimal::pow10(unsigned exponent) {
    Coefficient result = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

Decimal Decimal::divide(const Coefficient& num, const Coefficient& den, unsigned scale) {
    if (den.is_zero()) {
        throw std::invalid_argument("Decimal division by zero");
    }

    Coefficient scaled = boost::multiprecision::abs(num) * pow10(scale);
    Coefficient divisor = boost::multiprecision::abs(den);
    Coefficient quotient = scaled / divisor;
    Coefficient remainder = scaled % divisor;
    if (remainder * 2 >= divisor) {
        ++quotient;
    }

    if (num.sign() * den.sign() < 0) {
        quotient = -quotient;
    }
    return Decimal(std::move(quotient), scale);
}

std::string Decimal::toString() const {
    std::string digits = Coefficient(boost::multiprecision::abs(coefficient_)).str();
    if (digits.size() <= scale_) {
        digits.insert(0, scale_ - digits.size() + 1, '0');
    }

    std::string result;
    if (coefficient_.sign() < 0) {
        result.push_back('-');
    }

    std::size_t integerLength = digits.size() - scale_;
    result.append(digits, 0, integerLength);
    if (scale_ > 0) {
        result.push_back('.');
        result.append(digits, integerLength, std::string::npos);
    }
    return result;
}

Decimal Decimal::rescale(unsigned newScale) const {
    if (newScale == scale_) {
        return *this;
    }
    if (newScale > scale_) {
        return Decimal(coefficient_ * pow10(newScale - scale_), newScale);
    }
    Decimal rounded = divide(coefficient_, pow10(scale_ - newScale), 0);
    return Decimal(std::move(rounded.coefficient_), newScale);
}

Decimal Decimal::abs() const {
    return Decimal(boost::multiprecision::abs(coefficient_), scale_);
}

Decimal Decimal::operator+(const Decimal& other) const {
    unsigned scale = std::max(scale_, other.scale_);
    return Decimal(rescale(scale).coefficient_ + other.rescale(scale).coefficient_, scale);
}

Decimal Decimal::operator-(const Decimal& other) const {
    return *this + (-other);
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    *this = *this - other;
    return *this;
}

int Decimal::compare(const Decimal& other) const {
    unsigned scale = std::max(scale_, other.scale_);
    const Coefficient lhs = rescale(scale).coefficient_;
    const Coefficient rhs = other.rescale(scale).coefficient_;
    if (lhs < rhs) return -1;
    if (lhs > rhs) return 1;
    return 0;
}

} // namespace bookkeeping::domain
