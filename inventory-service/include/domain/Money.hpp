#pragma once

#include <string>
#include <cstdint>
#include <cmath>

namespace omnitrack::domain {

/**
 * @brief Денежное значение с валютой
 * 
 * Хранит значение в минорных единицах (центы) для точности.
 * Соответствует колонке DECIMAL(10, 2) каталога.
 */
class Money {
public:
    int64_t cents = 0;              // Сумма в центах
    std::string currency = "USD";

    Money() = default;

    explicit Money(int64_t c, const std::string& cur = "USD")
        : cents(c), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "USD") {
        return Money(static_cast<int64_t>(std::llround(value * 100.0)), cur);
    }

    double toDouble() const {
        return static_cast<double>(cents) / 100.0;
    }

    Money operator+(const Money& other) const {
        return Money(cents + other.cents, currency);
    }

    Money operator*(int64_t multiplier) const {
        return Money(cents * multiplier, currency);
    }

    /**
     * @brief Разделить с округлением до ближайшего цента
     * @return 0 при divisor <= 0 (средний чек пустой выборки)
     */
    Money dividedBy(int64_t divisor) const {
        if (divisor <= 0) {
            return Money(0, currency);
        }
        int64_t half = divisor / 2;
        int64_t rounded = cents >= 0 ? (cents + half) / divisor : (cents - half) / divisor;
        return Money(rounded, currency);
    }

    bool isNegative() const { return cents < 0; }

    bool operator<(const Money& other) const { return cents < other.cents; }
    bool operator>(const Money& other) const { return cents > other.cents; }

    bool operator==(const Money& other) const {
        return cents == other.cents && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }
};

} // namespace omnitrack::domain
