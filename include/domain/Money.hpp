#pragma once

#include "domain/Percent.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/CheckedMath.hpp"
#include <string>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранит значение в минорных единицах (сентаво, центы) для точности.
 * Любая арифметика между двумя Money требует одинаковой валюты,
 * иначе бросается CurrencyMismatch.
 */
class Money {
public:
    int64_t amount = 0;             ///< Сумма в минорных единицах
    std::string currency = "PHP";   ///< Код валюты ISO 4217

    Money() = default;

    Money(int64_t minorUnits, const std::string& cur)
        : amount(minorUnits), currency(cur) {}

    static Money fromMinor(int64_t minorUnits, const std::string& cur = "PHP") {
        return Money(minorUnits, cur);
    }

    static Money zero(const std::string& cur = "PHP") {
        return Money(0, cur);
    }

    /**
     * @brief Разобрать десятичную строку "16666.67" без плавающей точки
     * @throws std::invalid_argument при неверном формате или сумме вне диапазона int64
     */
    static Money parse(const std::string& text, const std::string& cur = "PHP");

    /**
     * @throws CurrencyMismatch если валюты различаются
     * @throws std::overflow_error если сумма не помещается в int64
     */
    Money add(const Money& other) const {
        requireSameCurrency(other);
        int64_t result = amount;
        if (!checked::addInto(result, other.amount)) {
            throw std::overflow_error("Money overflow: " + toString() + " + " + other.toString());
        }
        return Money(result, currency);
    }

    Money subtract(const Money& other) const {
        requireSameCurrency(other);
        return add(other.negate());
    }

    Money negate() const {
        if (amount == std::numeric_limits<int64_t>::min()) {
            throw std::overflow_error("Money overflow: cannot negate " + std::to_string(amount));
        }
        return Money(-amount, currency);
    }

    /**
     * @brief Умножить на процентную ставку
     *
     * Результат округляется half-up до минорной единицы; для отрицательных
     * сумм - симметрично (от нуля), поэтому multiplyByPercent(-x) == -multiplyByPercent(x).
     * Одна и та же функция используется для пени и для комиссий.
     */
    Money multiplyByPercent(const Percent& rate) const;

    /**
     * @brief Доля суммы при делении на parts равных частей, округление half-up
     */
    Money divideRounded(int64_t parts) const;

    bool isZero() const { return amount == 0; }
    bool isPositive() const { return amount > 0; }
    bool isNegative() const { return amount < 0; }

    /**
     * @brief Сравнение: -1, 0, 1
     * @throws CurrencyMismatch если валюты различаются
     */
    int compare(const Money& other) const {
        requireSameCurrency(other);
        if (amount < other.amount) return -1;
        if (amount > other.amount) return 1;
        return 0;
    }

    /**
     * @brief "16666.67 PHP"
     */
    std::string toString() const {
        return toDecimalString() + " " + currency;
    }

    /**
     * @brief "16666.67"
     */
    std::string toDecimalString() const;

    Money operator+(const Money& other) const { return add(other); }
    Money operator-(const Money& other) const { return subtract(other); }
    Money operator-() const { return negate(); }

    Money& operator+=(const Money& other) {
        *this = add(other);
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = subtract(other);
        return *this;
    }

    bool operator==(const Money& other) const {
        return amount == other.amount && currency == other.currency;
    }
    bool operator!=(const Money& other) const { return !(*this == other); }
    bool operator<(const Money& other) const { return compare(other) < 0; }
    bool operator>(const Money& other) const { return compare(other) > 0; }
    bool operator<=(const Money& other) const { return compare(other) <= 0; }
    bool operator>=(const Money& other) const { return compare(other) >= 0; }

    static Money min(const Money& a, const Money& b) {
        return a <= b ? a : b;
    }

private:
    void requireSameCurrency(const Money& other) const {
        if (currency != other.currency) {
            throw CurrencyMismatch("Currency mismatch: " + currency + " vs " + other.currency);
        }
    }
};

} // namespace realty::domain
