#pragma once

#include "domain/CheckedMath.hpp"
#include <string>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Процентная ставка в базисных пунктах (1/100 процента)
 *
 * Соответствует колонкам Numeric(5,2) исходной схемы: "5.00" = 500 bp.
 * Число с плавающей точкой не участвует ни в хранении, ни в разборе.
 */
struct Percent {
    int64_t basisPoints = 0;

    Percent() = default;

    explicit Percent(int64_t bp) : basisPoints(bp) {}

    static Percent fromBasisPoints(int64_t bp) {
        return Percent(bp);
    }

    static Percent fromWhole(int64_t percent) {
        if (!checked::mulInto(percent, 100)) {
            throw std::overflow_error("Percent out of range: " + std::to_string(percent));
        }
        return Percent(percent);
    }

    /**
     * @brief Разобрать десятичную строку ("1", "2.5", "12.75")
     * @throws std::invalid_argument при неверном формате, > 2 знаков после точки
     *         или значении, не помещающемся в int64 базисных пунктов
     */
    static Percent fromString(const std::string& text) {
        if (text.empty()) {
            throw std::invalid_argument("Empty percent value");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[0] == '-' || text[0] == '+') {
            negative = text[0] == '-';
            pos = 1;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDot = false;
        bool seenDigit = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.' && !seenDot) {
                seenDot = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid percent value: " + text);
            }
            seenDigit = true;
            if (seenDot) {
                if (++fractionDigits > 2) {
                    throw std::invalid_argument("Percent supports at most 2 decimals: " + text);
                }
                fraction = fraction * 10 + (c - '0');
            } else if (!checked::appendDigit(whole, c - '0')) {
                throw std::invalid_argument("Percent value out of range: " + text);
            }
        }
        if (!seenDigit) {
            throw std::invalid_argument("Invalid percent value: " + text);
        }
        if (fractionDigits == 1) {
            fraction *= 10;
        }

        int64_t bp = whole;
        if (!checked::mulInto(bp, 100) || !checked::addInto(bp, fraction)) {
            throw std::invalid_argument("Percent value out of range: " + text);
        }
        return Percent(negative ? -bp : bp);
    }

    bool isZero() const { return basisPoints == 0; }

    /**
     * @brief Ставка, умноженная на целое число периодов
     */
    Percent times(int64_t periods) const {
        int64_t bp = basisPoints;
        if (!checked::mulInto(bp, periods)) {
            throw std::overflow_error("Percent " + toString() + " times " + std::to_string(periods) + " overflows");
        }
        return Percent(bp);
    }

    /**
     * @brief Строка с двумя знаками: "5.00"
     */
    std::string toString() const {
        int64_t abs = basisPoints < 0 ? -basisPoints : basisPoints;
        std::string frac = std::to_string(abs % 100);
        if (frac.size() < 2) {
            frac = "0" + frac;
        }
        return std::string(basisPoints < 0 ? "-" : "") + std::to_string(abs / 100) + "." + frac;
    }

    bool operator==(const Percent& other) const { return basisPoints == other.basisPoints; }
    bool operator!=(const Percent& other) const { return basisPoints != other.basisPoints; }
    bool operator<(const Percent& other) const { return basisPoints < other.basisPoints; }
};

} // namespace realty::domain
