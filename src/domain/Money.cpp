#include "domain/Money.hpp"
#include <stdexcept>

namespace realty::domain {

namespace {

constexpr int64_t kBasisPointsPerUnit = 10000;

// a * b / divisor для неотрицательных a, b с округлением half-up
int64_t mulDivHalfUp(int64_t a, int64_t b, int64_t divisor) {
    int64_t whole = a / divisor;
    int64_t rem = a % divisor;
    if (!checked::mulInto(whole, b) || !checked::mulInto(rem, b) || !checked::addInto(rem, divisor / 2) ||
        !checked::addInto(whole, rem / divisor)) {
        throw std::overflow_error("Money overflow in multiplication");
    }
    return whole;
}

} // namespace

Money Money::parse(const std::string& text, const std::string& cur) {
    if (text.empty()) {
        throw std::invalid_argument("Empty money value");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }

    int64_t whole = 0;
    int64_t cents = 0;
    int centDigits = 0;
    bool seenDot = false;
    bool seenDigit = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == ',' && !seenDot) {
            continue;  // разделитель тысяч
        }
        if (c == '.' && !seenDot) {
            seenDot = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid money value: " + text);
        }
        seenDigit = true;
        if (seenDot) {
            if (++centDigits > 2) {
                throw std::invalid_argument("Money supports at most 2 decimals: " + text);
            }
            cents = cents * 10 + (c - '0');
        } else if (!checked::appendDigit(whole, c - '0')) {
            throw std::invalid_argument("Money value out of range: " + text);
        }
    }
    if (!seenDigit) {
        throw std::invalid_argument("Invalid money value: " + text);
    }
    if (centDigits == 1) {
        cents *= 10;
    }

    int64_t minor = whole;
    if (!checked::mulInto(minor, 100) || !checked::addInto(minor, cents)) {
        throw std::invalid_argument("Money value out of range: " + text);
    }
    return Money(negative ? -minor : minor, cur);
}

Money Money::multiplyByPercent(const Percent& rate) const {
    int64_t absAmount = amount < 0 ? negate().amount : amount;
    int64_t absRate = rate.basisPoints < 0 ? -rate.basisPoints : rate.basisPoints;
    bool negative = (amount < 0) != (rate.basisPoints < 0);

    int64_t result = mulDivHalfUp(absAmount, absRate, kBasisPointsPerUnit);
    return Money(negative ? -result : result, currency);
}

Money Money::divideRounded(int64_t parts) const {
    if (parts <= 0) {
        throw std::invalid_argument("Money can only be divided into a positive number of parts");
    }
    int64_t absAmount = amount < 0 ? negate().amount : amount;
    int64_t result = mulDivHalfUp(absAmount, 1, parts);
    return Money(amount < 0 ? -result : result, currency);
}

std::string Money::toDecimalString() const {
    int64_t absAmount = amount < 0 ? -amount : amount;
    std::string cents = std::to_string(absAmount % 100);
    if (cents.size() < 2) {
        cents = "0" + cents;
    }
    return std::string(amount < 0 ? "-" : "") + std::to_string(absAmount / 100) + "." + cents;
}

} // namespace realty::domain
