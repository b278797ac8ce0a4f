#pragma once

#include <cstdint>
#include <limits>

/**
 * @file CheckedMath.hpp
 * @brief Целочисленная арифметика int64 с проверкой переполнения
 *
 * Функции возвращают false и не меняют value, если результат не помещается в int64.
 */

namespace realty::domain::checked {

inline bool addInto(int64_t& value, int64_t term) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    if ((term > 0 && value > max - term) || (term < 0 && value < min - term)) {
        return false;
    }
    value += term;
    return true;
}

inline bool mulInto(int64_t& value, int64_t factor) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    if (value > 0) {
        if (factor > 0 ? value > max / factor : factor < min / value) {
            return false;
        }
    } else if (factor > 0) {
        if (value < min / factor) {
            return false;
        }
    } else if (value != 0 && factor < max / value) {
        return false;
    }
    value *= factor;
    return true;
}

/**
 * @brief value = value * 10 + digit (разбор десятичной строки)
 */
inline bool appendDigit(int64_t& value, int digit) {
    int64_t next = value;
    if (!mulInto(next, 10) || !addInto(next, digit)) {
        return false;
    }
    value = next;
    return true;
}

} // namespace realty::domain::checked
