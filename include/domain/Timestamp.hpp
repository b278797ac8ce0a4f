#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Гражданская дата (UTC)
 */
struct CivilDate {
    int year = 1970;
    unsigned month = 1;   ///< 1..12
    unsigned day = 1;     ///< 1..31
};

/**
 * @brief Временная метка в UTC с календарной арифметикой
 *
 * Сроки платежей считаются в календарных месяцах от даты начала
 * договора, просрочка - в полных сутках.
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
     * @brief Создать из Unix timestamp
     */
    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    /**
     * @brief Полночь UTC указанной даты
     */
    static Timestamp fromDate(int year, unsigned month, unsigned day) {
        return fromUnixSeconds(daysFromCivil(year, month, day) * kSecondsPerDay);
    }

    /**
     * @brief Создать Timestamp из ISO 8601 строки
     * @param isoString "2025-12-16T10:30:00Z" или "2025-12-16"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        int y = 0;
        unsigned mo = 0, d = 0, h = 0, mi = 0, s = 0;
        int parsed = std::sscanf(isoString.c_str(), "%d-%u-%uT%u:%u:%u", &y, &mo, &d, &h, &mi, &s);
        if ((parsed != 3 && parsed != 6) || mo < 1 || mo > 12 || d < 1 || d > daysInMonth(y, mo)
            || h > 23 || mi > 59 || s > 60) {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
        }
        int64_t seconds = daysFromCivil(y, mo, d) * kSecondsPerDay + h * 3600 + mi * 60 + s;
        return fromUnixSeconds(seconds);
    }

    /**
     * @brief Преобразовать в ISO 8601 строку
     */
    std::string toString() const {
        int64_t seconds = toUnixSeconds();
        int64_t days = floorDiv(seconds, kSecondsPerDay);
        int64_t rest = seconds - days * kSecondsPerDay;
        CivilDate date = civilFromDays(days);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                      date.year, date.month, date.day,
                      static_cast<int>(rest / 3600),
                      static_cast<int>((rest % 3600) / 60),
                      static_cast<int>(rest % 60));
        return buf;
    }

    /**
     * @brief Получить Unix timestamp (секунды с 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    CivilDate date() const {
        return civilFromDays(floorDiv(toUnixSeconds(), kSecondsPerDay));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addDays(int64_t days) const {
        return addSeconds(days * kSecondsPerDay);
    }

    /**
     * @brief Сдвиг на календарные месяцы
     *
     * День месяца сохраняется; если в целевом месяце такого дня нет,
     * берётся последний день месяца (31 января + 1 месяц = 28/29 февраля).
     * Время суток сохраняется.
     */
    Timestamp addMonths(int months) const {
        int64_t seconds = toUnixSeconds();
        int64_t days = floorDiv(seconds, kSecondsPerDay);
        int64_t timeOfDay = seconds - days * kSecondsPerDay;
        CivilDate d = civilFromDays(days);

        int64_t monthIndex = static_cast<int64_t>(d.year) * 12 + (d.month - 1) + months;
        int year = static_cast<int>(floorDiv(monthIndex, 12));
        unsigned month = static_cast<unsigned>(monthIndex - static_cast<int64_t>(year) * 12) + 1;
        unsigned day = d.day;
        if (day > daysInMonth(year, month)) {
            day = daysInMonth(year, month);
        }
        return fromUnixSeconds(daysFromCivil(year, month, day) * kSecondsPerDay + timeOfDay);
    }

    /**
     * @brief Количество полных суток от this до later (отрицательно, если later раньше)
     */
    int64_t daysUntil(const Timestamp& later) const {
        return floorDiv(later.toUnixSeconds() - toUnixSeconds(), kSecondsPerDay);
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

    static constexpr int64_t kSecondsPerDay = 86400;

    static bool isLeapYear(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    static unsigned daysInMonth(int y, unsigned m) {
        static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && isLeapYear(y)) {
            return 29;
        }
        return kDays[m - 1];
    }

private:
    static int64_t floorDiv(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) {
            --q;
        }
        return q;
    }

    // Алгоритмы days_from_civil / civil_from_days (H. Hinnant)
    static int64_t daysFromCivil(int y, unsigned m, unsigned d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    static CivilDate civilFromDays(int64_t z) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t y = static_cast<int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return CivilDate{static_cast<int>(y + (m <= 2)), m, d};
    }
};

} // namespace realty::domain
