#pragma once

#include "Percent.hpp"
#include "LedgerErrors.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace realty::domain {

/**
 * @brief Политика леджера, передаётся в LedgerEngine и CommissionCalculator явно
 *
 * Ставки не подставляются по умолчанию: отсутствующая ставка пени при
 * просрочке - ConfigurationError, а не нулевая пеня.
 */
struct LedgerPolicy {
    std::string currency = "PHP";
    std::optional<Percent> penaltyRatePerMonth;     ///< Например 1.00% в месяц
    int64_t penaltyGraceDays = 30;                  ///< Пени начисляются с этого дня просрочки
    int64_t penaltyPeriodDays = 30;                 ///< Длина периода начисления
    std::optional<Percent> defaultAgentCommissionRate;
    std::optional<Percent> defaultBrokerCommissionRate;

    /**
     * @throws ConfigurationError при некорректных значениях
     */
    void validate() const {
        if (currency.size() != 3) {
            throw ConfigurationError("Ledger currency must be a 3-letter code, got '" + currency + "'");
        }
        if (penaltyRatePerMonth && penaltyRatePerMonth->basisPoints < 0) {
            throw ConfigurationError("Penalty rate must not be negative");
        }
        if (penaltyGraceDays < 0) {
            throw ConfigurationError("Penalty grace days must not be negative");
        }
        if (penaltyPeriodDays <= 0) {
            throw ConfigurationError("Penalty period must be positive");
        }
        if (defaultAgentCommissionRate && defaultAgentCommissionRate->basisPoints < 0) {
            throw ConfigurationError("Agent commission rate must not be negative");
        }
        if (defaultBrokerCommissionRate && defaultBrokerCommissionRate->basisPoints < 0) {
            throw ConfigurationError("Broker commission rate must not be negative");
        }
    }
};

} // namespace realty::domain
