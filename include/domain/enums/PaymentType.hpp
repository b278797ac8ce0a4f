#pragma once

#include <string>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Назначение платежа по графику
 */
enum class PaymentType {
    RESERVATION_FEE,        ///< Бронь, вычитается из первоначального взноса
    DOWNPAYMENT,            ///< Первоначальный взнос
    EQUITY,                 ///< Собственные средства (equity)
    MONTHLY_AMORTIZATION    ///< Ежемесячное погашение (кредитная часть / аренда)
};

inline std::string toString(PaymentType type) {
    switch (type) {
        case PaymentType::RESERVATION_FEE:      return "RESERVATION_FEE";
        case PaymentType::DOWNPAYMENT:          return "DOWNPAYMENT";
        case PaymentType::EQUITY:               return "EQUITY";
        case PaymentType::MONTHLY_AMORTIZATION: return "MONTHLY_AMORTIZATION";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline PaymentType paymentTypeFromString(const std::string& str) {
    if (str == "RESERVATION_FEE")      return PaymentType::RESERVATION_FEE;
    if (str == "DOWNPAYMENT")          return PaymentType::DOWNPAYMENT;
    if (str == "EQUITY")               return PaymentType::EQUITY;
    if (str == "MONTHLY_AMORTIZATION") return PaymentType::MONTHLY_AMORTIZATION;
    throw std::invalid_argument("Unknown PaymentType: " + str);
}

} // namespace realty::domain
