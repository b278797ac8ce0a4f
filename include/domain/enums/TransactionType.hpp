#pragma once

#include <string>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Тип проводки леджера
 */
enum class TransactionType {
    PAYMENT,            ///< Зачтённый основной долг
    COMMISSION_PAYOUT,  ///< Выплата комиссии агенту/брокеру
    REFUND,             ///< Возврат клиенту
    PENALTY,            ///< Начисление пени
    REVERSAL            ///< Сторно другой проводки
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::PAYMENT:           return "PAYMENT";
        case TransactionType::COMMISSION_PAYOUT: return "COMMISSION_PAYOUT";
        case TransactionType::REFUND:            return "REFUND";
        case TransactionType::PENALTY:           return "PENALTY";
        case TransactionType::REVERSAL:          return "REVERSAL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType transactionTypeFromString(const std::string& str) {
    if (str == "PAYMENT")           return TransactionType::PAYMENT;
    if (str == "COMMISSION_PAYOUT") return TransactionType::COMMISSION_PAYOUT;
    if (str == "REFUND")            return TransactionType::REFUND;
    if (str == "PENALTY")           return TransactionType::PENALTY;
    if (str == "REVERSAL")          return TransactionType::REVERSAL;
    throw std::invalid_argument("Unknown TransactionType: " + str);
}

} // namespace realty::domain
