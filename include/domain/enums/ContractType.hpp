#pragma once

#include <string>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Тип договора
 */
enum class ContractType {
    RESERVATION_AGREEMENT,
    PURCHASE_AGREEMENT,
    LEASE_AGREEMENT
};

inline std::string toString(ContractType type) {
    switch (type) {
        case ContractType::RESERVATION_AGREEMENT: return "RESERVATION_AGREEMENT";
        case ContractType::PURCHASE_AGREEMENT:    return "PURCHASE_AGREEMENT";
        case ContractType::LEASE_AGREEMENT:       return "LEASE_AGREEMENT";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ContractType contractTypeFromString(const std::string& str) {
    if (str == "RESERVATION_AGREEMENT") return ContractType::RESERVATION_AGREEMENT;
    if (str == "PURCHASE_AGREEMENT")    return ContractType::PURCHASE_AGREEMENT;
    if (str == "LEASE_AGREEMENT")       return ContractType::LEASE_AGREEMENT;
    throw std::invalid_argument("Unknown ContractType: " + str);
}

} // namespace realty::domain
