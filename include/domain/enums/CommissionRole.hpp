#pragma once

#include <string>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Получатель комиссии
 */
enum class CommissionRole {
    AGENT,
    BROKER
};

inline std::string toString(CommissionRole role) {
    switch (role) {
        case CommissionRole::AGENT:  return "AGENT";
        case CommissionRole::BROKER: return "BROKER";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline CommissionRole commissionRoleFromString(const std::string& str) {
    if (str == "AGENT")  return CommissionRole::AGENT;
    if (str == "BROKER") return CommissionRole::BROKER;
    throw std::invalid_argument("Unknown CommissionRole: " + str);
}

} // namespace realty::domain
