#pragma once

#include <string>
#include <stdexcept>

namespace realty::domain {

/**
 * @brief Сторона, подписывающая договор
 */
enum class SignatureParty {
    CLIENT,     ///< Покупатель / арендатор
    LANDLORD,   ///< Застройщик / собственник
    AGENT       ///< Агент, если назначен
};

inline std::string toString(SignatureParty party) {
    switch (party) {
        case SignatureParty::CLIENT:   return "CLIENT";
        case SignatureParty::LANDLORD: return "LANDLORD";
        case SignatureParty::AGENT:    return "AGENT";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline SignatureParty signaturePartyFromString(const std::string& str) {
    if (str == "CLIENT")   return SignatureParty::CLIENT;
    if (str == "LANDLORD") return SignatureParty::LANDLORD;
    if (str == "AGENT")    return SignatureParty::AGENT;
    throw std::invalid_argument("Unknown SignatureParty: " + str);
}

} // namespace realty::domain
