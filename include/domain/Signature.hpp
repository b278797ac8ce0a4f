#pragma once

#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace realty::domain {

/**
 * @brief Подпись стороны договора
 *
 * blob - непрозрачные данные цифровой подписи, движок их не проверяет.
 */
struct Signature {
    bool isSigned = false;
    std::optional<Timestamp> signedAt;
    std::string blob;
};

/**
 * @brief Подписи всех сторон
 */
struct ContractSignatures {
    Signature client;
    Signature landlord;
    Signature agent;
};

} // namespace realty::domain
