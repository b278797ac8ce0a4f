#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>

namespace realty::domain {

/**
 * @brief Входящий платёж - единица работы LedgerEngine
 *
 * Движок его не хранит.
 */
struct PaymentRecord {
    std::string contractId;
    Money amount;
    Timestamp receivedAt;
    std::string externalReference;  ///< Референс платёжного шлюза
};

} // namespace realty::domain
