#pragma once

#include "enums/CommissionRole.hpp"
#include "Money.hpp"
#include "Percent.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace realty::domain {

/**
 * @brief Начисленная комиссия агента или брокера по договору
 *
 * Пока payoutTransactionId не задан, запись накапливает комиссию с каждого
 * зачтённого платежа. После выплаты запись неизменяема, следующие начисления
 * открывают новую запись.
 */
struct CommissionRecord {
    std::string id;
    std::string contractId;
    CommissionRole beneficiaryRole = CommissionRole::AGENT;
    std::string beneficiaryId;
    Percent ratePercent;
    Money baseAmount;       ///< Сумма основного долга, с которой считалась комиссия
    Money computedAmount;
    std::optional<std::string> payoutTransactionId;
    Timestamp createdAt;
    Timestamp updatedAt;

    bool isPaid() const {
        return payoutTransactionId.has_value();
    }
};

} // namespace realty::domain
