#pragma once

#include "DomainEvent.hpp"
#include "domain/CommissionRecord.hpp"

namespace realty::domain {

/**
 * @brief Событие: изменилась начисленная комиссия (начисление или удержание)
 */
struct CommissionAccruedEvent : public DomainEvent {
    CommissionRecord record;
    Money delta;        ///< Изменение computedAmount этой операцией

    CommissionAccruedEvent(const CommissionRecord& rec, const Money& change)
        : DomainEvent("commission.accrued", rec.updatedAt)
        , record(rec)
        , delta(change) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<CommissionAccruedEvent>(*this);
    }
};

} // namespace realty::domain
