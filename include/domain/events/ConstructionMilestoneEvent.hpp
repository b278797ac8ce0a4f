#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>

namespace realty::domain {

/**
 * @brief Событие: оплаченный основной долг пересёк строительный порог
 *
 * contract.construction.ready - можно начинать строительство,
 * contract.turnover.ready - объект готов к передаче.
 */
struct ConstructionMilestoneEvent : public DomainEvent {
    enum class Milestone { CONSTRUCTION_START, TURNOVER };

    std::string contractId;
    std::string propertyId;
    Milestone milestone = Milestone::CONSTRUCTION_START;
    Money principalPaid;
    Money threshold;

    ConstructionMilestoneEvent(Milestone kind, const std::string& contract, const std::string& property,
                               const Money& paid, const Money& limit, const Timestamp& at)
        : DomainEvent(kind == Milestone::TURNOVER ? "contract.turnover.ready" : "contract.construction.ready", at)
        , contractId(contract)
        , propertyId(property)
        , milestone(kind)
        , principalPaid(paid)
        , threshold(limit) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ConstructionMilestoneEvent>(*this);
    }
};

} // namespace realty::domain
