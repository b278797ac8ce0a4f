#pragma once

#include "DomainEvent.hpp"
#include "domain/enums/ContractStatus.hpp"
#include <string>

namespace realty::domain {

/**
 * @brief Событие: договор сменил статус
 */
struct ContractStatusChangedEvent : public DomainEvent {
    std::string contractId;
    ContractStatus from = ContractStatus::DRAFT;
    ContractStatus to = ContractStatus::DRAFT;
    std::string reason;

    ContractStatusChangedEvent(const std::string& id, ContractStatus previous, ContractStatus current,
                               const Timestamp& at, const std::string& why = "")
        : DomainEvent("contract.status.changed", at)
        , contractId(id)
        , from(previous)
        , to(current)
        , reason(why) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ContractStatusChangedEvent>(*this);
    }
};

} // namespace realty::domain
