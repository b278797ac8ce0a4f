#include "domain/events/ContractStatusChangedEvent.hpp"
#include <nlohmann/json.hpp>

namespace realty::domain {

std::string ContractStatusChangedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["contractId"] = contractId;
    j["from"] = toString(from);
    j["to"] = toString(to);
    if (!reason.empty()) {
        j["reason"] = reason;
    }
    return j.dump();
}

} // namespace realty::domain
