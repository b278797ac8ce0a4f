#include "domain/events/ConstructionMilestoneEvent.hpp"
#include "domain/DomainJson.hpp"

namespace realty::domain {

std::string ConstructionMilestoneEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["contractId"] = contractId;
    j["propertyId"] = propertyId;
    j["milestone"] = milestone == Milestone::TURNOVER ? "TURNOVER" : "CONSTRUCTION_START";
    j["principalPaid"] = principalPaid;
    j["threshold"] = threshold;
    return j.dump();
}

} // namespace realty::domain
