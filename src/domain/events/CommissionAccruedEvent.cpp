#include "domain/events/CommissionAccruedEvent.hpp"
#include "domain/DomainJson.hpp"

namespace realty::domain {

std::string CommissionAccruedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["commission"] = record;
    j["delta"] = delta;
    return j.dump();
}

} // namespace realty::domain
