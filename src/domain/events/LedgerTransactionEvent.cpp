#include "domain/events/LedgerTransactionEvent.hpp"
#include "domain/DomainJson.hpp"

namespace realty::domain {

std::string LedgerTransactionEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["transaction"] = transaction;
    j["balanceEffect"] = transaction.signedAmount();
    return j.dump();
}

} // namespace realty::domain
