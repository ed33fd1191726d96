#include "domain/events/OrderStatusChangedEvent.hpp"
#include <nlohmann/json.hpp>

namespace omnitrack::domain {

std::string OrderStatusChangedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = orderId;
    j["userId"] = userId;
    j["from"] = toString(fromStatus);
    j["to"] = toString(toStatus);
    j["changedBy"] = changedBy;
    return j.dump();
}

} // namespace omnitrack::domain
