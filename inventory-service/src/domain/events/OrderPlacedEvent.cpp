#include "domain/events/OrderPlacedEvent.hpp"
#include <nlohmann/json.hpp>

namespace omnitrack::domain {

std::string OrderPlacedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = orderId;
    j["userId"] = userId;
    j["itemCount"] = itemCount;
    j["totalUnits"] = totalUnits;
    j["total"] = {
        {"cents", total.cents},
        {"currency", total.currency}
    };
    return j.dump();
}

} // namespace omnitrack::domain
