#include "domain/events/StockRestockedEvent.hpp"
#include <nlohmann/json.hpp>

namespace omnitrack::domain {

std::string StockRestockedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["productId"] = productId;
    j["quantity"] = quantity;
    j["newQuantity"] = newQuantity;
    j["restockedBy"] = restockedBy;
    return j.dump();
}

} // namespace omnitrack::domain
