#include "domain/events/LowStockEvent.hpp"
#include <nlohmann/json.hpp>

namespace omnitrack::domain {

std::string LowStockEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["productId"] = productId;
    j["productName"] = productName;
    j["availableQuantity"] = availableQuantity;
    j["lowStockThreshold"] = lowStockThreshold;
    return j.dump();
}

} // namespace omnitrack::domain
