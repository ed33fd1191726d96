#pragma once

#include "DomainEvent.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Событие: остаток товара на пороге или ниже
 */
struct LowStockEvent : public DomainEvent {
    std::string productId;
    std::string productName;
    int64_t availableQuantity = 0;
    int64_t lowStockThreshold = 0;

    LowStockEvent() : DomainEvent("stock.low") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<LowStockEvent>(*this);
    }
};

} // namespace omnitrack::domain
