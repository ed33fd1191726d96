#pragma once

#include "DomainEvent.hpp"
#include "domain/Money.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Событие: заказ оформлен, сток зарезервирован
 */
struct OrderPlacedEvent : public DomainEvent {
    std::string orderId;
    std::string userId;
    int64_t itemCount = 0;      ///< Число позиций
    int64_t totalUnits = 0;     ///< Число единиц товара
    Money total;

    OrderPlacedEvent() : DomainEvent("order.placed") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderPlacedEvent>(*this);
    }
};

} // namespace omnitrack::domain
