#pragma once

#include "DomainEvent.hpp"
#include "domain/enums/OrderStatus.hpp"
#include <string>

namespace omnitrack::domain {

/**
 * @brief Событие: статус заказа изменён
 *
 * Для перехода в CANCELLED публикуется после возврата стока.
 */
struct OrderStatusChangedEvent : public DomainEvent {
    std::string orderId;
    std::string userId;
    OrderStatus fromStatus = OrderStatus::PLACED;
    OrderStatus toStatus = OrderStatus::PLACED;
    std::string changedBy;

    OrderStatusChangedEvent() : DomainEvent("order.status_changed") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderStatusChangedEvent>(*this);
    }
};

} // namespace omnitrack::domain
