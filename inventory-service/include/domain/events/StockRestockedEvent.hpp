#pragma once

#include "DomainEvent.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Событие: склад пополнен
 */
struct StockRestockedEvent : public DomainEvent {
    std::string productId;
    int64_t quantity = 0;           ///< Сколько добавлено
    int64_t newQuantity = 0;        ///< Остаток после пополнения
    std::string restockedBy;

    StockRestockedEvent() : DomainEvent("stock.restocked") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<StockRestockedEvent>(*this);
    }
};

} // namespace omnitrack::domain
