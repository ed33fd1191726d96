#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Позиция заказа
 *
 * Цена и имя фиксируются в момент оформления и не зависят
 * от последующих изменений карточки товара.
 */
struct OrderItem {
    std::string productId;
    std::string productName;    ///< Снимок имени
    int64_t quantity = 0;       ///< > 0
    Money unitPrice;            ///< Снимок цены

    OrderItem() = default;

    OrderItem(
        const std::string& productId,
        const std::string& productName,
        int64_t quantity,
        const Money& unitPrice
    ) : productId(productId), productName(productName),
        quantity(quantity), unitPrice(unitPrice) {}

    Money lineTotal() const {
        return unitPrice * quantity;
    }
};

} // namespace omnitrack::domain
