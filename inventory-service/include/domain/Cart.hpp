#pragma once

#include "ItemQuantities.hpp"
#include "Timestamp.hpp"
#include <string>

namespace omnitrack::domain {

/**
 * @brief Корзина покупателя
 *
 * Хранится между сессиями, одна на пользователя.
 */
struct Cart {
    std::string userId;
    ItemQuantities items;       ///< productId → количество
    Timestamp updatedAt;

    Cart() = default;

    explicit Cart(const std::string& userId) : userId(userId) {}

    bool empty() const { return items.empty(); }

    int64_t totalUnits() const {
        int64_t units = 0;
        for (const auto& [productId, quantity] : items) {
            units += quantity;
        }
        return units;
    }
};

} // namespace omnitrack::domain
