#pragma once

#include "enums/OrderStatus.hpp"
#include "OrderItem.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>

namespace omnitrack::domain {

/**
 * @brief Заказ покупателя
 *
 * Создаётся только CheckoutCoordinator в статусе PLACED,
 * статус меняется только через OrderLifecycle. Не удаляется.
 */
struct Order {
    std::string id;                 ///< ID заказа (ord-xxxxxxxx)
    std::string userId;             ///< Владелец (только для атрибуции)
    OrderStatus status;
    std::vector<OrderItem> items;
    Money total;                    ///< Сумма позиций
    Timestamp createdAt;
    Timestamp updatedAt;
    std::string updatedBy;          ///< Кто выполнил последний переход

    Order() : status(OrderStatus::PLACED) {}

    Order(
        const std::string& id,
        const std::string& userId,
        const std::vector<OrderItem>& items,
        const std::string& currency = "USD"
    ) : id(id), userId(userId), status(OrderStatus::PLACED), items(items),
        total(0, currency), createdAt(Timestamp::now()), updatedAt(createdAt),
        updatedBy(userId)
    {
        recalculateTotal();
    }

    bool isTerminal() const {
        return isTerminalStatus(status);
    }

    /**
     * @brief Пересчитать сумму заказа по позициям
     */
    void recalculateTotal() {
        Money sum(0, total.currency);
        for (const auto& item : items) {
            sum = sum + item.lineTotal();
        }
        total = sum;
    }

    /**
     * @brief Общее количество единиц товара в заказе
     */
    int64_t totalUnits() const {
        int64_t units = 0;
        for (const auto& item : items) {
            units += item.quantity;
        }
        return units;
    }
};

} // namespace omnitrack::domain
