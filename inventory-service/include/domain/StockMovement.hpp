#pragma once

#include "enums/StockMovementType.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Запись истории движения стока
 *
 * quantity всегда положительно, направление задаёт type:
 * SALE уменьшает остаток, RESTOCK и CANCEL увеличивают.
 * orderId пуст для пополнения.
 */
struct StockMovement {
    std::string id;
    std::string productId;
    StockMovementType type = StockMovementType::RESTOCK;
    int64_t quantity = 0;
    std::string orderId;
    std::string performedBy;
    Timestamp createdAt;

    StockMovement() = default;

    StockMovement(std::string id, std::string productId, StockMovementType type,
                  int64_t quantity, std::string orderId, std::string performedBy)
        : id(std::move(id))
        , productId(std::move(productId))
        , type(type)
        , quantity(quantity)
        , orderId(std::move(orderId))
        , performedBy(std::move(performedBy))
        , createdAt(Timestamp::now())
    {}

    /**
     * @brief Изменение остатка со знаком
     */
    int64_t delta() const {
        return type == StockMovementType::SALE ? -quantity : quantity;
    }
};

} // namespace omnitrack::domain
