#pragma once

#include "StockMovement.hpp"
#include <optional>
#include <string>
#include <cstddef>

namespace omnitrack::domain {

/**
 * @brief Фильтр истории движений стока
 *
 * Пустые поля не ограничивают выборку. Результат упорядочен от новых
 * к старым и обрезается до limit записей.
 */
struct StockMovementFilter {
    static constexpr size_t DEFAULT_LIMIT = 50;

    std::optional<StockMovementType> type;
    std::optional<std::string> productId;
    size_t limit = DEFAULT_LIMIT;

    bool matches(const StockMovement& movement) const {
        if (type && movement.type != *type) return false;
        if (productId && movement.productId != *productId) return false;
        return true;
    }

    static StockMovementFilter recent() { return StockMovementFilter{}; }

    static StockMovementFilter byProduct(const std::string& productId) {
        StockMovementFilter filter;
        filter.productId = productId;
        return filter;
    }

    static StockMovementFilter byType(StockMovementType type) {
        StockMovementFilter filter;
        filter.type = type;
        return filter;
    }
};

} // namespace omnitrack::domain
