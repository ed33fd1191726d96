#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Агрегированные показатели по набору заказов
 *
 * Пустой набор даёт нули, а не ошибку.
 */
struct OrderMetrics {
    Money totalRevenue;             ///< Сумма PAID + DELIVERED
    double completionRate = 0.0;    ///< DELIVERED / не отменённые
    Money averageOrderValue;        ///< totalRevenue / число оплаченных заказов

    int64_t orderCount = 0;
    int64_t placedCount = 0;
    int64_t paidCount = 0;
    int64_t deliveredCount = 0;
    int64_t cancelledCount = 0;

    /**
     * @brief Заказы, ожидающие действий персонала (PLACED + PAID)
     */
    int64_t pendingCount() const {
        return placedCount + paidCount;
    }

    int64_t revenueOrderCount() const {
        return paidCount + deliveredCount;
    }
};

/**
 * @brief Выручка по одному товару
 */
struct ProductRevenue {
    std::string productId;
    std::string productName;
    int64_t unitsSold = 0;
    Money revenue;
};

} // namespace omnitrack::domain
