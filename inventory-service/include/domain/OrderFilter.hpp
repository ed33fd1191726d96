#pragma once

#include "Order.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace omnitrack::domain {

/**
 * @brief Фильтр выборки заказов
 *
 * Пустые поля не ограничивают выборку. Период включает обе границы.
 */
struct OrderFilter {
    std::optional<OrderStatus> status;
    std::optional<std::string> userId;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;

    bool matches(const Order& order) const {
        if (status && order.status != *status) return false;
        if (userId && order.userId != *userId) return false;
        if (from && order.createdAt < *from) return false;
        if (to && order.createdAt > *to) return false;
        return true;
    }

    static OrderFilter all() { return OrderFilter{}; }

    static OrderFilter byUser(const std::string& userId) {
        OrderFilter filter;
        filter.userId = userId;
        return filter;
    }

    static OrderFilter byStatus(OrderStatus status) {
        OrderFilter filter;
        filter.status = status;
        return filter;
    }

    static OrderFilter byPeriod(const Timestamp& from, const Timestamp& to) {
        OrderFilter filter;
        filter.from = from;
        filter.to = to;
        return filter;
    }
};

} // namespace omnitrack::domain
