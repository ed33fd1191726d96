#pragma once

#include "domain/Order.hpp"
#include "domain/OrderMetrics.hpp"
#include "domain/Timestamp.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace omnitrack::application {

/**
 * @brief Аналитика по набору заказов
 *
 * Только чтение, без инвариантов. Пустая выборка даёт нулевые
 * показатели, деления на ноль нет.
 *
 * - Выручка: сумма заказов в PAID и DELIVERED
 * - Доля выполненных: DELIVERED / все, кроме CANCELLED
 * - Средний чек: выручка / число заказов в PAID и DELIVERED
 */
class MetricsAggregator {
public:
    /**
     * @param from Начало периода (включительно), nullopt - без ограничения
     * @param to Конец периода (включительно)
     * @param currency Валюта нулевых сумм для пустой выборки
     */
    static domain::OrderMetrics aggregate(
        const std::vector<domain::Order>& orders,
        const std::optional<domain::Timestamp>& from = std::nullopt,
        const std::optional<domain::Timestamp>& to = std::nullopt,
        const std::string& currency = "USD"
    ) {
        domain::OrderMetrics metrics;
        metrics.totalRevenue = domain::Money(0, currency);
        metrics.averageOrderValue = domain::Money(0, currency);

        for (const auto& order : orders) {
            if (!inPeriod(order, from, to)) {
                continue;
            }
            ++metrics.orderCount;

            switch (order.status) {
                case domain::OrderStatus::PLACED:    ++metrics.placedCount; break;
                case domain::OrderStatus::PAID:      ++metrics.paidCount; break;
                case domain::OrderStatus::DELIVERED: ++metrics.deliveredCount; break;
                case domain::OrderStatus::CANCELLED: ++metrics.cancelledCount; break;
            }

            if (domain::isRevenueStatus(order.status)) {
                metrics.totalRevenue = metrics.totalRevenue + order.total;
            }
        }

        int64_t nonCancelled = metrics.orderCount - metrics.cancelledCount;
        if (nonCancelled > 0) {
            metrics.completionRate =
                static_cast<double>(metrics.deliveredCount) / static_cast<double>(nonCancelled);
        }

        metrics.averageOrderValue = metrics.totalRevenue.dividedBy(metrics.revenueOrderCount());
        return metrics;
    }

    /**
     * @brief Рейтинг товаров по выручке
     *
     * Учитываются только PAID и DELIVERED. Сортировка по убыванию выручки,
     * при равенстве - по productId.
     */
    static std::vector<domain::ProductRevenue> topProductsByRevenue(
        const std::vector<domain::Order>& orders,
        size_t limit = 5
    ) {
        std::map<std::string, domain::ProductRevenue> byProduct;

        for (const auto& order : orders) {
            if (!domain::isRevenueStatus(order.status)) {
                continue;
            }
            for (const auto& item : order.items) {
                auto it = byProduct.find(item.productId);
                if (it == byProduct.end()) {
                    domain::ProductRevenue entry;
                    entry.productId = item.productId;
                    entry.productName = item.productName;
                    entry.revenue = domain::Money(0, item.unitPrice.currency);
                    it = byProduct.emplace(item.productId, entry).first;
                }
                it->second.unitsSold += item.quantity;
                it->second.revenue = it->second.revenue + item.lineTotal();
            }
        }

        std::vector<domain::ProductRevenue> result;
        result.reserve(byProduct.size());
        for (const auto& [productId, entry] : byProduct) {
            result.push_back(entry);
        }

        std::sort(result.begin(), result.end(),
            [](const domain::ProductRevenue& a, const domain::ProductRevenue& b) {
                if (a.revenue.cents != b.revenue.cents) {
                    return a.revenue.cents > b.revenue.cents;
                }
                return a.productId < b.productId;
            });

        if (result.size() > limit) {
            result.resize(limit);
        }
        return result;
    }

private:
    static bool inPeriod(
        const domain::Order& order,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to
    ) {
        if (from && order.createdAt < *from) return false;
        if (to && order.createdAt > *to) return false;
        return true;
    }
};

} // namespace omnitrack::application
