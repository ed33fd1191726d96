#pragma once

#include "ports/input/IReportingService.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IProductRepository.hpp"
#include "application/ConsistencyLock.hpp"
#include "application/MetricsAggregator.hpp"
#include "application/LowStockMonitor.hpp"
#include "settings/InventorySettings.hpp"
#include <memory>

namespace omnitrack::application {

/**
 * @brief Аналитика для панелей
 *
 * Заказы и товары читаются под ConsistencyLock::shared(), поэтому
 * снимок не может застать оформление или отмену посередине.
 */
class ReportingService : public ports::input::IReportingService {
public:
    ReportingService(
        std::shared_ptr<ports::output::IOrderRepository> orderRepository,
        std::shared_ptr<ports::output::IProductRepository> catalog,
        std::shared_ptr<ConsistencyLock> consistencyLock,
        std::shared_ptr<settings::InventorySettings> settings
    ) : orderRepository_(std::move(orderRepository))
      , catalog_(std::move(catalog))
      , consistencyLock_(std::move(consistencyLock))
      , settings_(std::move(settings))
    {}

    domain::OrderMetrics metrics(
        const std::optional<domain::Timestamp>& from = std::nullopt,
        const std::optional<domain::Timestamp>& to = std::nullopt
    ) override {
        std::vector<domain::Order> orders;
        {
            auto lock = consistencyLock_->shared();
            orders = orderRepository_->findAll(domain::OrderFilter::all());
        }
        return MetricsAggregator::aggregate(orders, from, to, settings_->getCurrency());
    }

    std::vector<domain::ProductRevenue> topProducts(size_t limit) override {
        std::vector<domain::Order> orders;
        {
            auto lock = consistencyLock_->shared();
            orders = orderRepository_->findAll(domain::OrderFilter::all());
        }
        return MetricsAggregator::topProductsByRevenue(orders, limit);
    }

    domain::DashboardSnapshot dashboard(
        const std::optional<domain::Timestamp>& from = std::nullopt,
        const std::optional<domain::Timestamp>& to = std::nullopt
    ) override {
        std::vector<domain::Order> orders;
        std::vector<domain::Product> products;
        {
            auto lock = consistencyLock_->shared();
            orders = orderRepository_->findAll(domain::OrderFilter::all());
            products = catalog_->findAll();
        }

        domain::OrderFilter period;
        period.from = from;
        period.to = to;
        std::vector<domain::Order> periodOrders;
        for (const auto& order : orders) {
            if (period.matches(order)) {
                periodOrders.push_back(order);
            }
        }

        domain::DashboardSnapshot snapshot;
        snapshot.metrics = MetricsAggregator::aggregate(periodOrders, std::nullopt, std::nullopt, settings_->getCurrency());
        snapshot.topProducts = MetricsAggregator::topProductsByRevenue(
            periodOrders, static_cast<size_t>(settings_->getTopProductsLimit()));
        snapshot.lowStockProducts = LowStockMonitor::detect(products);
        snapshot.productCount = static_cast<int64_t>(products.size());
        snapshot.generatedAt = domain::Timestamp::now();
        return snapshot;
    }

private:
    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<ports::output::IProductRepository> catalog_;
    std::shared_ptr<ConsistencyLock> consistencyLock_;
    std::shared_ptr<settings::InventorySettings> settings_;
};

} // namespace omnitrack::application
