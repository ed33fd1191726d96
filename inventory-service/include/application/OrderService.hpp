#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IStockLedger.hpp"
#include "ports/output/IProductRepository.hpp"
#include "ports/output/IEventBus.hpp"
#include "application/CheckoutCoordinator.hpp"
#include "application/OrderLifecycle.hpp"
#include "application/ConsistencyLock.hpp"
#include "application/LowStockMonitor.hpp"
#include "application/StockMovementJournal.hpp"
#include "domain/events/OrderPlacedEvent.hpp"
#include "domain/events/OrderStatusChangedEvent.hpp"
#include "domain/events/LowStockEvent.hpp"
#include <memory>
#include <iostream>

namespace omnitrack::application {

/**
 * @brief Сервис управления заказами
 *
 * Реализует IOrderService, координирует работу между:
 * - CheckoutCoordinator (оформление с резервом стока)
 * - OrderLifecycle (переходы статусов, возврат стока при отмене)
 * - IOrderRepository (хранение заказов)
 * - IEventBus (публикация событий)
 * - StockMovementJournal (история движений стока)
 */
class OrderService : public ports::input::IOrderService {
public:
    OrderService(
        std::shared_ptr<CheckoutCoordinator> checkout,
        std::shared_ptr<OrderLifecycle> lifecycle,
        std::shared_ptr<ports::output::IOrderRepository> orderRepository,
        std::shared_ptr<ports::output::IStockLedger> ledger,
        std::shared_ptr<ports::output::IProductRepository> catalog,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<ConsistencyLock> consistencyLock,
        std::shared_ptr<StockMovementJournal> journal
    ) : checkout_(std::move(checkout))
      , lifecycle_(std::move(lifecycle))
      , orderRepository_(std::move(orderRepository))
      , ledger_(std::move(ledger))
      , catalog_(std::move(catalog))
      , eventBus_(std::move(eventBus))
      , consistencyLock_(std::move(consistencyLock))
      , journal_(std::move(journal))
    {}

    domain::OrderResult placeOrder(
        const domain::RequestContext& ctx,
        const domain::ItemQuantities& items
    ) override {
        auto result = checkout_->placeOrder(ctx.userId, items);
        if (!result.success) {
            return result;
        }

        journal_->recordSale(*result.order);
        publishOrderPlacedEvent(*result.order);
        publishLowStockEvents(*result.order);
        return result;
    }

    /**
     * @brief Перевести заказ в новый статус
     *
     * Чтение, переход, возврат стока и сохранение - один шаг под
     * эксклюзивной блокировкой. Повторная отмена того же заказа увидит
     * CANCELLED и получит ILLEGAL_TRANSITION, поэтому сток возвращается
     * ровно один раз.
     */
    domain::OrderResult transitionOrder(
        const domain::RequestContext& ctx,
        const std::string& orderId,
        domain::OrderStatus target
    ) override {
        domain::OrderStatus fromStatus = domain::OrderStatus::PLACED;
        domain::OrderResult result;
        {
            auto lock = consistencyLock_->exclusive();

            std::optional<domain::Order> order;
            try {
                order = orderRepository_->findById(orderId);
            } catch (const std::exception& e) {
                std::cerr << "[OrderService] Failed to load order " << orderId
                          << ": " << e.what() << std::endl;
                return domain::OrderResult::failure(
                    domain::ErrorCode::STORAGE_ERROR,
                    std::string("Failed to load order: ") + e.what());
            }
            if (!order) {
                return domain::OrderResult::failure(
                    domain::ErrorCode::NOT_FOUND, "Order not found: " + orderId);
            }

            fromStatus = order->status;
            result = lifecycle_->transition(*order, target, ctx.userId);
            if (!result.success) {
                std::cerr << "[OrderService] Transition rejected for " << orderId
                          << ": " << result.message << std::endl;
                return result;
            }

            auto persisted = persistTransition(*order, fromStatus);
            if (!persisted.success) {
                return persisted;
            }
        }

        std::cout << "[OrderService] Order " << orderId << ": "
                  << domain::toString(fromStatus) << " -> " << domain::toString(target)
                  << " by " << ctx.userId << std::endl;

        if (target == domain::OrderStatus::CANCELLED) {
            journal_->recordCancellation(*result.order, ctx.userId);
        }
        publishStatusChangedEvent(*result.order, fromStatus);
        return result;
    }

    domain::OrderResult cancelOrder(
        const domain::RequestContext& ctx,
        const std::string& orderId
    ) override {
        return transitionOrder(ctx, orderId, domain::OrderStatus::CANCELLED);
    }

    std::optional<domain::Order> getOrder(const std::string& orderId) override {
        auto lock = consistencyLock_->shared();
        try {
            return orderRepository_->findById(orderId);
        } catch (const std::exception& e) {
            std::cerr << "[OrderService] Failed to load order " << orderId
                      << ": " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Order> listOrders(const domain::OrderFilter& filter) override {
        auto lock = consistencyLock_->shared();
        return orderRepository_->findAll(filter);
    }

    std::vector<domain::Order> listUserOrders(const std::string& userId) override {
        return listOrders(domain::OrderFilter::byUser(userId));
    }

    /**
     * @brief Заказы PLACED и PAID, новые первыми
     */
    std::vector<domain::Order> listActionableOrders() override {
        auto all = listOrders(domain::OrderFilter::all());
        std::vector<domain::Order> result;
        for (const auto& order : all) {
            if (domain::isActionable(order.status)) {
                result.push_back(order);
            }
        }
        return result;
    }

private:
    std::shared_ptr<CheckoutCoordinator> checkout_;
    std::shared_ptr<OrderLifecycle> lifecycle_;
    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<ports::output::IStockLedger> ledger_;
    std::shared_ptr<ports::output::IProductRepository> catalog_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<ConsistencyLock> consistencyLock_;
    std::shared_ptr<StockMovementJournal> journal_;

    /**
     * @brief Сохранить результат перехода
     *
     * Если сохранить не удалось после возврата стока, резерв
     * восстанавливается, чтобы сток и статус не разошлись.
     */
    domain::OrderResult persistTransition(const domain::Order& order, domain::OrderStatus fromStatus) {
        bool updated = false;
        std::string failure;
        try {
            updated = orderRepository_->update(order);
            if (!updated) {
                failure = "Order disappeared during transition: " + order.id;
            }
        } catch (const std::exception& e) {
            failure = std::string("Failed to persist transition: ") + e.what();
        }

        if (updated) {
            return domain::OrderResult::ok(order);
        }

        std::cerr << "[OrderService] " << failure << std::endl;
        if (order.status == domain::OrderStatus::CANCELLED) {
            domain::ItemQuantities lines;
            for (const auto& item : order.items) {
                lines[item.productId] += item.quantity;
            }
            auto restored = ledger_->reserveAll(lines);
            if (!restored.success) {
                std::cerr << "[OrderService] Failed to restore reservation for " << order.id
                          << " (was " << domain::toString(fromStatus) << "): "
                          << restored.message << std::endl;
            }
        }
        return domain::OrderResult::failure(domain::ErrorCode::STORAGE_ERROR, failure);
    }

    void publishOrderPlacedEvent(const domain::Order& order) {
        domain::OrderPlacedEvent event;
        event.orderId = order.id;
        event.userId = order.userId;
        event.itemCount = static_cast<int64_t>(order.items.size());
        event.totalUnits = order.totalUnits();
        event.total = order.total;
        eventBus_->publish(event);
    }

    void publishStatusChangedEvent(const domain::Order& order, domain::OrderStatus fromStatus) {
        domain::OrderStatusChangedEvent event;
        event.orderId = order.id;
        event.userId = order.userId;
        event.fromStatus = fromStatus;
        event.toStatus = order.status;
        event.changedBy = order.updatedBy;
        eventBus_->publish(event);
    }

    /**
     * @brief stock.low для товаров заказа, оказавшихся на пороге или ниже
     */
    void publishLowStockEvents(const domain::Order& order) {
        for (const auto& item : order.items) {
            std::optional<domain::Product> product;
            try {
                product = catalog_->findById(item.productId);
            } catch (const std::exception& e) {
                std::cerr << "[OrderService] Low stock check skipped for " << item.productId
                          << ": " << e.what() << std::endl;
                continue;
            }
            if (!product || !LowStockMonitor::isLowStock(*product)) {
                continue;
            }

            std::cout << "[OrderService] Low stock: " << product->id
                      << " available=" << product->availableQuantity
                      << " threshold=" << product->lowStockThreshold << std::endl;

            domain::LowStockEvent event;
            event.productId = product->id;
            event.productName = product->name;
            event.availableQuantity = product->availableQuantity;
            event.lowStockThreshold = product->lowStockThreshold;
            eventBus_->publish(event);
        }
    }
};

} // namespace omnitrack::application
