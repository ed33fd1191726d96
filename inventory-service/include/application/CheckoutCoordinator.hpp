#pragma once

#include "application/ConsistencyLock.hpp"
#include "ports/output/IProductRepository.hpp"
#include "ports/output/IStockLedger.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "settings/InventorySettings.hpp"
#include "domain/ItemQuantities.hpp"
#include "domain/OrderResult.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <vector>
#include <iostream>

namespace omnitrack::application {

/**
 * @brief Оформление заказа из корзины
 *
 * Алгоритм:
 * 1. Валидация: корзина не пуста, все количества > 0, все товары известны
 * 2. Резерв стока по всем позициям одним пакетом (всё или ничего)
 * 3. Снимок цен и имён, расчёт суммы, заказ в статусе PLACED
 * 4. Сохранение заказа; при ошибке хранилища резерв возвращается
 *
 * Весь шаг выполняется под ConsistencyLock::exclusive().
 * Любая ошибка оставляет склад и заказы без изменений.
 */
class CheckoutCoordinator {
public:
    CheckoutCoordinator(
        std::shared_ptr<ports::output::IProductRepository> catalog,
        std::shared_ptr<ports::output::IStockLedger> ledger,
        std::shared_ptr<ports::output::IOrderRepository> orderRepository,
        std::shared_ptr<ConsistencyLock> consistencyLock,
        std::shared_ptr<settings::InventorySettings> settings
    ) : catalog_(std::move(catalog))
      , ledger_(std::move(ledger))
      , orderRepository_(std::move(orderRepository))
      , consistencyLock_(std::move(consistencyLock))
      , settings_(std::move(settings))
    {}

    /**
     * @brief Оформить заказ
     *
     * @param userId Владелец заказа
     * @param cartItems productId → количество
     * @return Заказ PLACED или INVALID_CART / INSUFFICIENT_STOCK / STORAGE_ERROR
     */
    domain::OrderResult placeOrder(const std::string& userId, const domain::ItemQuantities& cartItems) {
        if (userId.empty()) {
            return invalidCart("User reference is required");
        }
        if (cartItems.empty()) {
            return invalidCart("Cart is empty");
        }
        for (const auto& [productId, quantity] : cartItems) {
            if (quantity <= 0) {
                return invalidCart("Quantity must be > 0 for product " + productId);
            }
        }

        auto lock = consistencyLock_->exclusive();

        // Товары читаются до резерва: неизвестный товар - ошибка корзины, а не склада
        std::vector<domain::Product> products;
        products.reserve(cartItems.size());
        try {
            for (const auto& [productId, quantity] : cartItems) {
                auto product = catalog_->findById(productId);
                if (!product) {
                    return invalidCart("Unknown product: " + productId);
                }
                products.push_back(*product);
            }
        } catch (const std::exception& e) {
            std::cerr << "[CheckoutCoordinator] Failed to read catalog for " << userId
                      << ": " << e.what() << std::endl;
            return domain::OrderResult::failure(
                domain::ErrorCode::STORAGE_ERROR,
                std::string("Failed to read catalog: ") + e.what());
        }

        auto reserved = ledger_->reserveAll(cartItems);
        if (!reserved.success) {
            std::cerr << "[CheckoutCoordinator] Rejected checkout for " << userId
                      << ": " << reserved.message << std::endl;
            if (reserved.error == domain::ErrorCode::NOT_FOUND) {
                return invalidCart(reserved.message);
            }
            return domain::OrderResult::failure(reserved.error, reserved.message);
        }

        std::vector<domain::OrderItem> items;
        items.reserve(products.size());
        for (const auto& product : products) {
            items.emplace_back(product.id, product.name, cartItems.at(product.id), product.price);
        }

        domain::Order order(
            utils::UuidGenerator::generateWithPrefix("ord"),
            userId,
            items,
            settings_->getCurrency()
        );

        try {
            orderRepository_->save(order);
        } catch (const std::exception& e) {
            std::cerr << "[CheckoutCoordinator] Failed to persist order " << order.id
                      << ": " << e.what() << ", releasing reservation" << std::endl;
            auto compensated = ledger_->releaseAll(cartItems);
            if (!compensated.success) {
                std::cerr << "[CheckoutCoordinator] Compensation failed for order " << order.id
                          << ": " << compensated.message << std::endl;
            }
            return domain::OrderResult::failure(
                domain::ErrorCode::STORAGE_ERROR,
                std::string("Failed to persist order: ") + e.what());
        }

        std::cout << "[CheckoutCoordinator] Order placed: " << order.id
                  << " user=" << userId
                  << " units=" << order.totalUnits()
                  << " total=" << order.total.toDouble() << " " << order.total.currency << std::endl;

        return domain::OrderResult::ok(order, "Order placed");
    }

private:
    std::shared_ptr<ports::output::IProductRepository> catalog_;
    std::shared_ptr<ports::output::IStockLedger> ledger_;
    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<ConsistencyLock> consistencyLock_;
    std::shared_ptr<settings::InventorySettings> settings_;

    static domain::OrderResult invalidCart(const std::string& message) {
        return domain::OrderResult::failure(domain::ErrorCode::INVALID_CART, message);
    }
};

} // namespace omnitrack::application
