#pragma once

#include "ports/input/ICartService.hpp"
#include "ports/input/IOrderService.hpp"
#include "ports/output/ICartRepository.hpp"
#include "ports/output/IProductRepository.hpp"
#include <memory>
#include <mutex>
#include <iostream>

namespace omnitrack::application {

/**
 * @brief Сервис корзины
 *
 * Корзина живёт в ICartRepository между сессиями. Изменения
 * сериализуются mutex сервиса: read-modify-write над корзиной
 * одного пользователя не теряет обновлений.
 */
class CartService : public ports::input::ICartService {
public:
    CartService(
        std::shared_ptr<ports::output::ICartRepository> cartRepository,
        std::shared_ptr<ports::output::IProductRepository> catalog,
        std::shared_ptr<ports::input::IOrderService> orderService
    ) : cartRepository_(std::move(cartRepository))
      , catalog_(std::move(catalog))
      , orderService_(std::move(orderService))
    {}

    domain::CartResult addItem(
        const domain::RequestContext& ctx,
        const std::string& productId,
        int64_t quantity
    ) override {
        if (quantity <= 0) {
            return invalidQuantity(quantity);
        }
        try {
            if (!catalog_->findById(productId)) {
                return productNotFound(productId);
            }

            std::lock_guard<std::mutex> lock(mutex_);
            auto cart = loadCart(ctx.userId);
            cart.items[productId] += quantity;
            return store(cart);
        } catch (const std::exception& e) {
            return storageError(ctx.userId, e);
        }
    }

    domain::CartResult setQuantity(
        const domain::RequestContext& ctx,
        const std::string& productId,
        int64_t quantity
    ) override {
        if (quantity < 0) {
            return invalidQuantity(quantity);
        }
        try {
            if (quantity > 0 && !catalog_->findById(productId)) {
                return productNotFound(productId);
            }

            std::lock_guard<std::mutex> lock(mutex_);
            auto cart = loadCart(ctx.userId);
            if (quantity == 0) {
                cart.items.erase(productId);
            } else {
                cart.items[productId] = quantity;
            }
            return store(cart);
        } catch (const std::exception& e) {
            return storageError(ctx.userId, e);
        }
    }

    domain::CartResult removeItem(
        const domain::RequestContext& ctx,
        const std::string& productId
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::Cart cart;
        try {
            cart = loadCart(ctx.userId);
        } catch (const std::exception& e) {
            return storageError(ctx.userId, e);
        }
        if (cart.items.erase(productId) == 0) {
            return domain::CartResult::failure(
                domain::ErrorCode::NOT_FOUND, "Product not in cart: " + productId);
        }
        return store(cart);
    }

    domain::Cart getCart(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return loadCart(userId);
    }

    void clear(const domain::RequestContext& ctx) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cartRepository_->remove(ctx.userId);
    }

    /**
     * @brief Оформить заказ из корзины
     *
     * При отказе (нет стока, ошибка хранилища) корзина остаётся
     * как была, пользователь может исправить её и повторить.
     * Если после оформления корзину не удалось очистить, заказ
     * всё равно считается оформленным.
     */
    domain::OrderResult checkout(const domain::RequestContext& ctx) override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::Cart cart;
        try {
            cart = loadCart(ctx.userId);
        } catch (const std::exception& e) {
            std::cerr << "[CartService] Failed to load cart of " << ctx.userId
                      << ": " << e.what() << std::endl;
            return domain::OrderResult::failure(
                domain::ErrorCode::STORAGE_ERROR, std::string("Failed to load cart: ") + e.what());
        }
        if (cart.empty()) {
            return domain::OrderResult::failure(domain::ErrorCode::INVALID_CART, "Cart is empty");
        }

        auto result = orderService_->placeOrder(ctx, cart.items);
        if (!result.success) {
            std::cerr << "[CartService] Checkout failed for " << ctx.userId
                      << ": " << result.message << std::endl;
            return result;
        }

        try {
            cartRepository_->remove(ctx.userId);
        } catch (const std::exception& e) {
            std::cerr << "[CartService] Failed to clear cart of " << ctx.userId
                      << " after order " << result.order->id << ": " << e.what() << std::endl;
        }
        std::cout << "[CartService] Cart of " << ctx.userId
                  << " checked out as " << result.order->id << std::endl;
        return result;
    }

private:
    std::shared_ptr<ports::output::ICartRepository> cartRepository_;
    std::shared_ptr<ports::output::IProductRepository> catalog_;
    std::shared_ptr<ports::input::IOrderService> orderService_;
    std::mutex mutex_;

    domain::Cart loadCart(const std::string& userId) {
        auto cart = cartRepository_->findByUserId(userId);
        if (cart) {
            return *cart;
        }
        return domain::Cart(userId);
    }

    domain::CartResult store(domain::Cart& cart) {
        cart.updatedAt = domain::Timestamp::now();
        try {
            if (cart.empty()) {
                cartRepository_->remove(cart.userId);
            } else {
                cartRepository_->save(cart);
            }
        } catch (const std::exception& e) {
            std::cerr << "[CartService] Failed to save cart of " << cart.userId
                      << ": " << e.what() << std::endl;
            return domain::CartResult::failure(
                domain::ErrorCode::STORAGE_ERROR, std::string("Failed to save cart: ") + e.what());
        }
        return domain::CartResult::ok(cart);
    }

    static domain::CartResult storageError(const std::string& userId, const std::exception& e) {
        std::cerr << "[CartService] Storage failure for cart of " << userId
                  << ": " << e.what() << std::endl;
        return domain::CartResult::failure(
            domain::ErrorCode::STORAGE_ERROR, std::string("Cart storage failure: ") + e.what());
    }

    static domain::CartResult invalidQuantity(int64_t quantity) {
        return domain::CartResult::failure(
            domain::ErrorCode::INVALID_QUANTITY,
            "Quantity must be > 0, got " + std::to_string(quantity));
    }

    static domain::CartResult productNotFound(const std::string& productId) {
        return domain::CartResult::failure(
            domain::ErrorCode::NOT_FOUND, "Product not found: " + productId);
    }
};

} // namespace omnitrack::application
