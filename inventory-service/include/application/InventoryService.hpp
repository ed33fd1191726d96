#pragma once

#include "ports/input/IInventoryService.hpp"
#include "ports/output/IProductRepository.hpp"
#include "ports/output/IStockLedger.hpp"
#include "ports/output/IEventBus.hpp"
#include "application/ConsistencyLock.hpp"
#include "application/LowStockMonitor.hpp"
#include "application/StockMovementJournal.hpp"
#include "domain/events/StockRestockedEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <iostream>

namespace omnitrack::application {

/**
 * @brief Сервис склада и каталога
 *
 * Пополнение идёт через IStockLedger::release: с точки зрения
 * учёта это то же увеличение остатка, но с проверкой quantity > 0
 * и атрибуцией пользователю.
 */
class InventoryService : public ports::input::IInventoryService {
public:
    InventoryService(
        std::shared_ptr<ports::output::IProductRepository> catalog,
        std::shared_ptr<ports::output::IStockLedger> ledger,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<ConsistencyLock> consistencyLock,
        std::shared_ptr<StockMovementJournal> journal
    ) : catalog_(std::move(catalog))
      , ledger_(std::move(ledger))
      , eventBus_(std::move(eventBus))
      , consistencyLock_(std::move(consistencyLock))
      , journal_(std::move(journal))
    {}

    domain::ProductResult addProduct(
        const domain::RequestContext& ctx,
        const domain::Product& product
    ) override {
        if (product.name.empty()) {
            return invalidProduct("Product name is required");
        }
        if (product.price.isNegative()) {
            return invalidProduct("Price must be >= 0");
        }
        if (product.availableQuantity < 0) {
            return invalidProduct("Initial stock must be >= 0");
        }
        if (product.lowStockThreshold < 0) {
            return invalidProduct("Low stock threshold must be >= 0");
        }

        domain::Product created = product;
        if (created.id.empty()) {
            created.id = utils::UuidGenerator::generateWithPrefix("prd");
        }

        try {
            if (!catalog_->create(created)) {
                return invalidProduct("Product already exists: " + created.id);
            }
        } catch (const std::exception& e) {
            return storageError("Failed to add product", e);
        }

        std::cout << "[InventoryService] Product added: " << created.id
                  << " name=" << created.name
                  << " stock=" << created.availableQuantity
                  << " by " << ctx.userId << std::endl;
        return domain::ProductResult::ok(created);
    }

    std::optional<domain::Product> getProduct(const std::string& productId) override {
        auto lock = consistencyLock_->shared();
        return catalog_->findById(productId);
    }

    std::vector<domain::Product> listProducts(const std::optional<std::string>& category = std::nullopt) override {
        std::vector<domain::Product> products;
        {
            auto lock = consistencyLock_->shared();
            products = catalog_->findAll();
        }
        if (!category) {
            return products;
        }

        std::vector<domain::Product> result;
        for (const auto& product : products) {
            if (product.category == *category) {
                result.push_back(product);
            }
        }
        return result;
    }

    domain::ProductResult restock(
        const domain::RequestContext& ctx,
        const std::string& productId,
        int64_t quantity
    ) override {
        if (quantity <= 0) {
            return domain::ProductResult::failure(
                domain::ErrorCode::INVALID_QUANTITY, "Restock quantity must be > 0");
        }

        auto released = ledger_->release(productId, quantity);
        if (!released.success) {
            return domain::ProductResult::failure(released.error, released.message);
        }

        journal_->recordRestock(productId, quantity, ctx.userId);

        auto product = loadProduct(productId);
        if (!product.success) {
            return product;
        }

        std::cout << "[InventoryService] Restocked " << productId << " +" << quantity
                  << " -> " << released.quantity << " by " << ctx.userId << std::endl;

        domain::StockRestockedEvent event;
        event.productId = productId;
        event.quantity = quantity;
        event.newQuantity = released.quantity;
        event.restockedBy = ctx.userId;
        eventBus_->publish(event);

        return product;
    }

    domain::ProductResult updateThreshold(
        const domain::RequestContext& ctx,
        const std::string& productId,
        int64_t threshold
    ) override {
        if (threshold < 0) {
            return invalidProduct("Low stock threshold must be >= 0");
        }
        try {
            if (!catalog_->updateThreshold(productId, threshold)) {
                return domain::ProductResult::failure(
                    domain::ErrorCode::NOT_FOUND, "Product not found: " + productId);
            }
        } catch (const std::exception& e) {
            return storageError("Failed to update threshold", e);
        }

        std::cout << "[InventoryService] Threshold of " << productId
                  << " set to " << threshold << " by " << ctx.userId << std::endl;

        return loadProduct(productId);
    }

    /**
     * @brief Изменить цену товара
     *
     * Оформленные заказы хранят цену на момент оформления и не меняются.
     */
    domain::ProductResult updatePrice(
        const domain::RequestContext& ctx,
        const std::string& productId,
        const domain::Money& price
    ) override {
        if (price.isNegative()) {
            return invalidProduct("Price must be >= 0");
        }
        try {
            if (!catalog_->updatePrice(productId, price)) {
                return domain::ProductResult::failure(
                    domain::ErrorCode::NOT_FOUND, "Product not found: " + productId);
            }
        } catch (const std::exception& e) {
            return storageError("Failed to update price", e);
        }

        std::cout << "[InventoryService] Price of " << productId
                  << " set to " << price.toDouble() << " " << price.currency
                  << " by " << ctx.userId << std::endl;

        return loadProduct(productId);
    }

    std::vector<domain::StockMovement> listStockMovements(const domain::StockMovementFilter& filter) override {
        return journal_->find(filter);
    }

    std::vector<domain::Product> lowStockProducts() override {
        return LowStockMonitor::detect(listProducts(std::nullopt));
    }

private:
    std::shared_ptr<ports::output::IProductRepository> catalog_;
    std::shared_ptr<ports::output::IStockLedger> ledger_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<ConsistencyLock> consistencyLock_;
    std::shared_ptr<StockMovementJournal> journal_;

    domain::ProductResult loadProduct(const std::string& productId) {
        try {
            auto product = catalog_->findById(productId);
            if (!product) {
                return domain::ProductResult::failure(
                    domain::ErrorCode::NOT_FOUND, "Product not found: " + productId);
            }
            return domain::ProductResult::ok(*product);
        } catch (const std::exception& e) {
            return storageError("Failed to read product", e);
        }
    }

    static domain::ProductResult invalidProduct(const std::string& message) {
        return domain::ProductResult::failure(domain::ErrorCode::INVALID_PRODUCT, message);
    }

    static domain::ProductResult storageError(const std::string& what, const std::exception& e) {
        std::cerr << "[InventoryService] " << what << ": " << e.what() << std::endl;
        return domain::ProductResult::failure(
            domain::ErrorCode::STORAGE_ERROR, what + ": " + e.what());
    }
};

} // namespace omnitrack::application
