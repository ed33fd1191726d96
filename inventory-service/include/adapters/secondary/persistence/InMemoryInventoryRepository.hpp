#pragma once

#include "ports/output/IProductRepository.hpp"
#include "ports/output/IStockLedger.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <limits>
#include <mutex>
#include <vector>

namespace omnitrack::adapters::secondary {

/**
 * @brief In-memory каталог и складской учёт
 *
 * Один экземпляр реализует оба порта: карточки товаров и их остатки
 * живут в одной записи, поэтому findById всегда видит актуальный остаток.
 *
 * Каждая запись защищена своим mutex. Пакетные операции захватывают
 * записи в порядке возрастания productId (порядок ключей ItemQuantities),
 * что исключает взаимную блокировку двух пересекающихся пакетов.
 */
class InMemoryInventoryRepository
    : public ports::output::IProductRepository
    , public ports::output::IStockLedger
{
public:
    // ========================================================================
    // IProductRepository
    // ========================================================================

    bool create(const domain::Product& product) override {
        auto slot = std::make_shared<ProductSlot>();
        slot->product = product;
        return products_.insertIfAbsent(product.id, slot);
    }

    std::optional<domain::Product> findById(const std::string& id) override {
        auto slot = products_.find(id);
        if (!slot) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        return slot->product;
    }

    std::vector<domain::Product> findAll() override {
        std::vector<domain::Product> result;
        for (const auto& slot : products_.getAll()) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            result.push_back(slot->product);
        }

        std::sort(result.begin(), result.end(),
            [](const domain::Product& a, const domain::Product& b) {
                return a.name != b.name ? a.name < b.name : a.id < b.id;
            });
        return result;
    }

    bool updateThreshold(const std::string& id, int64_t threshold) override {
        auto slot = products_.find(id);
        if (!slot) {
            return false;
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->product.lowStockThreshold = threshold;
        return true;
    }

    bool updatePrice(const std::string& id, const domain::Money& price) override {
        auto slot = products_.find(id);
        if (!slot) {
            return false;
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->product.price = price;
        return true;
    }

    size_t count() override {
        return products_.size();
    }

    // ========================================================================
    // IStockLedger
    // ========================================================================

    domain::StockResult reserve(const std::string& productId, int64_t quantity) override {
        if (quantity <= 0) {
            return invalidQuantity(productId, quantity);
        }
        auto slot = products_.find(productId);
        if (!slot) {
            return notFound(productId);
        }

        std::lock_guard<std::mutex> lock(slot->mutex);
        if (quantity > slot->product.availableQuantity) {
            return insufficient(productId, quantity, slot->product.availableQuantity);
        }
        slot->product.availableQuantity -= quantity;
        return domain::StockResult::ok(productId, slot->product.availableQuantity);
    }

    domain::StockResult release(const std::string& productId, int64_t quantity) override {
        if (quantity <= 0) {
            return invalidQuantity(productId, quantity);
        }
        auto slot = products_.find(productId);
        if (!slot) {
            return notFound(productId);
        }

        std::lock_guard<std::mutex> lock(slot->mutex);
        if (wouldOverflow(slot->product.availableQuantity, quantity)) {
            return overflow(productId, quantity, slot->product.availableQuantity);
        }
        slot->product.availableQuantity += quantity;
        return domain::StockResult::ok(productId, slot->product.availableQuantity);
    }

    domain::StockResult peek(const std::string& productId) override {
        auto slot = products_.find(productId);
        if (!slot) {
            return notFound(productId);
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        return domain::StockResult::ok(productId, slot->product.availableQuantity);
    }

    domain::StockResult reserveAll(const domain::ItemQuantities& lines) override {
        std::vector<std::shared_ptr<ProductSlot>> slots;
        auto resolved = resolveSlots(lines, slots);
        if (!resolved.success) {
            return resolved;
        }

        auto locks = lockInOrder(slots);

        // Сначала проверяем все позиции, затем списываем: либо всё, либо ничего
        size_t index = 0;
        for (const auto& [productId, quantity] : lines) {
            int64_t available = slots[index++]->product.availableQuantity;
            if (quantity > available) {
                return insufficient(productId, quantity, available);
            }
        }

        int64_t totalUnits = 0;
        index = 0;
        for (const auto& [productId, quantity] : lines) {
            slots[index++]->product.availableQuantity -= quantity;
            totalUnits += quantity;
        }
        return domain::StockResult::ok("", totalUnits);
    }

    domain::StockResult releaseAll(const domain::ItemQuantities& lines) override {
        std::vector<std::shared_ptr<ProductSlot>> slots;
        auto resolved = resolveSlots(lines, slots);
        if (!resolved.success) {
            return resolved;
        }

        auto locks = lockInOrder(slots);

        // Проверяем все позиции до зачисления: пакет либо целиком, либо никак
        size_t index = 0;
        for (const auto& [productId, quantity] : lines) {
            int64_t available = slots[index++]->product.availableQuantity;
            if (wouldOverflow(available, quantity)) {
                return overflow(productId, quantity, available);
            }
        }

        int64_t totalUnits = 0;
        index = 0;
        for (const auto& [productId, quantity] : lines) {
            slots[index++]->product.availableQuantity += quantity;
            totalUnits += quantity;
        }
        return domain::StockResult::ok("", totalUnits);
    }

    /**
     * @brief Очистить каталог (для тестов)
     */
    void clear() {
        products_.clear();
    }

private:
    struct ProductSlot {
        std::mutex mutex;
        domain::Product product;
    };

    ThreadSafeMap<std::string, ProductSlot> products_;

    /**
     * @brief Найти записи для всех позиций в порядке ключей
     */
    domain::StockResult resolveSlots(
        const domain::ItemQuantities& lines,
        std::vector<std::shared_ptr<ProductSlot>>& slots
    ) {
        slots.reserve(lines.size());
        for (const auto& [productId, quantity] : lines) {
            if (quantity <= 0) {
                return invalidQuantity(productId, quantity);
            }
            auto slot = products_.find(productId);
            if (!slot) {
                return notFound(productId);
            }
            slots.push_back(std::move(slot));
        }
        return domain::StockResult::ok("", 0);
    }

    static std::vector<std::unique_lock<std::mutex>> lockInOrder(
        const std::vector<std::shared_ptr<ProductSlot>>& slots
    ) {
        std::vector<std::unique_lock<std::mutex>> locks;
        locks.reserve(slots.size());
        for (const auto& slot : slots) {
            locks.emplace_back(slot->mutex);
        }
        return locks;
    }

    static bool wouldOverflow(int64_t available, int64_t quantity) {
        return quantity > std::numeric_limits<int64_t>::max() - available;
    }

    static domain::StockResult overflow(const std::string& productId, int64_t quantity, int64_t available) {
        return domain::StockResult::failure(
            domain::ErrorCode::INVALID_QUANTITY, productId,
            "Release of " + std::to_string(quantity) + " would overflow stock of " + productId +
            " (available " + std::to_string(available) + ")");
    }

    static domain::StockResult notFound(const std::string& productId) {
        return domain::StockResult::failure(
            domain::ErrorCode::NOT_FOUND, productId, "Product not found: " + productId);
    }

    static domain::StockResult invalidQuantity(const std::string& productId, int64_t quantity) {
        return domain::StockResult::failure(
            domain::ErrorCode::INVALID_QUANTITY, productId,
            "Quantity must be > 0, got " + std::to_string(quantity));
    }

    static domain::StockResult insufficient(const std::string& productId, int64_t requested, int64_t available) {
        return domain::StockResult::failure(
            domain::ErrorCode::INSUFFICIENT_STOCK, productId,
            "Insufficient stock for " + productId + ": requested " + std::to_string(requested) +
            ", available " + std::to_string(available));
    }
};

} // namespace omnitrack::adapters::secondary
