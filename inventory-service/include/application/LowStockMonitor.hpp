#pragma once

#include "domain/Product.hpp"
#include <vector>

namespace omnitrack::application {

/**
 * @brief Признак "мало на складе"
 *
 * Чистые функции над снимком товаров, без состояния и кэша.
 * Вызывающий обязан передавать актуальный снимок.
 */
class LowStockMonitor {
public:
    static bool isLowStock(const domain::Product& product) {
        return product.availableQuantity <= product.lowStockThreshold;
    }

    /**
     * @brief Товары с остатком на пороге или ниже, в исходном порядке
     */
    static std::vector<domain::Product> detect(const std::vector<domain::Product>& products) {
        std::vector<domain::Product> result;
        for (const auto& product : products) {
            if (isLowStock(product)) {
                result.push_back(product);
            }
        }
        return result;
    }
};

} // namespace omnitrack::application
