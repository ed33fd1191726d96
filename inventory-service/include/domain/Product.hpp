#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace omnitrack::domain {

/**
 * @brief Карточка товара каталога
 *
 * Простая запись данных. availableQuantity меняется только через IStockLedger,
 * признак "мало на складе" вычисляет LowStockMonitor.
 */
struct Product {
    std::string id;                 ///< Уникальный ID (prd-xxxxxxxx)
    std::string name;               ///< Отображаемое имя
    std::string description;
    std::string category;
    std::string sku;
    Money price;                    ///< Текущая цена
    int64_t availableQuantity = 0;  ///< Доступно на складе, >= 0
    int64_t lowStockThreshold = 10; ///< Порог "мало на складе", >= 0

    Product() = default;

    Product(
        const std::string& id,
        const std::string& name,
        const Money& price,
        int64_t availableQuantity,
        int64_t lowStockThreshold
    ) : id(id), name(name), price(price),
        availableQuantity(availableQuantity), lowStockThreshold(lowStockThreshold) {}
};

} // namespace omnitrack::domain
