#pragma once

#include "domain/Product.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace omnitrack::adapters::secondary {

/**
 * @brief Загрузка начального каталога из JSON
 *
 * Формат - массив объектов:
 * ```json
 * [
 *   {
 *     "id": "prd-widget",
 *     "name": "Widget",
 *     "category": "Hardware",
 *     "price": 12.50,
 *     "stock": 5,
 *     "lowStockThreshold": 2
 *   }
 * ]
 * ```
 * Обязательны name и price. Без id товар получит сгенерированный ID
 * при добавлении, без lowStockThreshold - порог по умолчанию.
 */
class JsonCatalogLoader {
public:
    JsonCatalogLoader(int64_t defaultLowStockThreshold, const std::string& currency)
        : defaultLowStockThreshold_(defaultLowStockThreshold)
        , currency_(currency)
    {}

    /**
     * @throws std::runtime_error при невалидном JSON или отсутствии обязательных полей
     */
    std::vector<domain::Product> parse(const std::string& content) const;

    /**
     * @throws std::runtime_error если файл не открывается или не разбирается
     */
    std::vector<domain::Product> loadFromFile(const std::string& path) const;

private:
    int64_t defaultLowStockThreshold_;
    std::string currency_;
};

} // namespace omnitrack::adapters::secondary
