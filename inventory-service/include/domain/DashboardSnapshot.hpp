#pragma once

#include "OrderMetrics.hpp"
#include "Product.hpp"
#include "Timestamp.hpp"
#include <vector>
#include <string>

namespace omnitrack::domain {

/**
 * @brief Согласованный снимок для панелей администратора и персонала
 */
struct DashboardSnapshot {
    OrderMetrics metrics;
    std::vector<ProductRevenue> topProducts;
    std::vector<Product> lowStockProducts;
    int64_t productCount = 0;
    Timestamp generatedAt;

    /**
     * @brief Сериализовать в JSON
     */
    std::string toJson() const;
};

} // namespace omnitrack::domain
