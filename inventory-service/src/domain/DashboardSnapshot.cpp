#include "domain/DashboardSnapshot.hpp"
#include <nlohmann/json.hpp>

namespace omnitrack::domain {

namespace {

nlohmann::json moneyToJson(const Money& money) {
    return {
        {"amount", money.toDouble()},
        {"currency", money.currency}
    };
}

} // namespace

std::string DashboardSnapshot::toJson() const {
    nlohmann::json j;
    j["generatedAt"] = generatedAt.toString();
    j["productCount"] = productCount;

    j["metrics"] = {
        {"totalRevenue", moneyToJson(metrics.totalRevenue)},
        {"averageOrderValue", moneyToJson(metrics.averageOrderValue)},
        {"completionRate", metrics.completionRate},
        {"orderCount", metrics.orderCount},
        {"pendingCount", metrics.pendingCount()},
        {"byStatus", {
            {"PLACED", metrics.placedCount},
            {"PAID", metrics.paidCount},
            {"DELIVERED", metrics.deliveredCount},
            {"CANCELLED", metrics.cancelledCount}
        }}
    };

    j["topProducts"] = nlohmann::json::array();
    for (const auto& entry : topProducts) {
        j["topProducts"].push_back({
            {"productId", entry.productId},
            {"productName", entry.productName},
            {"unitsSold", entry.unitsSold},
            {"revenue", moneyToJson(entry.revenue)}
        });
    }

    j["lowStock"] = nlohmann::json::array();
    for (const auto& product : lowStockProducts) {
        j["lowStock"].push_back({
            {"productId", product.id},
            {"name", product.name},
            {"availableQuantity", product.availableQuantity},
            {"lowStockThreshold", product.lowStockThreshold}
        });
    }

    return j.dump();
}

} // namespace omnitrack::domain
