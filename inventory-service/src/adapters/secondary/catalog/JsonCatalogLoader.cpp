#include "adapters/secondary/catalog/JsonCatalogLoader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace omnitrack::adapters::secondary {

std::vector<domain::Product> JsonCatalogLoader::parse(const std::string& content) const {
    std::vector<domain::Product> products;

    try {
        auto j = nlohmann::json::parse(content);
        if (!j.is_array()) {
            throw std::runtime_error("Catalog must be a JSON array");
        }

        for (const auto& item : j) {
            if (!item.contains("name") || !item.contains("price")) {
                throw std::runtime_error("Catalog entry requires 'name' and 'price'");
            }

            domain::Product product;
            product.id = item.value("id", "");
            product.name = item.at("name").get<std::string>();
            product.description = item.value("description", "");
            product.category = item.value("category", "");
            product.sku = item.value("sku", "");
            product.price = domain::Money::fromDouble(item.at("price").get<double>(), currency_);
            product.availableQuantity = item.value("stock", static_cast<int64_t>(0));
            product.lowStockThreshold = item.value("lowStockThreshold", defaultLowStockThreshold_);
            products.push_back(product);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid catalog JSON: ") + e.what());
    }

    return products;
}

std::vector<domain::Product> JsonCatalogLoader::loadFromFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open catalog file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

} // namespace omnitrack::adapters::secondary
