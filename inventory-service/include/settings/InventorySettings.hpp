#pragma once

#include <string>
#include <cstdlib>
#include <cstdint>
#include <stdexcept>

namespace omnitrack::settings {

/**
 * @brief Настройки складского ядра
 * 
 * Читает параметры из переменных окружения.
 * 
 * Переменные окружения:
 * - INVENTORY_STORAGE: memory | postgres
 * - INVENTORY_DEFAULT_LOW_STOCK_THRESHOLD: порог для товаров без явного порога
 * - INVENTORY_CURRENCY: валюта цен и выручки
 * - INVENTORY_TOP_PRODUCTS_LIMIT: размер рейтинга товаров на панели
 * - INVENTORY_SEED_FILE: JSON с начальным каталогом (необязательно)
 * 
 * @example
 * ```bash
 * INVENTORY_STORAGE=postgres \
 * INVENTORY_DEFAULT_LOW_STOCK_THRESHOLD=5 \
 * INVENTORY_SEED_FILE=/etc/omnitrack/catalog.json \
 * ./omnitrack-inventory
 * ```
 */
class InventorySettings {
public:
    /**
     * @brief Конструктор - читает настройки из ENV
     * @throws std::invalid_argument при некорректных значениях
     */
    InventorySettings() {
        storage_ = getEnvOrDefault("INVENTORY_STORAGE", "memory");
        defaultLowStockThreshold_ = std::stoll(getEnvOrDefault("INVENTORY_DEFAULT_LOW_STOCK_THRESHOLD", "10"));
        currency_ = getEnvOrDefault("INVENTORY_CURRENCY", "USD");
        topProductsLimit_ = std::stoi(getEnvOrDefault("INVENTORY_TOP_PRODUCTS_LIMIT", "5"));
        seedFile_ = getEnvOrDefault("INVENTORY_SEED_FILE", "");

        if (storage_ != "memory" && storage_ != "postgres") {
            throw std::invalid_argument("INVENTORY_STORAGE must be 'memory' or 'postgres': " + storage_);
        }
        if (defaultLowStockThreshold_ < 0) {
            throw std::invalid_argument("INVENTORY_DEFAULT_LOW_STOCK_THRESHOLD must be >= 0");
        }
        if (topProductsLimit_ < 0) {
            throw std::invalid_argument("INVENTORY_TOP_PRODUCTS_LIMIT must be >= 0");
        }
    }

    std::string getStorage() const { return storage_; }
    bool usePostgres() const { return storage_ == "postgres"; }
    int64_t getDefaultLowStockThreshold() const { return defaultLowStockThreshold_; }
    std::string getCurrency() const { return currency_; }
    int getTopProductsLimit() const { return topProductsLimit_; }
    std::string getSeedFile() const { return seedFile_; }

private:
    std::string storage_;
    int64_t defaultLowStockThreshold_;
    std::string currency_;
    int topProductsLimit_;
    std::string seedFile_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace omnitrack::settings
