#pragma once

#include "ports/output/IProductRepository.hpp"
#include "ports/output/IStockLedger.hpp"
#include <pqxx/pqxx>
#include <mutex>
#include <memory>
#include <iostream>

namespace omnitrack::adapters::secondary {

/**
 * @brief PostgreSQL каталог и складской учёт
 *
 * Остаток хранится в колонке products.stock_quantity. Резерв - условный
 * UPDATE ... WHERE stock_quantity >= $2, поэтому списание не уходит в минус
 * и при нескольких процессах над одной БД. Пакетные операции идут одной
 * транзакцией: при первой неудаче транзакция откатывается целиком.
 *
 * Ошибки БД в операциях учёта возвращаются как STORAGE_ERROR,
 * операции каталога логируют их и пробрасывают исключение.
 */
class PostgresInventoryRepository
    : public ports::output::IProductRepository
    , public ports::output::IStockLedger
{
public:
    explicit PostgresInventoryRepository(const std::string& connectionString)
    {
        std::cout << "[PostgresInventoryRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            std::cout << "[PostgresInventoryRepo] Connected successfully" << std::endl;
            initSchema();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresInventoryRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    // ========================================================================
    // IProductRepository
    // ========================================================================

    bool create(const domain::Product& product) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    INSERT INTO products (
                        id, name, description, category, sku,
                        price_cents, currency, stock_quantity, low_stock_threshold
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)
                    ON CONFLICT (id) DO NOTHING
                )",
                product.id,
                product.name,
                product.description,
                product.category,
                product.sku,
                product.price.cents,
                product.price.currency,
                product.availableQuantity,
                product.lowStockThreshold
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryRepo] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Product> findById(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT " + std::string(PRODUCT_COLUMNS) + " FROM products WHERE id = $1",
                id
            );

            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToProduct(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryRepo] findById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Product> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec(
                "SELECT " + std::string(PRODUCT_COLUMNS) + " FROM products ORDER BY name, id"
            );

            txn.commit();

            std::vector<domain::Product> products;
            products.reserve(result.size());
            for (const auto& row : result) {
                products.push_back(rowToProduct(row));
            }
            return products;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryRepo] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool updateThreshold(const std::string& id, int64_t threshold) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "UPDATE products SET low_stock_threshold = $2 WHERE id = $1",
                id,
                threshold
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryRepo] updateThreshold() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool updatePrice(const std::string& id, const domain::Money& price) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "UPDATE products SET price_cents = $2, currency = $3 WHERE id = $1",
                id,
                price.cents,
                price.currency
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryRepo] updatePrice() failed: " << e.what() << std::endl;
            throw;
        }
    }

    size_t count() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec("SELECT COUNT(*) FROM products");
            txn.commit();
            return result[0][0].as<size_t>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryRepo] count() failed: " << e.what() << std::endl;
            throw;
        }
    }

    // ========================================================================
    // IStockLedger
    // ========================================================================

    domain::StockResult reserve(const std::string& productId, int64_t quantity) override {
        if (quantity <= 0) {
            return invalidQuantity(productId, quantity);
        }

        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = decrement(txn, productId, quantity);
            if (result.success) {
                txn.commit();
            }
            return result;

        } catch (const std::exception& e) {
            return storageError("reserve", productId, e);
        }
    }

    domain::StockResult release(const std::string& productId, int64_t quantity) override {
        if (quantity <= 0) {
            return invalidQuantity(productId, quantity);
        }

        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = increment(txn, productId, quantity);
            if (result.success) {
                txn.commit();
            }
            return result;

        } catch (const std::exception& e) {
            return storageError("release", productId, e);
        }
    }

    domain::StockResult peek(const std::string& productId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT stock_quantity FROM products WHERE id = $1",
                productId
            );

            txn.commit();

            if (result.empty()) {
                return notFound(productId);
            }
            return domain::StockResult::ok(productId, result[0][0].as<int64_t>());

        } catch (const std::exception& e) {
            return storageError("peek", productId, e);
        }
    }

    /**
     * @brief Пакетный резерв одной транзакцией
     *
     * Строки обновляются в порядке возрастания productId, как и в
     * in-memory реализации: встречные пакеты не блокируют друг друга навечно.
     */
    domain::StockResult reserveAll(const domain::ItemQuantities& lines) override {
        for (const auto& [productId, quantity] : lines) {
            if (quantity <= 0) {
                return invalidQuantity(productId, quantity);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            int64_t totalUnits = 0;
            for (const auto& [productId, quantity] : lines) {
                auto result = decrement(txn, productId, quantity);
                if (!result.success) {
                    txn.abort();
                    return result;
                }
                totalUnits += quantity;
            }

            txn.commit();
            return domain::StockResult::ok("", totalUnits);

        } catch (const std::exception& e) {
            return storageError("reserveAll", "", e);
        }
    }

    domain::StockResult releaseAll(const domain::ItemQuantities& lines) override {
        for (const auto& [productId, quantity] : lines) {
            if (quantity <= 0) {
                return invalidQuantity(productId, quantity);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            int64_t totalUnits = 0;
            for (const auto& [productId, quantity] : lines) {
                auto result = increment(txn, productId, quantity);
                if (!result.success) {
                    txn.abort();
                    return result;
                }
                totalUnits += quantity;
            }

            txn.commit();
            return domain::StockResult::ok("", totalUnits);

        } catch (const std::exception& e) {
            return storageError("releaseAll", "", e);
        }
    }

    bool isConnected() const {
        return connection_ && connection_->is_open();
    }

private:
    static constexpr const char* PRODUCT_COLUMNS =
        "id, name, description, category, sku, price_cents, currency, "
        "stock_quantity, low_stock_threshold";

    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    void initSchema() {
        pqxx::work txn(*connection_);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS products (
                id                  TEXT PRIMARY KEY,
                name                TEXT NOT NULL,
                description         TEXT NOT NULL DEFAULT '',
                category            TEXT NOT NULL DEFAULT '',
                sku                 TEXT NOT NULL DEFAULT '',
                price_cents         BIGINT NOT NULL CHECK (price_cents >= 0),
                currency            TEXT NOT NULL DEFAULT 'USD',
                stock_quantity      BIGINT NOT NULL CHECK (stock_quantity >= 0),
                low_stock_threshold BIGINT NOT NULL DEFAULT 10 CHECK (low_stock_threshold >= 0)
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_products_category ON products(category)");
        txn.commit();
        std::cout << "[PostgresInventoryRepo] Schema initialized" << std::endl;
    }

    /**
     * @brief Условное списание внутри открытой транзакции
     */
    domain::StockResult decrement(pqxx::work& txn, const std::string& productId, int64_t quantity) {
        auto updated = txn.exec_params(
            R"(
                UPDATE products SET stock_quantity = stock_quantity - $2
                WHERE id = $1 AND stock_quantity >= $2
                RETURNING stock_quantity
            )",
            productId,
            quantity
        );

        if (!updated.empty()) {
            return domain::StockResult::ok(productId, updated[0][0].as<int64_t>());
        }

        auto current = txn.exec_params(
            "SELECT stock_quantity FROM products WHERE id = $1",
            productId
        );
        if (current.empty()) {
            return notFound(productId);
        }
        return insufficient(productId, quantity, current[0][0].as<int64_t>());
    }

    domain::StockResult increment(pqxx::work& txn, const std::string& productId, int64_t quantity) {
        auto updated = txn.exec_params(
            R"(
                UPDATE products SET stock_quantity = stock_quantity + $2
                WHERE id = $1 AND stock_quantity <= 9223372036854775807 - $2
                RETURNING stock_quantity
            )",
            productId,
            quantity
        );

        if (!updated.empty()) {
            return domain::StockResult::ok(productId, updated[0][0].as<int64_t>());
        }

        auto current = txn.exec_params(
            "SELECT stock_quantity FROM products WHERE id = $1",
            productId
        );
        if (current.empty()) {
            return notFound(productId);
        }
        return domain::StockResult::failure(
            domain::ErrorCode::INVALID_QUANTITY, productId,
            "Release of " + std::to_string(quantity) + " would overflow stock of " + productId +
            " (available " + std::to_string(current[0][0].as<int64_t>()) + ")");
    }

    domain::Product rowToProduct(const pqxx::row& row) const {
        domain::Product product;
        product.id = row["id"].as<std::string>();
        product.name = row["name"].as<std::string>();
        product.description = row["description"].as<std::string>();
        product.category = row["category"].as<std::string>();
        product.sku = row["sku"].as<std::string>();
        product.price = domain::Money(
            row["price_cents"].as<int64_t>(),
            row["currency"].as<std::string>()
        );
        product.availableQuantity = row["stock_quantity"].as<int64_t>();
        product.lowStockThreshold = row["low_stock_threshold"].as<int64_t>();
        return product;
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

    static domain::StockResult storageError(
        const std::string& operation,
        const std::string& productId,
        const std::exception& e
    ) {
        std::cerr << "[PostgresInventoryRepo] " << operation << "() failed: " << e.what() << std::endl;
        return domain::StockResult::failure(
            domain::ErrorCode::STORAGE_ERROR, productId,
            operation + " failed: " + e.what());
    }
};

} // namespace omnitrack::adapters::secondary
