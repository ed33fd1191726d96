#pragma once

#include "ports/output/IOrderRepository.hpp"
#include <pqxx/pqxx>
#include <mutex>
#include <memory>
#include <iostream>

namespace omnitrack::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория заказов
 *
 * Заказ и его позиции пишутся одной транзакцией. Время хранится
 * в миллисекундах Unix (BIGINT), чтобы фильтр по периоду был точным.
 */
class PostgresOrderRepository : public ports::output::IOrderRepository {
public:
    explicit PostgresOrderRepository(const std::string& connectionString)
    {
        std::cout << "[PostgresOrderRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            std::cout << "[PostgresOrderRepo] Connected successfully" << std::endl;
            initSchema();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresOrderRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void save(const domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO orders (
                        id, user_id, status, total_cents, currency,
                        created_at, updated_at, updated_by
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8)
                )",
                order.id,
                order.userId,
                domain::toString(order.status),
                order.total.cents,
                order.total.currency,
                order.createdAt.toUnixMillis(),
                order.updatedAt.toUnixMillis(),
                order.updatedBy
            );

            int lineNo = 0;
            for (const auto& item : order.items) {
                txn.exec_params(
                    R"(
                        INSERT INTO order_items (
                            order_id, line_no, product_id, product_name,
                            quantity, unit_price_cents, currency
                        )
                        VALUES ($1, $2, $3, $4, $5, $6, $7)
                    )",
                    order.id,
                    lineNo++,
                    item.productId,
                    item.productName,
                    item.quantity,
                    item.unitPrice.cents,
                    item.unitPrice.currency
                );
            }

            txn.commit();
            std::cout << "[PostgresOrderRepo] Saved order: " << order.id << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Order> findById(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT " + std::string(ORDER_COLUMNS) + " FROM orders WHERE id = $1",
                id
            );

            if (result.empty()) {
                txn.commit();
                return std::nullopt;
            }

            auto order = rowToOrder(result[0]);
            order.items = loadItems(txn, order.id);
            txn.commit();
            return order;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] findById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Order> findAll(const domain::OrderFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<std::string> status;
        if (filter.status) {
            status = domain::toString(*filter.status);
        }
        std::optional<int64_t> from;
        if (filter.from) {
            from = filter.from->toUnixMillis();
        }
        std::optional<int64_t> to;
        if (filter.to) {
            to = filter.to->toUnixMillis();
        }

        try {
            pqxx::work txn(*connection_);
            std::vector<domain::Order> orders;

            auto result = txn.exec_params(
                "SELECT " + std::string(ORDER_COLUMNS) + R"( FROM orders
                    WHERE ($1::text IS NULL OR status = $1)
                      AND ($2::text IS NULL OR user_id = $2)
                      AND ($3::bigint IS NULL OR created_at >= $3)
                      AND ($4::bigint IS NULL OR created_at <= $4)
                    ORDER BY created_at DESC, id DESC
                )",
                status,
                filter.userId,
                from,
                to
            );

            for (const auto& row : result) {
                auto order = rowToOrder(row);
                order.items = loadItems(txn, order.id);
                orders.push_back(order);
            }

            txn.commit();
            return orders;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool update(const domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    UPDATE orders SET
                        status = $2,
                        updated_at = $3,
                        updated_by = $4
                    WHERE id = $1
                )",
                order.id,
                domain::toString(order.status),
                order.updatedAt.toUnixMillis(),
                order.updatedBy
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrderRepo] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool isConnected() const {
        return connection_ && connection_->is_open();
    }

private:
    static constexpr const char* ORDER_COLUMNS =
        "id, user_id, status, total_cents, currency, created_at, updated_at, updated_by";

    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    void initSchema() {
        pqxx::work txn(*connection_);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS orders (
                id          TEXT PRIMARY KEY,
                user_id     TEXT NOT NULL,
                status      TEXT NOT NULL,
                total_cents BIGINT NOT NULL,
                currency    TEXT NOT NULL DEFAULT 'USD',
                created_at  BIGINT NOT NULL,
                updated_at  BIGINT NOT NULL,
                updated_by  TEXT NOT NULL
            )
        )");
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS order_items (
                order_id         TEXT NOT NULL REFERENCES orders(id),
                line_no          INTEGER NOT NULL,
                product_id       TEXT NOT NULL,
                product_name     TEXT NOT NULL,
                quantity         BIGINT NOT NULL CHECK (quantity > 0),
                unit_price_cents BIGINT NOT NULL,
                currency         TEXT NOT NULL DEFAULT 'USD',
                PRIMARY KEY (order_id, line_no)
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_orders_user_id ON orders(user_id)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_orders_created_at ON orders(created_at)");
        txn.commit();
        std::cout << "[PostgresOrderRepo] Schema initialized" << std::endl;
    }

    std::vector<domain::OrderItem> loadItems(pqxx::work& txn, const std::string& orderId) const {
        auto result = txn.exec_params(
            R"(
                SELECT product_id, product_name, quantity, unit_price_cents, currency
                FROM order_items WHERE order_id = $1
                ORDER BY line_no
            )",
            orderId
        );

        std::vector<domain::OrderItem> items;
        items.reserve(result.size());
        for (const auto& row : result) {
            items.emplace_back(
                row["product_id"].as<std::string>(),
                row["product_name"].as<std::string>(),
                row["quantity"].as<int64_t>(),
                domain::Money(row["unit_price_cents"].as<int64_t>(), row["currency"].as<std::string>())
            );
        }
        return items;
    }

    domain::Order rowToOrder(const pqxx::row& row) const {
        domain::Order order;
        order.id = row["id"].as<std::string>();
        order.userId = row["user_id"].as<std::string>();
        order.status = domain::orderStatusFromString(row["status"].as<std::string>());
        order.total = domain::Money(row["total_cents"].as<int64_t>(), row["currency"].as<std::string>());
        order.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        order.updatedAt = domain::Timestamp::fromUnixMillis(row["updated_at"].as<int64_t>());
        order.updatedBy = row["updated_by"].as<std::string>();
        return order;
    }
};

} // namespace omnitrack::adapters::secondary
