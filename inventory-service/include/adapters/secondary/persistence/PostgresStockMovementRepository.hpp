#pragma once

#include "ports/output/IStockMovementRepository.hpp"
#include <pqxx/pqxx>
#include <mutex>
#include <memory>
#include <iostream>

namespace omnitrack::adapters::secondary {

/**
 * @brief PostgreSQL журнал движений стока
 *
 * Порядок при равном created_at задаёт суррогатный seq.
 */
class PostgresStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    explicit PostgresStockMovementRepository(const std::string& connectionString)
    {
        std::cout << "[PostgresMovementRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            std::cout << "[PostgresMovementRepo] Connected successfully" << std::endl;
            initSchema();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresMovementRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresStockMovementRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void append(const std::vector<domain::StockMovement>& movements) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            for (const auto& movement : movements) {
                txn.exec_params(
                    R"(
                        INSERT INTO stock_movements (
                            id, product_id, movement_type, quantity,
                            order_id, performed_by, created_at
                        )
                        VALUES ($1, $2, $3, $4, NULLIF($5, ''), $6, $7)
                    )",
                    movement.id,
                    movement.productId,
                    domain::toString(movement.type),
                    movement.quantity,
                    movement.orderId,
                    movement.performedBy,
                    movement.createdAt.toUnixMillis()
                );
            }

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresMovementRepo] append() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::StockMovement> findAll(const domain::StockMovementFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<std::string> type;
        if (filter.type) {
            type = domain::toString(*filter.type);
        }

        try {
            pqxx::work txn(*connection_);
            std::vector<domain::StockMovement> movements;

            auto result = txn.exec_params(
                R"(
                    SELECT id, product_id, movement_type, quantity,
                           COALESCE(order_id, '') AS order_id, performed_by, created_at
                    FROM stock_movements
                    WHERE ($1::text IS NULL OR movement_type = $1)
                      AND ($2::text IS NULL OR product_id = $2)
                    ORDER BY created_at DESC, seq DESC
                    LIMIT $3
                )",
                type,
                filter.productId,
                static_cast<int64_t>(filter.limit)
            );

            movements.reserve(result.size());
            for (const auto& row : result) {
                domain::StockMovement movement;
                movement.id = row["id"].as<std::string>();
                movement.productId = row["product_id"].as<std::string>();
                movement.type = domain::stockMovementTypeFromString(row["movement_type"].as<std::string>());
                movement.quantity = row["quantity"].as<int64_t>();
                movement.orderId = row["order_id"].as<std::string>();
                movement.performedBy = row["performed_by"].as<std::string>();
                movement.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
                movements.push_back(movement);
            }

            txn.commit();
            return movements;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresMovementRepo] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    void initSchema() {
        pqxx::work txn(*connection_);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS stock_movements (
                seq           BIGSERIAL PRIMARY KEY,
                id            TEXT NOT NULL UNIQUE,
                product_id    TEXT NOT NULL,
                movement_type TEXT NOT NULL,
                quantity      BIGINT NOT NULL CHECK (quantity > 0),
                order_id      TEXT,
                performed_by  TEXT NOT NULL,
                created_at    BIGINT NOT NULL
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_stock_movements_product ON stock_movements(product_id)");
        txn.commit();
        std::cout << "[PostgresMovementRepo] Schema initialized" << std::endl;
    }
};

} // namespace omnitrack::adapters::secondary
