#pragma once

#include "ports/output/ICartRepository.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <mutex>
#include <memory>
#include <iostream>

namespace omnitrack::adapters::secondary {

/**
 * @brief PostgreSQL хранилище корзин
 *
 * Корзина - строки cart_items (user_id, product_id, quantity).
 * save() заменяет содержимое корзины целиком.
 */
class PostgresCartRepository : public ports::output::ICartRepository {
public:
    explicit PostgresCartRepository(const std::string& connectionString)
    {
        std::cout << "[PostgresCartRepo] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            std::cout << "[PostgresCartRepo] Connected successfully" << std::endl;
            initSchema();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresCartRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresCartRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::Cart> findByUserId(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT product_id, quantity, updated_at FROM cart_items WHERE user_id = $1",
                userId
            );

            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }

            domain::Cart cart(userId);
            int64_t updatedAt = 0;
            for (const auto& row : result) {
                cart.items[row["product_id"].as<std::string>()] = row["quantity"].as<int64_t>();
                updatedAt = std::max(updatedAt, row["updated_at"].as<int64_t>());
            }
            cart.updatedAt = domain::Timestamp::fromUnixMillis(updatedAt);
            return cart;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCartRepo] findByUserId() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void save(const domain::Cart& cart) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params("DELETE FROM cart_items WHERE user_id = $1", cart.userId);
            for (const auto& [productId, quantity] : cart.items) {
                txn.exec_params(
                    R"(
                        INSERT INTO cart_items (user_id, product_id, quantity, updated_at)
                        VALUES ($1, $2, $3, $4)
                    )",
                    cart.userId,
                    productId,
                    quantity,
                    cart.updatedAt.toUnixMillis()
                );
            }

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCartRepo] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool remove(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "DELETE FROM cart_items WHERE user_id = $1",
                userId
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCartRepo] remove() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    void initSchema() {
        pqxx::work txn(*connection_);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS cart_items (
                user_id    TEXT NOT NULL,
                product_id TEXT NOT NULL,
                quantity   BIGINT NOT NULL CHECK (quantity > 0),
                updated_at BIGINT NOT NULL,
                PRIMARY KEY (user_id, product_id)
            )
        )");
        txn.commit();
        std::cout << "[PostgresCartRepo] Schema initialized" << std::endl;
    }
};

} // namespace omnitrack::adapters::secondary
