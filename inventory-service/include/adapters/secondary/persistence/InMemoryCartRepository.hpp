#pragma once

#include "ports/output/ICartRepository.hpp"
#include <ThreadSafeMap.hpp>

namespace omnitrack::adapters::secondary {

/**
 * @brief In-memory хранилище корзин
 */
class InMemoryCartRepository : public ports::output::ICartRepository {
public:
    std::optional<domain::Cart> findByUserId(const std::string& userId) override {
        auto cart = carts_.find(userId);
        if (!cart) {
            return std::nullopt;
        }
        return *cart;
    }

    void save(const domain::Cart& cart) override {
        carts_.insert(cart.userId, std::make_shared<domain::Cart>(cart));
    }

    bool remove(const std::string& userId) override {
        return carts_.remove(userId);
    }

private:
    ThreadSafeMap<std::string, domain::Cart> carts_;
};

} // namespace omnitrack::adapters::secondary
