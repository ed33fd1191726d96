#pragma once

#include "ports/output/IOrderRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <mutex>
#include <algorithm>
#include <set>
#include <unordered_map>

namespace omnitrack::adapters::secondary {

/**
 * @brief In-memory реализация репозитория заказов
 */
class InMemoryOrderRepository : public ports::output::IOrderRepository {
public:
    void save(const domain::Order& order) override {
        orders_.insert(order.id, std::make_shared<domain::Order>(order));
        
        std::lock_guard<std::mutex> lock(indexMutex_);
        userOrders_[order.userId].insert(order.id);
    }

    std::optional<domain::Order> findById(const std::string& id) override {
        auto order = orders_.find(id);
        if (!order) {
            return std::nullopt;
        }
        return *order;
    }

    /**
     * @brief Найти заказы по фильтру
     * 
     * При заданном userId выборка идёт по индексу пользователя.
     */
    std::vector<domain::Order> findAll(const domain::OrderFilter& filter) override {
        std::vector<domain::Order> result;

        if (filter.userId) {
            std::set<std::string> orderIds;
            {
                std::lock_guard<std::mutex> lock(indexMutex_);
                auto it = userOrders_.find(*filter.userId);
                if (it != userOrders_.end()) {
                    orderIds = it->second;
                }
            }
            for (const auto& id : orderIds) {
                auto order = orders_.find(id);
                if (order && filter.matches(*order)) {
                    result.push_back(*order);
                }
            }
        } else {
            for (const auto& order : orders_.getAll()) {
                if (filter.matches(*order)) {
                    result.push_back(*order);
                }
            }
        }

        // Новые первыми
        std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
                if (a.createdAt != b.createdAt) {
                    return a.createdAt > b.createdAt;
                }
                return a.id > b.id;
            });
        
        return result;
    }

    /**
     * @brief Обновить статус заказа
     * 
     * Запись заменяется копией: читатели, уже получившие заказ,
     * продолжают видеть прежнюю версию.
     */
    bool update(const domain::Order& order) override {
        auto existing = orders_.find(order.id);
        if (!existing) {
            return false;
        }
        auto updated = std::make_shared<domain::Order>(*existing);
        updated->status = order.status;
        updated->updatedAt = order.updatedAt;
        updated->updatedBy = order.updatedBy;
        orders_.insert(order.id, updated);
        return true;
    }

    /**
     * @brief Получить количество заказов
     */
    size_t count() const {
        return orders_.size();
    }

    /**
     * @brief Очистить репозиторий
     */
    void clear() {
        orders_.clear();
        std::lock_guard<std::mutex> lock(indexMutex_);
        userOrders_.clear();
    }

private:
    ThreadSafeMap<std::string, domain::Order> orders_;
    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, std::set<std::string>> userOrders_; // userId -> orderIds
};

} // namespace omnitrack::adapters::secondary
