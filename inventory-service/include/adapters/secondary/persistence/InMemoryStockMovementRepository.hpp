#pragma once

#include "ports/output/IStockMovementRepository.hpp"
#include <mutex>
#include <algorithm>
#include <vector>

namespace omnitrack::adapters::secondary {

/**
 * @brief In-memory журнал движений стока
 *
 * Записи хранятся в порядке добавления; при равном createdAt
 * более поздняя запись считается новее.
 */
class InMemoryStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    void append(const std::vector<domain::StockMovement>& movements) override {
        std::lock_guard<std::mutex> lock(mutex_);
        movements_.insert(movements_.end(), movements.begin(), movements.end());
    }

    std::vector<domain::StockMovement> findAll(const domain::StockMovementFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::StockMovement> result;
        for (auto it = movements_.rbegin(); it != movements_.rend(); ++it) {
            if (filter.matches(*it)) {
                result.push_back(*it);
            }
        }

        std::stable_sort(result.begin(), result.end(),
            [](const domain::StockMovement& a, const domain::StockMovement& b) {
                return a.createdAt > b.createdAt;
            });
        if (result.size() > filter.limit) {
            result.resize(filter.limit);
        }
        return result;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return movements_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::StockMovement> movements_;
};

} // namespace omnitrack::adapters::secondary
