#pragma once

#include "ports/output/IStockMovementRepository.hpp"
#include "domain/Order.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <iostream>

namespace omnitrack::application {

/**
 * @brief Запись истории движений стока
 *
 * Вызывается после того, как изменение стока и заказа зафиксировано.
 * Ошибка журнала не откатывает операцию: она пишется в std::cerr,
 * а метод возвращает false.
 */
class StockMovementJournal {
public:
    explicit StockMovementJournal(std::shared_ptr<ports::output::IStockMovementRepository> repository)
        : repository_(std::move(repository))
    {}

    /**
     * @brief SALE по каждой позиции оформленного заказа
     */
    bool recordSale(const domain::Order& order) {
        return append(fromOrder(order, domain::StockMovementType::SALE, order.userId));
    }

    /**
     * @brief CANCEL по каждой позиции отменённого заказа
     */
    bool recordCancellation(const domain::Order& order, const std::string& performedBy) {
        return append(fromOrder(order, domain::StockMovementType::CANCEL, performedBy));
    }

    bool recordRestock(const std::string& productId, int64_t quantity, const std::string& performedBy) {
        return append({domain::StockMovement(
            nextId(), productId, domain::StockMovementType::RESTOCK, quantity, "", performedBy)});
    }

    std::vector<domain::StockMovement> find(const domain::StockMovementFilter& filter) {
        return repository_->findAll(filter);
    }

private:
    std::shared_ptr<ports::output::IStockMovementRepository> repository_;

    static std::string nextId() {
        return utils::UuidGenerator::generateWithPrefix("mov");
    }

    static std::vector<domain::StockMovement> fromOrder(
        const domain::Order& order,
        domain::StockMovementType type,
        const std::string& performedBy
    ) {
        std::vector<domain::StockMovement> movements;
        movements.reserve(order.items.size());
        for (const auto& item : order.items) {
            movements.emplace_back(nextId(), item.productId, type, item.quantity, order.id, performedBy);
        }
        return movements;
    }

    bool append(const std::vector<domain::StockMovement>& movements) {
        try {
            repository_->append(movements);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[StockMovementJournal] Failed to record " << movements.size()
                      << " movement(s): " << e.what() << std::endl;
            return false;
        }
    }
};

} // namespace omnitrack::application
