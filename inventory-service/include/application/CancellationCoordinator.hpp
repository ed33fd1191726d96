#pragma once

#include "ports/output/IStockLedger.hpp"
#include "domain/Order.hpp"
#include "domain/StockResult.hpp"
#include <memory>
#include <iostream>

namespace omnitrack::application {

/**
 * @brief Возврат зарезервированного стока отменённого заказа
 *
 * Отдельного журнала резервов нет: резерв заказа - это количества
 * его позиций, и отмена просто возвращает их на склад.
 *
 * @warning Не идемпотентен. Повторный вызов для того же заказа вернёт
 * сток дважды. Вызывать ровно один раз на заказ, при переходе
 * PLACED/PAID → CANCELLED; это гарантирует OrderLifecycle.
 */
class CancellationCoordinator {
public:
    explicit CancellationCoordinator(std::shared_ptr<ports::output::IStockLedger> ledger)
        : ledger_(std::move(ledger))
    {}

    /**
     * @brief Вернуть на склад все позиции заказа
     *
     * Возврат атомарен по всем позициям: при ошибке не возвращается ничего.
     */
    domain::StockResult releaseOrderStock(const domain::Order& order) {
        domain::ItemQuantities lines;
        for (const auto& item : order.items) {
            lines[item.productId] += item.quantity;
        }

        if (lines.empty()) {
            return domain::StockResult::ok("", 0);
        }

        auto result = ledger_->releaseAll(lines);
        if (result.success) {
            std::cout << "[CancellationCoordinator] Released " << result.quantity
                      << " units for order " << order.id << std::endl;
        } else {
            std::cerr << "[CancellationCoordinator] Release failed for order " << order.id
                      << ": " << result.message << std::endl;
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IStockLedger> ledger_;
};

} // namespace omnitrack::application
