#pragma once

#include "application/CancellationCoordinator.hpp"
#include "domain/Order.hpp"
#include "domain/OrderResult.hpp"
#include <memory>
#include <string>

namespace omnitrack::application {

/**
 * @brief Машина состояний заказа
 *
 * PLACED → PAID → DELIVERED, PLACED → CANCELLED, PAID → CANCELLED.
 * Из DELIVERED и CANCELLED переходов нет.
 *
 * Переход в CANCELLED сначала возвращает сток через CancellationCoordinator
 * и меняет статус только после успешного возврата. Статус без возврата
 * и возврат без статуса невозможны.
 *
 * @note Не синхронизирует доступ к заказу: вызывающий удерживает
 * ConsistencyLock::exclusive() на всё время перехода и сохранения.
 */
class OrderLifecycle {
public:
    explicit OrderLifecycle(std::shared_ptr<CancellationCoordinator> cancellation)
        : cancellation_(std::move(cancellation))
    {}

    static bool canTransition(domain::OrderStatus from, domain::OrderStatus to) {
        return domain::isTransitionAllowed(from, to);
    }

    /**
     * @brief Выполнить переход
     *
     * @param order Заказ, изменяется только при успехе
     * @param target Целевой статус
     * @param actorId Кто выполняет переход
     * @return ILLEGAL_TRANSITION, ошибка возврата стока или заказ после перехода
     */
    domain::OrderResult transition(
        domain::Order& order,
        domain::OrderStatus target,
        const std::string& actorId
    ) {
        if (!canTransition(order.status, target)) {
            return domain::OrderResult::failure(
                domain::ErrorCode::ILLEGAL_TRANSITION,
                "Illegal transition " + domain::toString(order.status) +
                " -> " + domain::toString(target) + " for order " + order.id);
        }

        if (target == domain::OrderStatus::CANCELLED) {
            auto released = cancellation_->releaseOrderStock(order);
            if (!released.success) {
                return domain::OrderResult::failure(released.error, released.message);
            }
        }

        order.status = target;
        order.updatedAt = domain::Timestamp::now();
        order.updatedBy = actorId;
        return domain::OrderResult::ok(order);
    }

private:
    std::shared_ptr<CancellationCoordinator> cancellation_;
};

} // namespace omnitrack::application
