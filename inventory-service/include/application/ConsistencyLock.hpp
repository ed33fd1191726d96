#pragma once

#include <shared_mutex>
#include <mutex>

namespace omnitrack::application {

/**
 * @brief Граница согласованности между складом и заказами
 *
 * Операции, меняющие сразу остатки и заказы (оформление, отмена),
 * выполняются под exclusive(). Чтения снимков (списки заказов, каталог,
 * панели) идут под shared() и не видят промежуточных состояний:
 * ни отменённого заказа с невозвращённым стоком, ни списанного стока
 * без заказа.
 *
 * Один экземпляр на приложение (singleton в DI).
 */
class ConsistencyLock {
public:
    std::unique_lock<std::shared_mutex> exclusive() {
        return std::unique_lock<std::shared_mutex>(mutex_);
    }

    std::shared_lock<std::shared_mutex> shared() {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }

private:
    std::shared_mutex mutex_;
};

} // namespace omnitrack::application
