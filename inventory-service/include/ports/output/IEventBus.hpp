#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>
#include <functional>

namespace omnitrack::ports::output {

using EventHandler = std::function<void(const domain::DomainEvent&)>;

/**
 * @brief Шина доменных событий ядра
 *
 * Типы событий: order.placed, order.status_changed, stock.restocked, stock.low.
 * Сервисы публикуют события после того, как изменение зафиксировано,
 * и никогда под ConsistencyLock.
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    virtual void publish(const domain::DomainEvent& event) = 0;

    /**
     * @brief Добавить обработчик eventType (обработчиков может быть несколько)
     */
    virtual void subscribe(const std::string& eventType, EventHandler handler) = 0;

    /**
     * @brief Снять все обработчики eventType
     */
    virtual void unsubscribe(const std::string& eventType) = 0;

    virtual bool hasSubscribers(const std::string& eventType) const = 0;
};

} // namespace omnitrack::ports::output
