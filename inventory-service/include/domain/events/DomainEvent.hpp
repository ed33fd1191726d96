#pragma once

#include "domain/Timestamp.hpp"
#include "utils/UuidGenerator.hpp"
#include <string>
#include <memory>

namespace omnitrack::domain {

/**
 * @brief Базовый класс для всех доменных событий
 * 
 * Используется IEventBus для передачи событий между компонентами.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (order.placed, stock.low)
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : eventId(utils::UuidGenerator::generate()), timestamp(Timestamp::now()) {}
    
    explicit DomainEvent(const std::string& type)
        : eventId(utils::UuidGenerator::generate()), eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace omnitrack::domain
