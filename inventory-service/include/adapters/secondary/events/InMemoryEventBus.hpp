#pragma once

#include "ports/output/IEventBus.hpp"
#include <unordered_map>
#include <vector>
#include <mutex>
#include <iostream>

namespace omnitrack::adapters::secondary {

/**
 * @brief In-memory реализация событийной шины
 * 
 * Синхронная доставка: publish вызывает обработчики в потоке издателя.
 * Список обработчиков копируется под mutex, сами обработчики
 * вызываются без блокировки и могут подписываться повторно.
 */
class InMemoryEventBus : public ports::output::IEventBus {
public:
    /**
     * @brief Опубликовать событие
     * 
     * Ошибка одного обработчика логируется и не мешает остальным.
     */
    void publish(const domain::DomainEvent& event) override {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(event.eventType);
            if (it != handlers_.end()) {
                handlers = it->second;
            }
        }

        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler for " << event.eventType
                          << " failed: " << e.what() << std::endl;
            }
        }
    }

    void subscribe(const std::string& eventType, ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_[eventType].push_back(std::move(handler));
    }

    /**
     * @brief Отписаться от типа события (удаляет ВСЕ handlers)
     */
    void unsubscribe(const std::string& eventType) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.erase(eventType);
    }

    bool hasSubscribers(const std::string& eventType) const override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() && !it->second.empty();
    }

    /**
     * @brief Получить количество подписчиков для типа события
     */
    size_t subscriberCount(const std::string& eventType) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    mutable std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
};

} // namespace omnitrack::adapters::secondary
