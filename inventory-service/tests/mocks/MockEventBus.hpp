#pragma once

#include "ports/output/IEventBus.hpp"
#include <vector>
#include <string>
#include <map>
#include <algorithm>

namespace omnitrack::tests {

/**
 * @brief Mock реализация IEventBus для тестов
 *
 * Запоминает опубликованные события (тип и JSON), подписчиков не вызывает.
 */
class MockEventBus : public ports::output::IEventBus {
public:
    struct PublishedEvent {
        std::string eventType;
        std::string json;
    };

    const std::vector<PublishedEvent>& getPublishedEvents() const {
        return events_;
    }

    void clearEvents() {
        events_.clear();
    }

    int publishCallCount() const { return static_cast<int>(events_.size()); }

    int countOf(const std::string& eventType) const {
        return static_cast<int>(std::count_if(events_.begin(), events_.end(),
            [&eventType](const PublishedEvent& e) { return e.eventType == eventType; }));
    }

    // IEventBus implementation
    void publish(const domain::DomainEvent& event) override {
        events_.push_back({event.eventType, event.toJson()});
    }

    void subscribe(const std::string& eventType, ports::output::EventHandler) override {
        ++subscriptions_[eventType];
    }

    void unsubscribe(const std::string& eventType) override {
        subscriptions_.erase(eventType);
    }

    bool hasSubscribers(const std::string& eventType) const override {
        return subscriptions_.count(eventType) > 0;
    }

private:
    std::vector<PublishedEvent> events_;
    std::map<std::string, int> subscriptions_;
};

} // namespace omnitrack::tests
