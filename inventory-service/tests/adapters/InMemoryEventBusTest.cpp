/**
 * @file InMemoryEventBusTest.cpp
 * @brief Тесты для InMemoryEventBus
 */

#include <gtest/gtest.h>
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "domain/events/LowStockEvent.hpp"
#include "domain/events/StockRestockedEvent.hpp"
#include <stdexcept>

using namespace omnitrack::adapters::secondary;
using namespace omnitrack::domain;

class InMemoryEventBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        eventBus_ = std::make_unique<InMemoryEventBus>();
    }

    LowStockEvent createLowStockEvent(const std::string& productId, int64_t available) {
        LowStockEvent event;
        event.productId = productId;
        event.availableQuantity = available;
        event.lowStockThreshold = 5;
        return event;
    }

    std::unique_ptr<InMemoryEventBus> eventBus_;
};

TEST_F(InMemoryEventBusTest, Subscribe_AndPublish_CallsHandler) {
    std::string receivedProductId;

    eventBus_->subscribe("stock.low", [&](const DomainEvent& event) {
        const auto* lowStock = dynamic_cast<const LowStockEvent*>(&event);
        if (lowStock) {
            receivedProductId = lowStock->productId;
        }
    });

    eventBus_->publish(createLowStockEvent("prd-1", 2));

    EXPECT_EQ(receivedProductId, "prd-1");
}

TEST_F(InMemoryEventBusTest, MultipleSubscribers_AllCalled) {
    int calls = 0;
    eventBus_->subscribe("stock.low", [&](const DomainEvent&) { ++calls; });
    eventBus_->subscribe("stock.low", [&](const DomainEvent&) { ++calls; });

    eventBus_->publish(createLowStockEvent("prd-1", 2));

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(eventBus_->subscriberCount("stock.low"), 2u);
}

TEST_F(InMemoryEventBusTest, OtherEventType_NotDelivered) {
    int calls = 0;
    eventBus_->subscribe("stock.restocked", [&](const DomainEvent&) { ++calls; });

    eventBus_->publish(createLowStockEvent("prd-1", 2));

    EXPECT_EQ(calls, 0);
}

TEST_F(InMemoryEventBusTest, Unsubscribe_RemovesAllHandlers) {
    int calls = 0;
    eventBus_->subscribe("stock.low", [&](const DomainEvent&) { ++calls; });
    ASSERT_TRUE(eventBus_->hasSubscribers("stock.low"));

    eventBus_->unsubscribe("stock.low");
    eventBus_->publish(createLowStockEvent("prd-1", 2));

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(eventBus_->hasSubscribers("stock.low"));
}

TEST_F(InMemoryEventBusTest, FailingHandler_DoesNotStopOthers) {
    int calls = 0;
    eventBus_->subscribe("stock.low", [](const DomainEvent&) {
        throw std::runtime_error("handler failure");
    });
    eventBus_->subscribe("stock.low", [&](const DomainEvent&) { ++calls; });

    EXPECT_NO_THROW(eventBus_->publish(createLowStockEvent("prd-1", 2)));
    EXPECT_EQ(calls, 1);
}

TEST_F(InMemoryEventBusTest, HandlerMaySubscribeDuringPublish) {
    eventBus_->subscribe("stock.low", [this](const DomainEvent&) {
        eventBus_->subscribe("stock.restocked", [](const DomainEvent&) {});
    });

    eventBus_->publish(createLowStockEvent("prd-1", 2));

    EXPECT_TRUE(eventBus_->hasSubscribers("stock.restocked"));
}
