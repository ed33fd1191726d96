/**
 * @file InventoryAppTest.cpp
 * @brief Сквозной тест: приложение собрано через Boost.DI на in-memory хранилищах
 *
 * Singleton-привязки Boost.DI общие на процесс, поэтому приложение
 * создаётся один раз на весь набор тестов.
 */

#include <gtest/gtest.h>
#include "InventoryApp.hpp"
#include "ports/input/IOrderService.hpp"
#include "ports/input/IInventoryService.hpp"
#include "ports/input/ICartService.hpp"
#include "ports/input/IReportingService.hpp"
#include "ports/output/IEventBus.hpp"
#include <cstdlib>
#include <fstream>

using namespace omnitrack;
using namespace omnitrack::domain;

class InventoryAppTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        unsetenv("INVENTORY_STORAGE");
        unsetenv("INVENTORY_SEED_FILE");
        setenv("INVENTORY_DEFAULT_LOW_STOCK_THRESHOLD", "2", 1);

        catalogPath_ = ::testing::TempDir() + "omnitrack_app_catalog.json";
        std::ofstream out(catalogPath_);
        out << R"([
            {"id": "WIDGET", "name": "Widget", "category": "tools", "price": 12.50, "stock": 5},
            {"id": "GADGET", "name": "Gadget", "category": "electronics", "price": 4.99, "stock": 10, "lowStockThreshold": 3},
            {"id": "BROKEN", "name": "Broken", "price": 1.00, "stock": -1}
        ])";
        out.close();

        app_ = new InventoryApp();
        std::string program = "omnitrack-inventory";
        char* argv[] = {program.data(), catalogPath_.data(), nullptr};
        app_->run(2, argv);
    }

    static void TearDownTestSuite() {
        delete app_;
        app_ = nullptr;
        unsetenv("INVENTORY_DEFAULT_LOW_STOCK_THRESHOLD");
    }

    static InventoryApp* app_;
    static std::string catalogPath_;
};

InventoryApp* InventoryAppTest::app_ = nullptr;
std::string InventoryAppTest::catalogPath_;

TEST_F(InventoryAppTest, ServicesResolved) {
    ASSERT_NE(app_->orderService(), nullptr);
    ASSERT_NE(app_->inventoryService(), nullptr);
    ASSERT_NE(app_->cartService(), nullptr);
    ASSERT_NE(app_->reportingService(), nullptr);
    ASSERT_NE(app_->eventBus(), nullptr);
    EXPECT_TRUE(app_->eventBus()->hasSubscribers("stock.low"));
}

TEST_F(InventoryAppTest, CatalogSeeded_InvalidEntrySkipped) {
    auto products = app_->inventoryService()->listProducts();

    ASSERT_EQ(products.size(), 2u);
    auto widget = app_->inventoryService()->getProduct("WIDGET");
    ASSERT_TRUE(widget.has_value());
    EXPECT_EQ(widget->price.cents, 1250);
    EXPECT_EQ(widget->lowStockThreshold, 2);
}

TEST_F(InventoryAppTest, CartCheckoutCancel_EndToEnd) {
    RequestContext alice("alice", UserRole::CUSTOMER);
    RequestContext staff("staff-1", UserRole::STAFF);
    auto cart = app_->cartService();
    auto orders = app_->orderService();
    auto inventory = app_->inventoryService();

    ASSERT_TRUE(cart->addItem(alice, "WIDGET", 3).success);
    auto placed = cart->checkout(alice);
    ASSERT_TRUE(placed.success) << placed.message;
    EXPECT_EQ(inventory->getProduct("WIDGET")->availableQuantity, 2);
    EXPECT_EQ(inventory->lowStockProducts().size(), 1u);

    ASSERT_TRUE(orders->transitionOrder(staff, placed.order->id, OrderStatus::PAID).success);
    ASSERT_TRUE(orders->cancelOrder(staff, placed.order->id).success);
    EXPECT_EQ(inventory->getProduct("WIDGET")->availableQuantity, 5);

    auto history = inventory->listStockMovements(StockMovementFilter::byProduct("WIDGET"));
    ASSERT_GE(history.size(), 2u);
    EXPECT_EQ(history[0].type, StockMovementType::CANCEL);
    EXPECT_EQ(history[0].orderId, placed.order->id);
    EXPECT_EQ(history[1].type, StockMovementType::SALE);
    EXPECT_EQ(history[1].quantity, 3);

    auto snapshot = app_->reportingService()->dashboard();
    EXPECT_EQ(snapshot.productCount, 2);
    EXPECT_GE(snapshot.metrics.cancelledCount, 1);
}
