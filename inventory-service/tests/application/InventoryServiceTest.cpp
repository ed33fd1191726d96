/**
 * @file InventoryServiceTest.cpp
 * @brief Тесты каталога и пополнения склада
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>
#include "application/InventoryService.hpp"
#include "application/CheckoutCoordinator.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/persistence/InMemoryStockMovementRepository.hpp"
#include "../mocks/MockEventBus.hpp"
#include "../mocks/MockProductRepository.hpp"
#include <stdexcept>

using namespace omnitrack;
using namespace omnitrack::application;
using namespace omnitrack::adapters::secondary;
using namespace omnitrack::domain;
using namespace omnitrack::tests;
using ::testing::_;
using ::testing::Throw;

class InventoryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        inventory_ = std::make_shared<InMemoryInventoryRepository>();
        eventBus_ = std::make_shared<MockEventBus>();
        lock_ = std::make_shared<ConsistencyLock>();
        movements_ = std::make_shared<InMemoryStockMovementRepository>();
        journal_ = std::make_shared<StockMovementJournal>(movements_);
        service_ = std::make_shared<InventoryService>(inventory_, inventory_, eventBus_, lock_, journal_);
    }

    Product widget(int64_t stock = 5, int64_t threshold = 2) {
        Product product("prd-widget", "Widget", Money(1250), stock, threshold);
        product.category = "tools";
        return product;
    }

    RequestContext admin_{"admin-1", UserRole::ADMIN};

    std::shared_ptr<InMemoryInventoryRepository> inventory_;
    std::shared_ptr<MockEventBus> eventBus_;
    std::shared_ptr<ConsistencyLock> lock_;
    std::shared_ptr<InMemoryStockMovementRepository> movements_;
    std::shared_ptr<StockMovementJournal> journal_;
    std::shared_ptr<InventoryService> service_;
};

// ============================================================================
// ADD PRODUCT
// ============================================================================

TEST_F(InventoryServiceTest, AddProduct_Success) {
    auto result = service_->addProduct(admin_, widget());

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.product->id, "prd-widget");
    EXPECT_EQ(service_->getProduct("prd-widget")->availableQuantity, 5);
}

TEST_F(InventoryServiceTest, AddProduct_WithoutId_GeneratesOne) {
    Product product;
    product.name = "Bolt";
    product.price = Money(10);

    auto result = service_->addProduct(admin_, product);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.product->id.rfind("prd-", 0), 0u);
    EXPECT_TRUE(service_->getProduct(result.product->id).has_value());
}

TEST_F(InventoryServiceTest, AddProduct_Duplicate_Rejected) {
    service_->addProduct(admin_, widget());

    auto result = service_->addProduct(admin_, widget(100));

    EXPECT_EQ(result.error, ErrorCode::INVALID_PRODUCT);
    EXPECT_EQ(service_->getProduct("prd-widget")->availableQuantity, 5);
}

TEST_F(InventoryServiceTest, AddProduct_InvalidFields_Rejected) {
    auto noName = widget();
    noName.name.clear();
    EXPECT_EQ(service_->addProduct(admin_, noName).error, ErrorCode::INVALID_PRODUCT);

    auto negativePrice = widget();
    negativePrice.price = Money(-1);
    EXPECT_EQ(service_->addProduct(admin_, negativePrice).error, ErrorCode::INVALID_PRODUCT);

    EXPECT_EQ(service_->addProduct(admin_, widget(-1)).error, ErrorCode::INVALID_PRODUCT);
    EXPECT_EQ(service_->addProduct(admin_, widget(5, -1)).error, ErrorCode::INVALID_PRODUCT);

    EXPECT_TRUE(service_->listProducts().empty());
}

TEST_F(InventoryServiceTest, AddProduct_StorageThrows_StorageError) {
    auto catalog = std::make_shared<MockProductRepository>();
    InventoryService service(catalog, inventory_, eventBus_, lock_, journal_);
    EXPECT_CALL(*catalog, create(_)).WillOnce(Throw(std::runtime_error("connection lost")));

    auto result = service.addProduct(admin_, widget());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::STORAGE_ERROR);
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(InventoryServiceTest, ListProducts_FilterByCategory) {
    service_->addProduct(admin_, widget());
    Product gadget("prd-gadget", "Gadget", Money(499), 10, 3);
    gadget.category = "electronics";
    service_->addProduct(admin_, gadget);

    EXPECT_EQ(service_->listProducts().size(), 2u);

    auto tools = service_->listProducts(std::string("tools"));
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].id, "prd-widget");

    EXPECT_TRUE(service_->listProducts(std::string("garden")).empty());
}

TEST_F(InventoryServiceTest, GetProduct_Unknown_Nullopt) {
    EXPECT_FALSE(service_->getProduct("prd-missing").has_value());
}

// ============================================================================
// RESTOCK
// ============================================================================

TEST_F(InventoryServiceTest, Restock_IncreasesStockAndPublishes) {
    service_->addProduct(admin_, widget());

    auto result = service_->restock(admin_, "prd-widget", 7);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.product->availableQuantity, 12);
    ASSERT_EQ(eventBus_->countOf("stock.restocked"), 1);

    auto json = nlohmann::json::parse(eventBus_->getPublishedEvents()[0].json);
    EXPECT_EQ(json["productId"], "prd-widget");
    EXPECT_EQ(json["quantity"], 7);
    EXPECT_EQ(json["newQuantity"], 12);
    EXPECT_EQ(json["restockedBy"], "admin-1");
}

TEST_F(InventoryServiceTest, Restock_NonPositive_InvalidQuantity) {
    service_->addProduct(admin_, widget());

    EXPECT_EQ(service_->restock(admin_, "prd-widget", 0).error, ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(service_->restock(admin_, "prd-widget", -3).error, ErrorCode::INVALID_QUANTITY);
    EXPECT_EQ(service_->getProduct("prd-widget")->availableQuantity, 5);
    EXPECT_EQ(eventBus_->publishCallCount(), 0);
}

TEST_F(InventoryServiceTest, Restock_Unknown_NotFound) {
    EXPECT_EQ(service_->restock(admin_, "prd-missing", 3).error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(movements_->count(), 0u);
}

TEST_F(InventoryServiceTest, Restock_CatalogReadThrows_StorageError) {
    service_->addProduct(admin_, widget());
    auto catalog = std::make_shared<MockProductRepository>();
    InventoryService service(catalog, inventory_, eventBus_, lock_, journal_);
    EXPECT_CALL(*catalog, findById("prd-widget")).WillOnce(Throw(std::runtime_error("connection lost")));

    auto result = service.restock(admin_, "prd-widget", 4);

    EXPECT_EQ(result.error, ErrorCode::STORAGE_ERROR);
    EXPECT_EQ(inventory_->peek("prd-widget").quantity, 9);
}

// ============================================================================
// THRESHOLD / LOW STOCK
// ============================================================================

TEST_F(InventoryServiceTest, UpdateThreshold_ChangesLowStockSet) {
    service_->addProduct(admin_, widget(5, 2));
    EXPECT_TRUE(service_->lowStockProducts().empty());

    auto result = service_->updateThreshold(admin_, "prd-widget", 5);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.product->lowStockThreshold, 5);
    ASSERT_EQ(service_->lowStockProducts().size(), 1u);
}

TEST_F(InventoryServiceTest, UpdateThreshold_Invalid) {
    service_->addProduct(admin_, widget());

    EXPECT_EQ(service_->updateThreshold(admin_, "prd-widget", -1).error, ErrorCode::INVALID_PRODUCT);
    EXPECT_EQ(service_->updateThreshold(admin_, "prd-missing", 3).error, ErrorCode::NOT_FOUND);
}

// ============================================================================
// PRICE
// ============================================================================

TEST_F(InventoryServiceTest, UpdatePrice_ChangesCatalogPrice) {
    service_->addProduct(admin_, widget());

    auto result = service_->updatePrice(admin_, "prd-widget", Money(1500));

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.product->price.cents, 1500);
    EXPECT_EQ(service_->getProduct("prd-widget")->price.cents, 1500);
}

TEST_F(InventoryServiceTest, UpdatePrice_ZeroAllowed_NegativeRejected) {
    service_->addProduct(admin_, widget());

    EXPECT_TRUE(service_->updatePrice(admin_, "prd-widget", Money(0)).success);
    EXPECT_EQ(service_->updatePrice(admin_, "prd-widget", Money(-1)).error, ErrorCode::INVALID_PRODUCT);
    EXPECT_EQ(service_->updatePrice(admin_, "prd-missing", Money(100)).error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(service_->getProduct("prd-widget")->price.cents, 0);
}

TEST_F(InventoryServiceTest, UpdatePrice_StorageThrows_StorageError) {
    auto catalog = std::make_shared<MockProductRepository>();
    InventoryService service(catalog, inventory_, eventBus_, lock_, journal_);
    EXPECT_CALL(*catalog, updatePrice("prd-widget", _)).WillOnce(Throw(std::runtime_error("connection lost")));

    EXPECT_EQ(service.updatePrice(admin_, "prd-widget", Money(100)).error, ErrorCode::STORAGE_ERROR);
}

TEST_F(InventoryServiceTest, UpdatePrice_PlacedOrderKeepsSnapshotPrice) {
    service_->addProduct(admin_, widget());
    auto orders = std::make_shared<InMemoryOrderRepository>();
    CheckoutCoordinator checkout(
        inventory_, inventory_, orders, lock_, std::make_shared<settings::InventorySettings>());

    auto placed = checkout.placeOrder("alice", {{"prd-widget", 2}});
    ASSERT_TRUE(placed.success) << placed.message;

    ASSERT_TRUE(service_->updatePrice(admin_, "prd-widget", Money(9900)).success);

    auto stored = orders->findById(placed.order->id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->items[0].unitPrice.cents, 1250);
    EXPECT_EQ(stored->total.cents, 2 * 1250);

    auto next = checkout.placeOrder("bob", {{"prd-widget", 1}});
    ASSERT_TRUE(next.success);
    EXPECT_EQ(next.order->items[0].unitPrice.cents, 9900);
}

// ============================================================================
// STOCK MOVEMENTS
// ============================================================================

TEST_F(InventoryServiceTest, Restock_RecordsMovement) {
    service_->addProduct(admin_, widget());

    service_->restock(admin_, "prd-widget", 7);

    auto history = service_->listStockMovements(StockMovementFilter::recent());
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].type, StockMovementType::RESTOCK);
    EXPECT_EQ(history[0].productId, "prd-widget");
    EXPECT_EQ(history[0].quantity, 7);
    EXPECT_EQ(history[0].performedBy, "admin-1");
    EXPECT_TRUE(history[0].orderId.empty());
}

TEST_F(InventoryServiceTest, ListStockMovements_FiltersNewestFirst) {
    service_->addProduct(admin_, widget());
    service_->addProduct(admin_, Product("prd-gadget", "Gadget", Money(499), 10, 3));

    service_->restock(admin_, "prd-widget", 1);
    service_->restock(admin_, "prd-gadget", 2);
    service_->restock(admin_, "prd-widget", 3);

    auto widgetHistory = service_->listStockMovements(StockMovementFilter::byProduct("prd-widget"));
    ASSERT_EQ(widgetHistory.size(), 2u);
    EXPECT_EQ(widgetHistory[0].quantity, 3);
    EXPECT_EQ(widgetHistory[1].quantity, 1);

    EXPECT_TRUE(service_->listStockMovements(StockMovementFilter::byType(StockMovementType::SALE)).empty());
}

TEST_F(InventoryServiceTest, ListStockMovements_DefaultLimit) {
    service_->addProduct(admin_, widget());
    for (int i = 1; i <= 60; ++i) {
        service_->restock(admin_, "prd-widget", i);
    }

    auto history = service_->listStockMovements(StockMovementFilter::recent());

    ASSERT_EQ(history.size(), StockMovementFilter::DEFAULT_LIMIT);
    EXPECT_EQ(history.front().quantity, 60);
    EXPECT_EQ(history.back().quantity, 11);
}
