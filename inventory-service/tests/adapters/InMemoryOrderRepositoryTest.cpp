#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"

using namespace omnitrack::adapters::secondary;
using namespace omnitrack::domain;

class InMemoryOrderRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<InMemoryOrderRepository>();
        base_ = Timestamp::fromUnixSeconds(1700000000);
    }

    Order makeOrder(const std::string& id, const std::string& userId, int64_t hoursAfterBase,
                    OrderStatus status = OrderStatus::PLACED) {
        Order order(id, userId, {OrderItem("prd-1", "Widget", 1, Money(1000))});
        order.createdAt = base_.addHours(hoursAfterBase);
        order.updatedAt = order.createdAt;
        order.status = status;
        return order;
    }

    std::shared_ptr<InMemoryOrderRepository> repo_;
    Timestamp base_;
};

TEST_F(InMemoryOrderRepositoryTest, SaveAndFindById) {
    repo_->save(makeOrder("ord-1", "alice", 0));

    auto found = repo_->findById("ord-1");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->userId, "alice");
    ASSERT_EQ(found->items.size(), 1u);
    EXPECT_EQ(found->items[0].productName, "Widget");
    EXPECT_FALSE(repo_->findById("missing").has_value());
}

TEST_F(InMemoryOrderRepositoryTest, FindAll_NewestFirst) {
    repo_->save(makeOrder("ord-1", "alice", 0));
    repo_->save(makeOrder("ord-2", "bob", 2));
    repo_->save(makeOrder("ord-3", "alice", 1));

    auto orders = repo_->findAll(OrderFilter::all());

    ASSERT_EQ(orders.size(), 3u);
    EXPECT_EQ(orders[0].id, "ord-2");
    EXPECT_EQ(orders[1].id, "ord-3");
    EXPECT_EQ(orders[2].id, "ord-1");
}

TEST_F(InMemoryOrderRepositoryTest, FindAll_ByUser) {
    repo_->save(makeOrder("ord-1", "alice", 0));
    repo_->save(makeOrder("ord-2", "bob", 1));
    repo_->save(makeOrder("ord-3", "alice", 2));

    auto orders = repo_->findAll(OrderFilter::byUser("alice"));

    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].id, "ord-3");
    EXPECT_EQ(orders[1].id, "ord-1");
    EXPECT_TRUE(repo_->findAll(OrderFilter::byUser("carol")).empty());
}

TEST_F(InMemoryOrderRepositoryTest, FindAll_ByStatus) {
    repo_->save(makeOrder("ord-1", "alice", 0, OrderStatus::PAID));
    repo_->save(makeOrder("ord-2", "bob", 1, OrderStatus::CANCELLED));

    auto orders = repo_->findAll(OrderFilter::byStatus(OrderStatus::PAID));

    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0].id, "ord-1");
}

TEST_F(InMemoryOrderRepositoryTest, FindAll_ByPeriod_InclusiveBounds) {
    repo_->save(makeOrder("ord-1", "alice", 0));
    repo_->save(makeOrder("ord-2", "alice", 24));
    repo_->save(makeOrder("ord-3", "alice", 48));

    auto orders = repo_->findAll(OrderFilter::byPeriod(base_, base_.addHours(24)));

    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].id, "ord-2");
    EXPECT_EQ(orders[1].id, "ord-1");
}

TEST_F(InMemoryOrderRepositoryTest, Update_ChangesStatusOnly) {
    repo_->save(makeOrder("ord-1", "alice", 0));

    auto order = *repo_->findById("ord-1");
    order.status = OrderStatus::PAID;
    order.updatedBy = "staff-1";
    order.items.clear();

    EXPECT_TRUE(repo_->update(order));

    auto stored = repo_->findById("ord-1");
    EXPECT_EQ(stored->status, OrderStatus::PAID);
    EXPECT_EQ(stored->updatedBy, "staff-1");
    EXPECT_EQ(stored->items.size(), 1u);
}

TEST_F(InMemoryOrderRepositoryTest, Update_Missing_ReturnsFalse) {
    EXPECT_FALSE(repo_->update(makeOrder("ord-x", "alice", 0)));
    EXPECT_EQ(repo_->count(), 0u);
}
