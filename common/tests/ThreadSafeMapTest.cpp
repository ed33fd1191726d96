#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <string>
#include <algorithm>

struct StockRecord {
    int quantity;
    std::string sku;

    StockRecord(int q = 0, const std::string& s = "") : quantity(q), sku(s) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, StockRecord> map;
};

// ============================================================================
// БАЗОВЫЕ ОПЕРАЦИИ
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("prd-1", std::make_shared<StockRecord>(5, "WID-001"));

    auto found = map.find("prd-1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->quantity, 5);
    EXPECT_EQ(found->sku, "WID-001");
}

TEST_F(ThreadSafeMapTest, FindMissing_ReturnsNull) {
    EXPECT_EQ(map.find("missing"), nullptr);
    EXPECT_FALSE(map.contains("missing"));
}

TEST_F(ThreadSafeMapTest, InsertIfAbsent_KeepsFirstValue) {
    EXPECT_TRUE(map.insertIfAbsent("prd-1", std::make_shared<StockRecord>(1, "first")));
    EXPECT_FALSE(map.insertIfAbsent("prd-1", std::make_shared<StockRecord>(2, "second")));

    auto found = map.find("prd-1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->sku, "first");
}

TEST_F(ThreadSafeMapTest, Remove_DeletesKey) {
    map.insert("prd-1", std::make_shared<StockRecord>(1));

    EXPECT_TRUE(map.remove("prd-1"));
    EXPECT_FALSE(map.remove("prd-1"));
    EXPECT_FALSE(map.contains("prd-1"));
}

TEST_F(ThreadSafeMapTest, RemovedValue_StaysValidForHolder) {
    map.insert("prd-1", std::make_shared<StockRecord>(7));
    auto held = map.find("prd-1");

    map.remove("prd-1");

    ASSERT_NE(held, nullptr);
    EXPECT_EQ(held->quantity, 7);
}

TEST_F(ThreadSafeMapTest, GetAll_ReturnsSnapshot) {
    map.insert("a", std::make_shared<StockRecord>(1));
    map.insert("b", std::make_shared<StockRecord>(2));
    map.insert("c", std::make_shared<StockRecord>(3));

    auto all = map.getAll();
    ASSERT_EQ(all.size(), 3u);

    int sum = 0;
    for (const auto& record : all) {
        sum += record->quantity;
    }
    EXPECT_EQ(sum, 6);
    EXPECT_EQ(map.size(), 3u);

    map.clear();
    EXPECT_EQ(map.size(), 0u);
    EXPECT_EQ(all.size(), 3u);
}

TEST_F(ThreadSafeMapTest, ForEach_VisitsEveryKey) {
    map.insert("a", std::make_shared<StockRecord>(1));
    map.insert("b", std::make_shared<StockRecord>(2));

    std::vector<std::string> keys;
    map.forEach([&keys](const std::string& key, const std::shared_ptr<StockRecord>&) {
        keys.push_back(key);
    });

    std::sort(keys.begin(), keys.end());
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "a");
    EXPECT_EQ(keys[1], "b");
}

// ============================================================================
// МНОГОПОТОЧНОСТЬ
// ============================================================================

TEST_F(ThreadSafeMapTest, ConcurrentWriters_AllKeysVisible) {
    const int NUM_WRITERS = 5;
    const int VALUES_PER_WRITER = 100;

    std::vector<std::thread> threads;
    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < VALUES_PER_WRITER; ++i) {
                std::string key = "w" + std::to_string(writer) + "_" + std::to_string(i);
                map.insert(key, std::make_shared<StockRecord>(writer * 1000 + i, key));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map.size(), static_cast<size_t>(NUM_WRITERS * VALUES_PER_WRITER));
    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        for (int i = 0; i < VALUES_PER_WRITER; ++i) {
            std::string key = "w" + std::to_string(writer) + "_" + std::to_string(i);
            auto found = map.find(key);
            ASSERT_NE(found, nullptr) << "Missing key: " << key;
            EXPECT_EQ(found->quantity, writer * 1000 + i);
        }
    }
}

TEST_F(ThreadSafeMapTest, ConcurrentInsertIfAbsent_ExactlyOneWins) {
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, i, &winners]() {
            if (map.insertIfAbsent("shared", std::make_shared<StockRecord>(i))) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(map.size(), 1u);
}
