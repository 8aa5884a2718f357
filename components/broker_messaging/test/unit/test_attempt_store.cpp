// test/unit/test_attempt_store.cpp
#include <gtest/gtest.h>
#include "broker_messaging/attempt_store.hpp"
#include <thread>
#include <vector>

using namespace broker_messaging;

class InMemoryAttemptStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<InMemoryAttemptStore>(3, std::chrono::milliseconds(200));
    }

    std::unique_ptr<InMemoryAttemptStore> store_;
};

TEST_F(InMemoryAttemptStoreTest, CountsDeliveriesPerMessage) {
    EXPECT_EQ(1, store_->increment("a").value);
    EXPECT_EQ(2, store_->increment("a").value);
    EXPECT_EQ(1, store_->increment("b").value);
    EXPECT_EQ(2, store_->get("a").value);
    EXPECT_EQ(0, store_->get("unknown").value);
}

TEST_F(InMemoryAttemptStoreTest, ClearForgetsMessage) {
    store_->increment("a");
    store_->increment("a");
    EXPECT_TRUE(store_->clear("a"));
    EXPECT_EQ(0, store_->get("a").value);
    EXPECT_EQ(1, store_->increment("a").value);
    // Clearing an unknown id is not an error
    EXPECT_TRUE(store_->clear("missing"));
}

TEST_F(InMemoryAttemptStoreTest, EvictsLeastRecentlyUsed) {
    store_->increment("a");
    store_->increment("b");
    store_->increment("c");
    store_->increment("a");
    store_->increment("d");

    EXPECT_EQ(3u, store_->size());
    EXPECT_EQ(0, store_->get("b").value);
    EXPECT_EQ(2, store_->get("a").value);
}

TEST_F(InMemoryAttemptStoreTest, EntriesExpire) {
    store_->increment("a");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(0, store_->get("a").value);
    EXPECT_EQ(0u, store_->size());
}

TEST_F(InMemoryAttemptStoreTest, ZeroCapacityRejected) {
    EXPECT_THROW(InMemoryAttemptStore(0), ConfigException);
}

TEST_F(InMemoryAttemptStoreTest, ConcurrentIncrements) {
    InMemoryAttemptStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store] {
            for (int i = 0; i < 250; ++i) {
                store.increment("shared");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(1000, store.get("shared").value);
}
