#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "../test_utils.hpp"
#include "quant_engine/data/snapshot_cache.hpp"

using namespace quant_engine;
using namespace quant_engine::testing;

class SnapshotCacheTest : public TestBase {
protected:
    InMemorySnapshotCache cache;
};

TEST_F(SnapshotCacheTest, KeyIncludesStockDateAndMode) {
    EXPECT_EQ(SnapshotCache::make_key("000001.SZ", date(2024, 1, 5),
                                      BacktestMode::HISTORICAL_SIMULATION),
              "000001.SZ|2024-01-05|historical_simulation");
    EXPECT_NE(SnapshotCache::make_key("000001.SZ", date(2024, 1, 5),
                                      BacktestMode::HISTORICAL_SIMULATION),
              SnapshotCache::make_key("000001.SZ", date(2024, 1, 5),
                                      BacktestMode::MODEL_VALIDATION));
}

TEST_F(SnapshotCacheTest, MissReturnsNullopt) {
    EXPECT_FALSE(cache.get("absent").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(SnapshotCacheTest, SetThenGet) {
    auto snapshot = make_snapshot("600000.SH", date(2024, 1, 2), 10.0, {{"ma_signal", 0.5}});
    cache.set("k", snapshot);

    auto cached = cache.get("k");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->stock_code, "600000.SH");
    EXPECT_DOUBLE_EQ(cached->price.close, 10.0);
    EXPECT_DOUBLE_EQ(cached->factor_data.at("ma_signal"), 0.5);
}

TEST_F(SnapshotCacheTest, RewritingSameKeyKeepsOneEntry) {
    auto snapshot = make_snapshot("600000.SH", date(2024, 1, 2), 10.0, {{"f", 1.0}});
    cache.set("k", snapshot);
    cache.set("k", snapshot);
    EXPECT_EQ(cache.size(), 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("k").has_value());
}

TEST_F(SnapshotCacheTest, ConcurrentWritersAndReaders) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 100; ++i) {
                std::string key = "k" + std::to_string(i);
                cache.set(key, make_snapshot("600000.SH", date(2024, 1, 2), 10.0 + t, {}));
                cache.get(key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(cache.size(), 100u);
}
