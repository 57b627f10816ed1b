#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "ost/cache/lru_cache.hpp"
#include "ost/metrics/metrics.hpp"

using ost::cache::cache_config;
using ost::cache::lru_cache;

namespace {

// Every entry weighs exactly its value.
std::size_t weight_of(const std::string&, const std::size_t& v) { return v; }

} // namespace

class LruCacheTest : public ::testing::Test {
protected:
    ost::metrics::counter_metrics metrics;
    lru_cache<std::size_t> cache{"test_cache", cache_config{100, std::chrono::seconds(0)}, weight_of, &metrics};
};

TEST_F(LruCacheTest, MissThenHit) {
    EXPECT_FALSE(cache.get("a").has_value());
    cache.put("a", 10);
    auto v = cache.get("a");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 10u);

    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(metrics.hits("test_cache"), 1u);
    EXPECT_EQ(metrics.misses("test_cache"), 1u);
}

TEST_F(LruCacheTest, EvictsLeastRecentlyUsedFirst) {
    cache.put("a", 40);
    cache.put("b", 40);
    cache.put("c", 20);
    EXPECT_EQ(cache.bytes(), 100u);

    cache.put("d", 30);

    EXPECT_FALSE(cache.peek("a").has_value());
    EXPECT_TRUE(cache.peek("b").has_value());
    EXPECT_TRUE(cache.peek("c").has_value());
    EXPECT_TRUE(cache.peek("d").has_value());
    EXPECT_LE(cache.bytes(), cache.capacity());
}

TEST_F(LruCacheTest, RecentlyReadEntrySurvivesEviction) {
    cache.put("a", 40);
    cache.put("b", 40);
    ASSERT_TRUE(cache.get("a").has_value());   // a is now the most recent

    cache.put("c", 40);

    EXPECT_TRUE(cache.peek("a").has_value());
    EXPECT_FALSE(cache.peek("b").has_value());
    EXPECT_TRUE(cache.peek("c").has_value());
}

TEST_F(LruCacheTest, PeekDoesNotRefreshRecency) {
    cache.put("a", 40);
    cache.put("b", 40);
    ASSERT_TRUE(cache.peek("a").has_value());

    cache.put("c", 40);

    EXPECT_FALSE(cache.peek("a").has_value());
    EXPECT_EQ(cache.hits(), 0u);
    EXPECT_EQ(cache.misses(), 0u);
}

TEST_F(LruCacheTest, OversizedEntryIsRefusedWithoutEvicting) {
    cache.put("a", 50);
    EXPECT_FALSE(cache.put("huge", 101));
    EXPECT_TRUE(cache.peek("a").has_value());
    EXPECT_FALSE(cache.peek("huge").has_value());
    EXPECT_EQ(cache.bytes(), 50u);
}

TEST_F(LruCacheTest, ReplacingKeyKeepsItUnique) {
    cache.put("a", 30);
    cache.put("a", 60);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.bytes(), 60u);
    EXPECT_EQ(*cache.peek("a"), 60u);
}

TEST_F(LruCacheTest, EraseAndClear) {
    cache.put("a", 10);
    cache.put("b", 10);
    EXPECT_TRUE(cache.erase("a"));
    EXPECT_FALSE(cache.erase("a"));
    EXPECT_EQ(cache.bytes(), 10u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.bytes(), 0u);
}

TEST(LruCacheTtlTest, ExpiredEntryCountsAsMiss) {
    lru_cache<std::size_t> cache("ttl_cache", cache_config{100, std::chrono::seconds(1)}, weight_of);
    cache.put("a", 10);
    EXPECT_TRUE(cache.get("a").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(LruCacheConcurrencyTest, CapacityHoldsUnderConcurrentWriters) {
    lru_cache<std::size_t> cache("busy", cache_config{1000, std::chrono::seconds(0)}, weight_of);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&cache, t]() {
            for (int i = 0; i < 500; ++i) {
                cache.put("k" + std::to_string(t) + "_" + std::to_string(i), 7 + (i % 13));
                cache.get("k" + std::to_string(t) + "_" + std::to_string(i / 2));
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }

    EXPECT_LE(cache.bytes(), 1000u);
    EXPECT_GT(cache.size(), 0u);
}
