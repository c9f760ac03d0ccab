#include "core/TtlCache.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_orch;

class TtlCacheTest : public ::testing::Test {
protected:
    using Cache = TtlCache<std::string, int>;

    Cache make_cache(std::size_t max_entries) {
        return Cache(std::chrono::milliseconds(1000), max_entries, [this] { return now; });
    }

    void advance(int ms) {
        now += std::chrono::milliseconds(ms);
    }

    Cache::Clock::time_point now = Cache::Clock::time_point{} + std::chrono::hours(1);
};

TEST_F(TtlCacheTest, ReturnsStoredValueWithinTtl) {
    auto cache = make_cache(4);
    cache.put("a", 1);
    advance(999);

    auto value = cache.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 1);
}

TEST_F(TtlCacheTest, StaleEntryIsDroppedOnRead) {
    auto cache = make_cache(4);
    cache.put("a", 1);
    advance(1000);

    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TtlCacheTest, FullCacheSweepsStaleEntriesBeforeEvicting) {
    auto cache = make_cache(2);
    cache.put("old", 1);
    advance(500);
    cache.put("fresh", 2);
    advance(600);  // "old" is now stale, "fresh" is not

    cache.put("new", 3);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.get("fresh").has_value());
    EXPECT_TRUE(cache.get("new").has_value());
}

TEST_F(TtlCacheTest, FullCacheEvictsOldestLiveEntry) {
    auto cache = make_cache(2);
    cache.put("first", 1);
    advance(10);
    cache.put("second", 2);
    advance(10);

    cache.put("third", 3);

    EXPECT_FALSE(cache.get("first").has_value());
    EXPECT_TRUE(cache.get("second").has_value());
    EXPECT_TRUE(cache.get("third").has_value());
}

TEST_F(TtlCacheTest, OverwritingExistingKeyDoesNotEvict) {
    auto cache = make_cache(2);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("a", 10);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(*cache.get("a"), 10);
    EXPECT_EQ(*cache.get("b"), 2);
}

TEST_F(TtlCacheTest, GetOrComputeComputesOncePerKey) {
    auto cache = make_cache(4);
    int computed = 0;

    EXPECT_EQ(cache.get_or_compute("k", [&] { ++computed; return 42; }), 42);
    EXPECT_EQ(cache.get_or_compute("k", [&] { ++computed; return 7; }), 42);
    EXPECT_EQ(computed, 1);

    advance(1000);
    EXPECT_EQ(cache.get_or_compute("k", [&] { ++computed; return 7; }), 7);
    EXPECT_EQ(computed, 2);
}

TEST(TtlCacheConcurrencyTest, ConcurrentGetOrComputeStaysConsistent) {
    TtlCache<int, int> cache(std::chrono::milliseconds(60000), 8);
    std::atomic<int> computed{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                int key = i % 4;
                int value = cache.get_or_compute(key, [&] { ++computed; return key * 10; });
                EXPECT_EQ(value, key * 10);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(computed.load(), 4);
    EXPECT_EQ(cache.size(), 4u);
}
