/**
 * @file test_cache_bridge.cpp
 * @brief Check-then-fetch-then-store behavior of CacheBridge
 */

#include "snapfetch/cache_bridge.h"
#include "snapfetch/memory_cache_store.h"
#include "test_support.h"
#include <gtest/gtest.h>

using namespace snapfetch;
using namespace snapfetch::fakes;
using json = nlohmann::json;

class CacheBridgeTest : public ::testing::Test {
protected:
    PrefetchConfig config;
    ManualClock clock;
    MemoryCacheStore cache{clock};
    FakeFetcher fetcher;
    CacheBridge bridge{cache, fetcher, config};
};

TEST_F(CacheBridgeTest, StoresFetchedDataWithPrefetchTtl) {
    fetcher.put("coverages:all", json::array({json{{"id", "c1"}}}));

    EXPECT_EQ(bridge.fetch_and_cache(requirement("coverages", "all")), PrefetchOutcome::STORED);
    auto cached = cache.get("coverages", "all");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ((*cached)[0]["id"], "c1");

    clock.advance(config.max_prefetch_age.count() - 1);
    EXPECT_TRUE(cache.get("coverages", "all").has_value());
    clock.advance(1);
    EXPECT_FALSE(cache.get("coverages", "all").has_value());
}

TEST_F(CacheBridgeTest, WarmEntryIsLeftAlone) {
    cache.set("products", "all", json::array({"existing"}));
    fetcher.put("products:all", json::array({"fresh"}));

    EXPECT_EQ(bridge.fetch_and_cache(requirement("products", "all")), PrefetchOutcome::ALREADY_CACHED);
    EXPECT_EQ(fetcher.call_count("products:all"), 0u);
    EXPECT_EQ((*cache.get("products", "all"))[0], "existing");
    EXPECT_EQ(bridge.get_stats().cache_hits, 1u);
}

TEST_F(CacheBridgeTest, ParamsAreForwardedAndPartOfTheCacheKey) {
    json params = {{"limitCount", 5}};
    fetcher.put("forms:all", json::array());

    EXPECT_EQ(bridge.fetch_and_cache(requirement("forms", "all", params)), PrefetchOutcome::STORED);
    EXPECT_TRUE(cache.get("forms", "all", params).has_value());
    EXPECT_FALSE(cache.get("forms", "all").has_value());
}

TEST_F(CacheBridgeTest, NothingToStoreIsEmpty) {
    fetcher.put("rules:all", json());

    EXPECT_EQ(bridge.fetch_and_cache(requirement("news", "all")), PrefetchOutcome::EMPTY);
    EXPECT_EQ(bridge.fetch_and_cache(requirement("rules", "all")), PrefetchOutcome::EMPTY);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(bridge.get_stats().empty, 2u);
}

TEST_F(CacheBridgeTest, FetchFailureIsContained) {
    fetcher.fail("tasks:all");

    EXPECT_EQ(bridge.fetch_and_cache(requirement("tasks", "all")), PrefetchOutcome::FAILED);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(bridge.get_stats().failed, 1u);
}

TEST_F(CacheBridgeTest, NonStandardExceptionIsContained) {
    fetcher.fail_with_code("tasks:all", 42);

    PrefetchOutcome outcome = PrefetchOutcome::STORED;
    EXPECT_NO_THROW(outcome = bridge.fetch_and_cache(requirement("tasks", "all")));
    EXPECT_EQ(outcome, PrefetchOutcome::FAILED);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(bridge.get_stats().failed, 1u);
}

TEST_F(CacheBridgeTest, PrefetchAllCountsStoredEntries) {
    fetcher.put("coverages:all", json::array());
    fetcher.put("forms:all", json::array());
    fetcher.fail("steps:all");
    cache.set("products", "all", json::array());

    size_t stored = bridge.prefetch_all({
        requirement("coverages", "all"),
        requirement("forms", "all"),
        requirement("steps", "all"),
        requirement("products", "all")
    });

    EXPECT_EQ(stored, 2u);
    auto stats = bridge.get_stats();
    EXPECT_EQ(stats.stored, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.cache_hits, 1u);
}

TEST(PrefetchOutcomeTest, Names) {
    EXPECT_STREQ(prefetch_outcome_to_string(PrefetchOutcome::ALREADY_CACHED), "already_cached");
    EXPECT_STREQ(prefetch_outcome_to_string(PrefetchOutcome::FAILED), "failed");
}
