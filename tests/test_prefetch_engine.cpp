/**
 * @file test_prefetch_engine.cpp
 * @brief End-to-end engine behavior with a manual clock and executor
 */

#include "snapfetch/memory_cache_store.h"
#include "snapfetch/memory_durable_store.h"
#include "snapfetch/prefetch_engine.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>

using namespace snapfetch;
using namespace snapfetch::fakes;
using json = nlohmann::json;

namespace {

const char* PRODUCT_CARD =
    R"({"type":"productCard","identifier":"p1","prefetchTargets":[)"
    R"({"category":"coverages","identifier":"c1"},{"category":"forms","identifier":"all"}]})";

} // anonymous namespace

class PrefetchEngineTest : public ::testing::Test {
protected:
    PrefetchConfig config;
    ManualClock clock;
    ManualExecutor executor;
    MemoryCacheStore cache{clock};
    FakeFetcher fetcher;
    MemoryDurableStore durable;

    void SetUp() override {
        fetcher.put("coverages:all", json::array({"c1", "c2"}));
        fetcher.put("forms:all", json::array({"f1"}));
        fetcher.put("coverages:c1", json{{"id", "c1"}});
        fetcher.put("products:all", json::array({"p1"}));
    }

    std::unique_ptr<PrefetchEngine> make_engine() {
        auto engine = std::make_unique<PrefetchEngine>(config, cache, fetcher, durable, clock, &executor);
        engine->initialize();
        return engine;
    }

    static RouteChangeEvent route(const std::string& from, const std::string& to, int64_t spent = 1000) {
        RouteChangeEvent event;
        event.from_route = from;
        event.to_route = to;
        event.time_spent_ms = spent;
        return event;
    }

    static DataAccessEvent access(const std::string& category, const std::string& identifier) {
        DataAccessEvent event;
        event.category = category;
        event.identifier = identifier;
        return event;
    }
};

TEST_F(PrefetchEngineTest, FirstRunIsColdAndLaterRunsAreWarm) {
    {
        auto engine = make_engine();
        EXPECT_EQ(engine->state(), EngineState::COLD);
        engine->on_route_change(route("/products", "/coverage"));
        EXPECT_EQ(durable.size(), 1u);
    }

    auto engine = make_engine();
    EXPECT_EQ(engine->state(), EngineState::WARM);
    EXPECT_EQ(engine->get_stats().route_transition_count, 1u);

    // Idempotent
    EXPECT_EQ(engine->initialize(), EngineState::WARM);
}

TEST_F(PrefetchEngineTest, PersistenceCanBeDisabled) {
    config.persist_patterns = false;
    {
        auto engine = make_engine();
        engine->on_route_change(route("/products", "/coverage"));
        engine->on_data_access(access("products", "all"));
    }
    EXPECT_EQ(durable.size(), 0u);

    auto engine = make_engine();
    EXPECT_EQ(engine->state(), EngineState::COLD);
}

TEST_F(PrefetchEngineTest, BrokenStorageDoesNotStopLearning) {
    ThrowingDurableStore broken;
    PrefetchEngine engine(config, cache, fetcher, broken, clock, &executor);

    EXPECT_EQ(engine.initialize(), EngineState::COLD);
    engine.on_route_change(route("/products", "/coverage"));
    EXPECT_EQ(engine.get_stats().route_transition_count, 1u);
}

TEST_F(PrefetchEngineTest, LearnedRouteIsPrefetchedOnArrival) {
    auto engine = make_engine();
    for (int i = 0; i < 6; ++i) {
        engine->on_route_change(route("/products", "/coverage"));
    }
    EXPECT_EQ(engine->get_stats().prefetch_queue_size, 0u);

    engine->on_route_change(route("/coverage", "/products"));
    auto stats = engine->get_stats();
    EXPECT_EQ(stats.prefetch_queue_size, 1u);
    EXPECT_EQ(stats.route_transition_count, 2u);
    EXPECT_EQ(engine->current_route(), std::optional<std::string>("/products"));

    EXPECT_EQ(engine->process_tick(), 1u);
    EXPECT_EQ(engine->get_stats().prefetch_in_progress_count, 1u);
    executor.run_all();

    EXPECT_EQ(engine->get_stats().prefetch_in_progress_count, 0u);
    EXPECT_TRUE(cache.get("coverages", "all").has_value());
    EXPECT_TRUE(cache.get("forms", "all").has_value());
    EXPECT_EQ(engine->bridge().get_stats().stored, 2u);
}

TEST_F(PrefetchEngineTest, PredictionsBelowThresholdAreNotScheduled) {
    auto engine = make_engine();
    for (int i = 0; i < 5; ++i) {
        engine->on_route_change(route("/products", "/coverage"));
    }

    EXPECT_EQ(engine->predict_and_prefetch("/products"), 0u);
    EXPECT_TRUE(engine->predictions_for("/products").empty());
}

TEST_F(PrefetchEngineTest, ObserveRouteMeasuresDwellTime) {
    auto engine = make_engine();

    EXPECT_FALSE(engine->observe_route("/products"));
    clock.advance(2500);
    EXPECT_FALSE(engine->observe_route("/products"));
    EXPECT_TRUE(engine->observe_route("/coverage"));

    auto transition = engine->tracker().get_route_transition("/products", "/coverage");
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->total_time_ms, 2500);
    EXPECT_EQ(engine->current_route(), std::optional<std::string>("/coverage"));
}

TEST_F(PrefetchEngineTest, InteractionTargetsWaitForPrefetchDelay) {
    auto engine = make_engine();

    ASSERT_TRUE(engine->on_component_interaction(PRODUCT_CARD));
    EXPECT_EQ(engine->deferred_count(), 2u);
    EXPECT_EQ(engine->get_stats().component_stat_count, 1u);

    clock.advance(config.prefetch_delay.count() - 1);
    EXPECT_EQ(engine->poll(), 0u);
    EXPECT_EQ(engine->deferred_count(), 2u);

    clock.advance(1);
    EXPECT_EQ(engine->poll(), 2u);
    EXPECT_EQ(engine->deferred_count(), 0u);
    executor.run_all();

    EXPECT_TRUE(cache.get("coverages", "c1").has_value());
    EXPECT_TRUE(cache.get("forms", "all").has_value());
}

TEST_F(PrefetchEngineTest, InteractionWithoutTargetsOnlyCounts) {
    auto engine = make_engine();

    EXPECT_TRUE(engine->on_component_interaction(R"({"type":"tab","identifier":"details"})"));
    EXPECT_EQ(engine->deferred_count(), 0u);
    EXPECT_EQ(engine->get_stats().component_stat_count, 1u);
}

TEST_F(PrefetchEngineTest, MalformedInteractionIsRejected) {
    auto engine = make_engine();

    EXPECT_FALSE(engine->on_component_interaction("{broken"));
    EXPECT_EQ(engine->get_stats().component_stat_count, 0u);
    EXPECT_EQ(engine->deferred_count(), 0u);
}

TEST_F(PrefetchEngineTest, PollTicksOnTickInterval) {
    auto engine = make_engine();
    for (int i = 0; i < 6; ++i) {
        engine->on_route_change(route("/products", "/coverage"));
    }
    engine->on_route_change(route("/coverage", "/products"));
    ASSERT_EQ(engine->get_stats().prefetch_queue_size, 1u);

    clock.advance(config.tick_interval.count() - 1);
    EXPECT_EQ(engine->poll(), 0u);

    clock.advance(1);
    EXPECT_EQ(engine->poll(), 1u);
    EXPECT_EQ(engine->get_stats().prefetch_queue_size, 0u);
}

TEST_F(PrefetchEngineTest, CorrelatedDataIsPrefetched) {
    auto engine = make_engine();
    for (int i = 0; i < 3; ++i) {
        engine->on_data_access(access("products", "all"));
        clock.advance(1000);
        engine->on_data_access(access("coverages", "all"));
        clock.advance(1000);
    }
    EXPECT_EQ(engine->get_stats().total_observed_accesses, 6u);
    EXPECT_EQ(engine->get_stats().behavior_pattern_count, 2u);

    EXPECT_EQ(engine->predict_and_prefetch("/anywhere"), 2u);
    engine->process_tick();
    executor.run_all();

    EXPECT_TRUE(cache.get("coverages", "all").has_value());
    EXPECT_TRUE(cache.get("products", "all").has_value());
}

TEST_F(PrefetchEngineTest, ResetForgetsEverything) {
    auto engine = make_engine();
    for (int i = 0; i < 6; ++i) {
        engine->on_route_change(route("/products", "/coverage"));
    }
    engine->on_route_change(route("/coverage", "/products"));
    engine->process_tick();
    engine->on_data_access(access("forms", "all"));
    engine->on_component_interaction(PRODUCT_CARD);
    ASSERT_EQ(engine->get_stats().prefetch_in_progress_count, 1u);

    engine->reset();

    auto stats = engine->get_stats();
    EXPECT_EQ(stats.route_transition_count, 0u);
    EXPECT_EQ(stats.behavior_pattern_count, 0u);
    EXPECT_EQ(stats.component_stat_count, 0u);
    EXPECT_EQ(stats.prefetch_queue_size, 0u);
    EXPECT_EQ(stats.prefetch_in_progress_count, 0u);
    EXPECT_EQ(stats.total_observed_accesses, 0u);
    EXPECT_EQ(engine->deferred_count(), 0u);
    EXPECT_FALSE(engine->current_route().has_value());
    EXPECT_EQ(engine->state(), EngineState::COLD);
    EXPECT_EQ(durable.size(), 0u);

    // The job dispatched before the reset still finishes harmlessly
    executor.run_all();
    EXPECT_EQ(engine->get_stats().prefetch_in_progress_count, 0u);
}

TEST_F(PrefetchEngineTest, BackgroundLoopDrivesPrefetching) {
    SystemClock& real_clock = SystemClock::instance();
    InlineExecutor inline_executor;
    config.prefetch_delay = std::chrono::milliseconds(20);
    config.poll_interval = std::chrono::milliseconds(5);

    PrefetchEngine engine(config, cache, fetcher, durable, real_clock, &inline_executor);
    engine.start();
    EXPECT_EQ(engine.state(), EngineState::RUNNING);
    EXPECT_TRUE(engine.is_running());

    ASSERT_TRUE(engine.on_component_interaction(PRODUCT_CARD));
    for (int i = 0; i < 200 && engine.bridge().get_stats().stored < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    engine.stop();
    EXPECT_FALSE(engine.is_running());
    EXPECT_EQ(engine.state(), EngineState::COLD);
    EXPECT_EQ(engine.bridge().get_stats().stored, 2u);
}

TEST(EngineStateTest, Names) {
    EXPECT_STREQ(engine_state_to_string(EngineState::UNINITIALIZED), "uninitialized");
    EXPECT_STREQ(engine_state_to_string(EngineState::WARM), "warm");
    EXPECT_STREQ(engine_state_to_string(EngineState::RUNNING), "running");
}
