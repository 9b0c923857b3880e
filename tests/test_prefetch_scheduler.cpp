/**
 * @file test_prefetch_scheduler.cpp
 * @brief Deduplication, concurrency budget, drain order, failure handling
 */

#include "snapfetch/prefetch_scheduler.h"
#include "test_support.h"
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>

using namespace snapfetch;
using namespace snapfetch::fakes;

class PrefetchSchedulerTest : public ::testing::Test {
protected:
    PrefetchConfig config;
    ManualClock clock;
    ManualExecutor executor;
    std::vector<std::string> ran;

    PrefetchScheduler make_scheduler(ConfidenceRescorer rescorer = nullptr) {
        return PrefetchScheduler(config, clock, executor,
            [this](const PrefetchCandidate& candidate) { ran.push_back(candidate.target); },
            std::move(rescorer));
    }
};

TEST_F(PrefetchSchedulerTest, DuplicateKeysAreRejected) {
    auto scheduler = make_scheduler();

    EXPECT_TRUE(scheduler.schedule(route_candidate("/coverage", 0.7)));
    EXPECT_FALSE(scheduler.schedule(route_candidate("/coverage", 0.9)));
    EXPECT_EQ(scheduler.pending_count(), 1u);
    EXPECT_TRUE(scheduler.is_pending("route:/coverage"));

    EXPECT_EQ(scheduler.process_tick(), 1u);
    EXPECT_TRUE(scheduler.is_in_progress("route:/coverage"));
    EXPECT_FALSE(scheduler.is_pending("route:/coverage"));
    EXPECT_FALSE(scheduler.schedule(route_candidate("/coverage", 0.9)));

    executor.run_all();
    EXPECT_EQ(scheduler.in_progress_count(), 0u);
    EXPECT_TRUE(scheduler.schedule(route_candidate("/coverage", 0.9)));
}

TEST_F(PrefetchSchedulerTest, SameTargetDifferentTypeIsDistinct) {
    auto scheduler = make_scheduler();
    PrefetchCandidate related = route_candidate("/coverage", 0.7);
    related.type = CandidateType::RELATED_DATA;

    EXPECT_TRUE(scheduler.schedule(route_candidate("/coverage", 0.7)));
    EXPECT_TRUE(scheduler.schedule(related));
    EXPECT_EQ(scheduler.pending_count(), 2u);
}

TEST_F(PrefetchSchedulerTest, TickRespectsConcurrencyBudget) {
    auto scheduler = make_scheduler();
    for (int i = 0; i < 5; ++i) {
        scheduler.schedule(route_candidate("/r" + std::to_string(i), 0.7));
    }

    EXPECT_EQ(scheduler.process_tick(), 3u);
    EXPECT_EQ(scheduler.in_progress_count(), 3u);
    EXPECT_EQ(scheduler.pending_count(), 2u);

    // Budget exhausted until jobs finish
    EXPECT_EQ(scheduler.process_tick(), 0u);

    executor.run_next();
    EXPECT_EQ(scheduler.process_tick(), 1u);
    EXPECT_EQ(scheduler.in_progress_count(), 3u);

    executor.run_all();
    EXPECT_EQ(scheduler.process_tick(), 1u);
    executor.run_all();

    EXPECT_EQ(ran.size(), 5u);
    EXPECT_EQ(scheduler.total_dispatched(), 5u);
    EXPECT_EQ(scheduler.total_completed(), 5u);
}

TEST_F(PrefetchSchedulerTest, HighestConfidenceDrainsFirst) {
    config.max_concurrent_prefetch = 1;
    auto scheduler = make_scheduler();
    scheduler.schedule(route_candidate("/low", 0.6));
    scheduler.schedule(route_candidate("/high", 0.9));
    scheduler.schedule(route_candidate("/mid", 0.7));

    for (int i = 0; i < 3; ++i) {
        scheduler.process_tick();
        executor.run_all();
    }

    EXPECT_EQ(ran, (std::vector<std::string>{"/high", "/mid", "/low"}));
}

TEST_F(PrefetchSchedulerTest, EqualConfidenceKeepsArrivalOrder) {
    config.max_concurrent_prefetch = 1;
    auto scheduler = make_scheduler();
    scheduler.schedule(route_candidate("/first", 0.8));
    scheduler.schedule(route_candidate("/second", 0.8));

    scheduler.process_tick();
    executor.run_all();
    EXPECT_EQ(ran, (std::vector<std::string>{"/first"}));
}

TEST_F(PrefetchSchedulerTest, PendingItemsAreRescoredAtDrainTime) {
    config.max_concurrent_prefetch = 1;
    std::map<std::string, double> fresh = {{"/a", 0.65}, {"/b", 1.0}};
    auto scheduler = make_scheduler([&fresh](const PrefetchCandidate& candidate) {
        return fresh.at(candidate.target);
    });

    scheduler.schedule(route_candidate("/a", 0.9));
    scheduler.schedule(route_candidate("/b", 0.6));

    scheduler.process_tick();
    executor.run_all();
    EXPECT_EQ(ran, (std::vector<std::string>{"/b"}));

    auto remaining = scheduler.pending_items();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_DOUBLE_EQ(remaining[0].candidate.confidence, 0.65);
}

TEST_F(PrefetchSchedulerTest, FailedJobReleasesItsKey) {
    PrefetchScheduler scheduler(config, clock, executor,
        [](const PrefetchCandidate&) { throw std::runtime_error("network down"); });

    scheduler.schedule(route_candidate("/coverage", 0.8));
    scheduler.process_tick();
    executor.run_all();

    EXPECT_EQ(scheduler.in_progress_count(), 0u);
    EXPECT_EQ(scheduler.total_completed(), 1u);
    EXPECT_TRUE(scheduler.schedule(route_candidate("/coverage", 0.8)));
}

TEST_F(PrefetchSchedulerTest, NonStandardExceptionReleasesItsKey) {
    PrefetchScheduler scheduler(config, clock, executor,
        [](const PrefetchCandidate&) { throw 42; });

    scheduler.schedule(route_candidate("/coverage", 0.8));
    scheduler.process_tick();
    EXPECT_NO_THROW(executor.run_all());

    EXPECT_EQ(scheduler.in_progress_count(), 0u);
    EXPECT_EQ(scheduler.total_completed(), 1u);
    EXPECT_TRUE(scheduler.schedule(route_candidate("/coverage", 0.8)));
}

TEST_F(PrefetchSchedulerTest, RejectedSubmissionIsDropped) {
    auto scheduler = make_scheduler();
    executor.reject = true;

    scheduler.schedule(route_candidate("/coverage", 0.8));
    EXPECT_EQ(scheduler.process_tick(), 0u);
    EXPECT_EQ(scheduler.in_progress_count(), 0u);
    EXPECT_EQ(scheduler.pending_count(), 0u);
    EXPECT_EQ(scheduler.total_dispatched(), 0u);
}

TEST_F(PrefetchSchedulerTest, EmptyQueueTickIsNoop) {
    auto scheduler = make_scheduler();
    EXPECT_EQ(scheduler.process_tick(), 0u);
    EXPECT_EQ(executor.queued(), 0u);
}

TEST_F(PrefetchSchedulerTest, ClearKeepsInFlightWork) {
    auto scheduler = make_scheduler();
    config.max_concurrent_prefetch = 1;
    scheduler.schedule(route_candidate("/a", 0.9));
    scheduler.schedule(route_candidate("/b", 0.8));
    scheduler.process_tick();

    scheduler.clear();
    EXPECT_EQ(scheduler.pending_count(), 0u);
    EXPECT_EQ(scheduler.in_progress_count(), 1u);
}

TEST_F(PrefetchSchedulerTest, ResetForgetsInFlightWork) {
    auto scheduler = make_scheduler();
    scheduler.schedule(route_candidate("/a", 0.9));
    scheduler.process_tick();
    scheduler.schedule(route_candidate("/b", 0.8));

    scheduler.reset();
    EXPECT_EQ(scheduler.pending_count(), 0u);
    EXPECT_EQ(scheduler.in_progress_count(), 0u);

    // Re-dispatched after reset; the first job's completion must not release it
    scheduler.schedule(route_candidate("/a", 0.9));
    scheduler.process_tick();
    ASSERT_EQ(executor.queued(), 2u);

    executor.run_next();
    EXPECT_TRUE(scheduler.is_in_progress("route:/a"));

    executor.run_next();
    EXPECT_FALSE(scheduler.is_in_progress("route:/a"));
}

TEST_F(PrefetchSchedulerTest, ScheduledAtUsesClock) {
    auto scheduler = make_scheduler();
    scheduler.schedule(route_candidate("/a", 0.9));

    auto items = scheduler.pending_items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].key, "route:/a");
    EXPECT_EQ(items[0].scheduled_at, clock.now_ms());
}
