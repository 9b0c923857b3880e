/**
 * @file prefetch_scheduler.h
 * @brief Deduplicating prefetch queue with a concurrency budget
 *
 * Candidates are keyed by "${type}:${target}". A key is either pending,
 * in progress, or unknown to the scheduler; never both pending and in
 * progress. Each tick drains the pending queue, highest confidence first,
 * into the free in-flight slots.
 */

#pragma once

#include "interfaces/i_clock.h"
#include "interfaces/i_task_executor.h"
#include "prefetch_config.h"
#include "prefetch_types.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace snapfetch {

/**
 * @brief Work performed for one dequeued candidate
 */
using PrefetchJob = std::function<void(const PrefetchCandidate& candidate)>;

/**
 * @brief Recomputes a queued candidate's confidence at drain time
 */
using ConfidenceRescorer = std::function<double(const PrefetchCandidate& candidate)>;

/**
 * @brief Prefetch Scheduler
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Jobs run on the executor; completion may race with schedule() and
 *   process_tick() on other threads
 *
 * Usage:
 * @code
 * PrefetchScheduler scheduler(config, clock, pool,
 *     [&](const PrefetchCandidate& c) { bridge.prefetch_all(c.data_requirements); });
 * scheduler.schedule(candidate);
 * scheduler.process_tick();   // every tick_interval
 * @endcode
 */
class PrefetchScheduler {
public:
    PrefetchScheduler(
        const PrefetchConfig& config,
        const IClock& clock,
        ITaskExecutor& executor,
        PrefetchJob job,
        ConfidenceRescorer rescorer = nullptr
    );

    // Non-copyable
    PrefetchScheduler(const PrefetchScheduler&) = delete;
    PrefetchScheduler& operator=(const PrefetchScheduler&) = delete;

    /**
     * @brief Queue a candidate
     * @return false if the key is already pending or in progress
     */
    bool schedule(const PrefetchCandidate& candidate);

    /**
     * @brief Dispatch pending candidates into free in-flight slots
     * @return Number of candidates dispatched
     */
    size_t process_tick();

    /**
     * @brief Drop all pending candidates (in-flight ones run to completion)
     */
    void clear();

    /**
     * @brief Forget pending and in-progress keys
     *
     * Jobs already running still finish; their completion is then a no-op.
     * The worker pool keeps actual execution within budget meanwhile.
     */
    void reset();

    //=========================================================================
    // Inspection
    //=========================================================================

    size_t pending_count() const;
    size_t in_progress_count() const;

    bool is_pending(const std::string& key) const;
    bool is_in_progress(const std::string& key) const;

    /**
     * @brief Copy of the pending queue (drain order after the last tick)
     */
    std::vector<PrefetchQueueItem> pending_items() const;

    uint64_t total_dispatched() const { return total_dispatched_.load(); }
    uint64_t total_completed() const { return total_completed_.load(); }

private:
    const PrefetchConfig& config_;
    const IClock& clock_;
    ITaskExecutor& executor_;
    PrefetchJob job_;
    ConfidenceRescorer rescorer_;

    mutable std::mutex mutex_;
    std::vector<PrefetchQueueItem> pending_;
    std::unordered_map<std::string, uint64_t> in_progress_;   ///< Key -> dispatch id
    uint64_t next_dispatch_id_ = 0;

    std::atomic<uint64_t> total_dispatched_{0};
    std::atomic<uint64_t> total_completed_{0};

    // Caller holds mutex_
    bool is_pending_locked(const std::string& key) const;

    void run_job(const PrefetchQueueItem& item, uint64_t dispatch_id);

    // Releases the key only if it still belongs to this dispatch
    void complete(const std::string& key, uint64_t dispatch_id);
};

} // namespace snapfetch
