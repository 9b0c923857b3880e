/**
 * @file prefetch_worker_pool.h
 * @brief Fixed-size worker pool that runs prefetch jobs
 */

#pragma once

#include "interfaces/i_task_executor.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace snapfetch {

/**
 * @brief FIFO task queue drained by a fixed number of threads
 *
 * Sized to max_concurrent_prefetch, so at most that many prefetches are
 * ever in flight regardless of what the scheduler admits.
 *
 * Thread Safety:
 * - submit() and shutdown() may be called from any thread
 * - Tasks must not throw; an escaping exception is logged and dropped
 */
class PrefetchWorkerPool : public ITaskExecutor {
public:
    /**
     * @param num_threads Number of worker threads (at least 1)
     */
    explicit PrefetchWorkerPool(size_t num_threads);

    /**
     * @brief Drains remaining tasks and joins the workers
     */
    ~PrefetchWorkerPool() override;

    // Non-copyable
    PrefetchWorkerPool(const PrefetchWorkerPool&) = delete;
    PrefetchWorkerPool& operator=(const PrefetchWorkerPool&) = delete;

    /**
     * @throws std::runtime_error after shutdown()
     */
    void submit(std::function<void()> task) override;

    /**
     * @brief Stop accepting tasks, run what is queued, join the workers
     */
    void shutdown();

    /**
     * @brief Block until the queue is empty and no task is running
     */
    void wait_idle();

    size_t thread_count() const { return workers_.size(); }
    size_t queued_count() const;
    uint64_t completed_count() const { return completed_.load(); }

private:
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable task_cv_;
    std::condition_variable idle_cv_;

    bool accepting_ = true;
    size_t active_ = 0;
    std::atomic<uint64_t> completed_{0};

    void worker_loop();
};

} // namespace snapfetch
