/**
 * @file prefetch_worker_pool.cpp
 * @brief Prefetch worker pool implementation
 */

#include "snapfetch/prefetch_worker_pool.h"
#include <iostream>
#include <stdexcept>

namespace snapfetch {

PrefetchWorkerPool::PrefetchWorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&PrefetchWorkerPool::worker_loop, this);
    }

    std::cout << "[PrefetchWorkerPool] Started " << num_threads << " workers" << std::endl;
}

PrefetchWorkerPool::~PrefetchWorkerPool() {
    shutdown();
}

void PrefetchWorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            throw std::runtime_error("PrefetchWorkerPool is shut down");
        }
        tasks_.push_back(std::move(task));
    }
    task_cv_.notify_one();
}

void PrefetchWorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            return;
        }
        accepting_ = false;
    }
    task_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::cout << "[PrefetchWorkerPool] Stopped after " << completed_.load() << " tasks" << std::endl;
}

void PrefetchWorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return tasks_.empty() && active_ == 0; });
}

size_t PrefetchWorkerPool::queued_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

//=============================================================================
// Internal Methods
//=============================================================================

void PrefetchWorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_cv_.wait(lock, [this]() { return !tasks_.empty() || !accepting_; });

            // Queued tasks still run after shutdown()
            if (tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            active_++;
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[PrefetchWorkerPool] Task failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[PrefetchWorkerPool] Task failed: unknown error" << std::endl;
        }
        completed_.fetch_add(1);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_--;
            if (tasks_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace snapfetch
