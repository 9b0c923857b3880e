/**
 * @file prefetch_scheduler.cpp
 * @brief Prefetch Scheduler Implementation
 */

#include "snapfetch/prefetch_scheduler.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace snapfetch {

namespace {

// Releases an in-flight key on every exit path of a job
class InFlightGuard {
    std::function<void()> release_fn_;
public:
    explicit InFlightGuard(std::function<void()> release_fn)
        : release_fn_(std::move(release_fn)) {}
    ~InFlightGuard() { release_fn_(); }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;
};

} // anonymous namespace

PrefetchScheduler::PrefetchScheduler(
    const PrefetchConfig& config,
    const IClock& clock,
    ITaskExecutor& executor,
    PrefetchJob job,
    ConfidenceRescorer rescorer
)
    : config_(config)
    , clock_(clock)
    , executor_(executor)
    , job_(std::move(job))
    , rescorer_(std::move(rescorer))
{
}

bool PrefetchScheduler::schedule(const PrefetchCandidate& candidate) {
    std::string key = candidate.key();

    std::lock_guard<std::mutex> lock(mutex_);

    if (in_progress_.count(key) > 0 || is_pending_locked(key)) {
        return false;
    }

    PrefetchQueueItem item;
    item.key = std::move(key);
    item.candidate = candidate;
    item.scheduled_at = clock_.now_ms();
    pending_.push_back(std::move(item));
    return true;
}

size_t PrefetchScheduler::process_tick() {
    std::vector<std::pair<PrefetchQueueItem, uint64_t>> batch;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (pending_.empty() || in_progress_.size() >= config_.max_concurrent_prefetch) {
            return 0;
        }

        // Statistics keep moving after enqueue; rank on current confidence
        if (rescorer_) {
            for (auto& item : pending_) {
                item.candidate.confidence = rescorer_(item.candidate);
            }
        }
        std::stable_sort(pending_.begin(), pending_.end(),
            [](const PrefetchQueueItem& a, const PrefetchQueueItem& b) {
                return a.candidate.confidence > b.candidate.confidence;
            });

        size_t capacity = config_.max_concurrent_prefetch - in_progress_.size();
        size_t take = std::min(capacity, pending_.size());

        batch.reserve(take);
        for (size_t i = 0; i < take; ++i) {
            uint64_t dispatch_id = ++next_dispatch_id_;
            in_progress_[pending_[i].key] = dispatch_id;
            batch.emplace_back(std::move(pending_[i]), dispatch_id);
        }
        pending_.erase(pending_.begin(), pending_.begin() + take);
    }

    size_t dispatched = 0;
    for (auto& entry : batch) {
        const PrefetchQueueItem& item = entry.first;
        uint64_t dispatch_id = entry.second;
        try {
            executor_.submit([this, item, dispatch_id]() { run_job(item, dispatch_id); });
            dispatched++;
            total_dispatched_.fetch_add(1);
        } catch (const std::exception& e) {
            std::cerr << "[PrefetchScheduler] Failed to dispatch " << item.key
                      << ": " << e.what() << std::endl;
            complete(item.key, dispatch_id);
        }
    }

    return dispatched;
}

void PrefetchScheduler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
}

void PrefetchScheduler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
    in_progress_.clear();
}

//=============================================================================
// Inspection
//=============================================================================

size_t PrefetchScheduler::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t PrefetchScheduler::in_progress_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_progress_.size();
}

bool PrefetchScheduler::is_pending(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_pending_locked(key);
}

bool PrefetchScheduler::is_in_progress(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_progress_.count(key) > 0;
}

std::vector<PrefetchQueueItem> PrefetchScheduler::pending_items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

//=============================================================================
// Internal Methods
//=============================================================================

bool PrefetchScheduler::is_pending_locked(const std::string& key) const {
    return std::any_of(pending_.begin(), pending_.end(),
        [&key](const PrefetchQueueItem& item) { return item.key == key; });
}

void PrefetchScheduler::run_job(const PrefetchQueueItem& item, uint64_t dispatch_id) {
    InFlightGuard guard([this, &item, dispatch_id]() {
        complete(item.key, dispatch_id);
        total_completed_.fetch_add(1);
    });

    try {
        job_(item.candidate);
    } catch (const std::exception& e) {
        // No retry: the key may come back with a later prediction cycle
        std::cerr << "[PrefetchScheduler] Prefetch " << item.key
                  << " failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[PrefetchScheduler] Prefetch " << item.key
                  << " failed: unknown error" << std::endl;
    }
}

void PrefetchScheduler::complete(const std::string& key, uint64_t dispatch_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_progress_.find(key);
    if (it != in_progress_.end() && it->second == dispatch_id) {
        in_progress_.erase(it);
    }
}

} // namespace snapfetch
