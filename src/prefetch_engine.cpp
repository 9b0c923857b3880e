/**
 * @file prefetch_engine.cpp
 * @brief Prefetch Engine Implementation
 */

#include "snapfetch/prefetch_engine.h"
#include <iostream>

namespace snapfetch {

const char* engine_state_to_string(EngineState state) {
    switch (state) {
        case EngineState::UNINITIALIZED: return "uninitialized";
        case EngineState::COLD:          return "cold";
        case EngineState::WARM:          return "warm";
        case EngineState::RUNNING:       return "running";
        default:                         return "unknown";
    }
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

ITaskExecutor& PrefetchEngine::select_executor(
    ITaskExecutor* injected,
    std::unique_ptr<PrefetchWorkerPool>& owned,
    size_t pool_size
) {
    if (injected) {
        return *injected;
    }
    owned = std::make_unique<PrefetchWorkerPool>(pool_size);
    return *owned;
}

PrefetchEngine::PrefetchEngine(
    const PrefetchConfig& config,
    ICacheStore& cache,
    IDataFetcher& fetcher,
    IDurableStore& durable,
    const IClock& clock,
    ITaskExecutor* executor
)
    : config_(config)
    , clock_(clock)
    , executor_(select_executor(executor, owned_pool_, config.max_concurrent_prefetch))
    , tracker_(config_, clock_)
    , persistence_(durable, clock_, config_)
    , predictor_(tracker_, clock_, config_)
    , bridge_(cache, fetcher, config_)
    , scheduler_(
        config_, clock_, executor_,
        [this](const PrefetchCandidate& candidate) {
            bridge_.prefetch_all(candidate.data_requirements);
        },
        [this](const PrefetchCandidate& candidate) {
            return predictor_.rescore(candidate);
        })
{
    std::cout << "[PrefetchEngine] Created (max " << config_.max_concurrent_prefetch
              << " concurrent, min confidence " << config_.min_confidence_score
              << ", tick " << config_.tick_interval.count() << " ms)" << std::endl;
}

PrefetchEngine::~PrefetchEngine() {
    stop();
    scheduler_.clear();

    // Jobs reference the bridge and scheduler; finish them while both exist
    if (owned_pool_) {
        owned_pool_->shutdown();
    }
}

//=============================================================================
// Lifecycle
//=============================================================================

EngineState PrefetchEngine::initialize() {
    if (state_.load() != EngineState::UNINITIALIZED) {
        return state_.load();
    }

    EngineState initial = EngineState::COLD;

    if (config_.persist_patterns) {
        SnapshotLoadResult loaded = persistence_.load();
        if (loaded.status == SnapshotStatus::RESTORED) {
            tracker_.restore(std::move(loaded.snapshot));
            initial = EngineState::WARM;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_tick_ = clock_.now_ms();
        idle_state_ = initial;
    }
    state_.store(initial);

    std::cout << "[PrefetchEngine] Initialized (" << engine_state_to_string(initial) << ", "
              << tracker_.route_transition_count() << " transitions, "
              << tracker_.access_pattern_count() << " access patterns)" << std::endl;
    return initial;
}

void PrefetchEngine::start() {
    if (running_.load()) {
        return;
    }

    initialize();

    running_.store(true);
    state_.store(EngineState::RUNNING);
    worker_thread_ = std::make_unique<std::thread>(&PrefetchEngine::worker_loop, this);

    std::cout << "[PrefetchEngine] Background loop started, polling every "
              << config_.poll_interval.count() << " ms" << std::endl;
}

void PrefetchEngine::stop() {
    if (!running_.load()) {
        return;
    }

    running_.store(false);
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.store(idle_state_);
    }

    std::cout << "[PrefetchEngine] Background loop stopped" << std::endl;
}

//=============================================================================
// Events
//=============================================================================

void PrefetchEngine::on_route_change(const RouteChangeEvent& event) {
    tracker_.record_route_transition(event.from_route, event.to_route, event.time_spent_ms);
    persist();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_route_ = event.to_route;
        route_entered_at_ = clock_.now_ms();
    }

    predict_and_prefetch(event.to_route);
}

bool PrefetchEngine::observe_route(const std::string& route) {
    RouteChangeEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp now = clock_.now_ms();

        if (!current_route_) {
            current_route_ = route;
            route_entered_at_ = now;
            return false;
        }
        if (*current_route_ == route) {
            return false;
        }

        event.from_route = *current_route_;
        event.to_route = route;
        event.time_spent_ms = now - route_entered_at_;
    }

    on_route_change(event);
    return true;
}

void PrefetchEngine::on_data_access(const DataAccessEvent& event) {
    tracker_.record_data_access(event.category, event.identifier, event.params);
    persist();
}

bool PrefetchEngine::on_component_interaction(const std::string& payload) {
    std::string interaction_key;
    auto stat = tracker_.record_component_interaction(payload, &interaction_key);
    if (!stat) {
        return false;
    }
    persist();

    if (!stat->prefetch_targets.empty()) {
        DeferredPrefetch deferred;
        deferred.due_at = clock_.now_ms() + config_.prefetch_delay.count();
        deferred.interaction_key = std::move(interaction_key);
        deferred.targets = stat->prefetch_targets;

        std::lock_guard<std::mutex> lock(mutex_);
        deferred_.push_back(std::move(deferred));
    }
    return true;
}

//=============================================================================
// Prediction and scheduling
//=============================================================================

size_t PrefetchEngine::predict_and_prefetch(const std::string& route) {
    size_t scheduled = 0;
    for (const auto& candidate : predictor_.generate_predictions(route)) {
        if (candidate.confidence >= config_.min_confidence_score && scheduler_.schedule(candidate)) {
            scheduled++;
        }
    }
    return scheduled;
}

std::vector<PrefetchCandidate> PrefetchEngine::predictions_for(const std::string& route) const {
    return predictor_.generate_predictions(route);
}

size_t PrefetchEngine::poll() {
    Timestamp now = clock_.now_ms();

    bool released = release_due_prefetches(now) > 0;

    bool tick_due = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (released || now - last_tick_ >= config_.tick_interval.count()) {
            last_tick_ = now;
            tick_due = true;
        }
    }

    return tick_due ? scheduler_.process_tick() : 0;
}

size_t PrefetchEngine::process_tick() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_tick_ = clock_.now_ms();
    }
    return scheduler_.process_tick();
}

//=============================================================================
// Observability
//=============================================================================

PrefetchStats PrefetchEngine::get_stats() const {
    PrefetchStats stats;
    stats.route_transition_count = tracker_.route_transition_count();
    stats.behavior_pattern_count = tracker_.access_pattern_count();
    stats.component_stat_count = tracker_.interaction_stat_count();
    stats.prefetch_queue_size = scheduler_.pending_count();
    stats.prefetch_in_progress_count = scheduler_.in_progress_count();
    stats.total_observed_accesses = tracker_.total_observed_accesses();
    return stats;
}

void PrefetchEngine::reset() {
    scheduler_.reset();

    {
        std::lock_guard<std::mutex> persist_lock(persist_mutex_);
        tracker_.clear();
        persistence_.clear();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        deferred_.clear();
        current_route_.reset();
        route_entered_at_ = 0;
        idle_state_ = EngineState::COLD;
        state_.store(running_.load() ? EngineState::RUNNING : EngineState::COLD);
    }

    std::cout << "[PrefetchEngine] Reset: behavior patterns and prefetch queue cleared" << std::endl;
}

size_t PrefetchEngine::deferred_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& deferred : deferred_) {
        count += deferred.targets.size();
    }
    return count;
}

std::optional<std::string> PrefetchEngine::current_route() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_route_;
}

//=============================================================================
// Internal Methods
//=============================================================================

void PrefetchEngine::persist() {
    if (!config_.persist_patterns) {
        return;
    }

    std::lock_guard<std::mutex> lock(persist_mutex_);
    persistence_.save(tracker_.snapshot());
}

size_t PrefetchEngine::release_due_prefetches(Timestamp now) {
    std::vector<DeferredPrefetch> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = deferred_.begin(); it != deferred_.end();) {
            if (it->due_at <= now) {
                due.push_back(std::move(*it));
                it = deferred_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t scheduled = 0;
    for (const auto& deferred : due) {
        for (const auto& target : deferred.targets) {
            // Explicit targets skip scoring: pinned at full confidence, no source
            PrefetchCandidate candidate;
            candidate.type = CandidateType::RELATED_DATA;
            candidate.target = target.data_key();
            candidate.confidence = 1.0;
            candidate.data_requirements = {target};

            if (scheduler_.schedule(candidate)) {
                scheduled++;
            }
        }
        std::cout << "[PrefetchEngine] Released " << deferred.targets.size()
                  << " interaction targets for " << deferred.interaction_key << std::endl;
    }
    return scheduled;
}

void PrefetchEngine::worker_loop() {
    while (running_.load()) {
        std::this_thread::sleep_for(config_.poll_interval);

        if (!running_.load()) {
            break;
        }

        try {
            poll();
        } catch (const std::exception& e) {
            std::cerr << "[PrefetchEngine] Background poll failed: " << e.what() << std::endl;
        }
    }
}

} // namespace snapfetch
