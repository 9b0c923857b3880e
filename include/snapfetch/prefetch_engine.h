/**
 * @file prefetch_engine.h
 * @brief Predictive Prefetch Engine - learn navigation and access patterns,
 *        warm the cache before data is needed
 *
 * The engine is the single composition object the host constructs once and
 * hands to every event source (router, data layer, UI). It owns:
 * - BehaviorTracker (learning)
 * - PatternPersistence (write-through snapshots)
 * - PredictionEngine (ranking)
 * - PrefetchScheduler + worker pool (bounded execution)
 * - CacheBridge (check cache, else fetch and store)
 *
 * Lifecycle:
 * @code
 * UNINITIALIZED --initialize()--> COLD | WARM --start()--> RUNNING
 * RUNNING --stop()--> COLD | WARM
 * any --reset()--> COLD (RUNNING if the background loop is active)
 * @endcode
 */

#pragma once

#include "behavior_tracker.h"
#include "cache_bridge.h"
#include "interfaces/interfaces.h"
#include "pattern_persistence.h"
#include "prediction_engine.h"
#include "prefetch_config.h"
#include "prefetch_scheduler.h"
#include "prefetch_types.h"
#include "prefetch_worker_pool.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace snapfetch {

/**
 * @brief Engine lifecycle state
 */
enum class EngineState {
    UNINITIALIZED,  ///< Constructed; persisted patterns not yet consulted
    COLD,           ///< No usable history; learning from scratch
    WARM,           ///< Restored from a fresh snapshot
    RUNNING         ///< Background loop active
};

const char* engine_state_to_string(EngineState state);

/**
 * @brief Prefetch Engine
 *
 * Thread Safety:
 * - All event handlers may be called concurrently with each other and with
 *   the background loop
 * - Lock order: scheduler -> tracker; the engine's own mutex is never held
 *   while calling into components
 *
 * Example usage:
 * @code
 * MemoryCacheStore cache(SystemClock::instance());
 * JsonDocumentSource source("./data");
 * CollectionDataFetcher fetcher(source);
 * FileDurableStore durable("./state");
 *
 * PrefetchEngine engine(PrefetchConfig::defaults(), cache, fetcher, durable);
 * engine.initialize();
 * engine.start();
 *
 * engine.on_route_change({"/products", "/coverage", 4200});
 * engine.on_data_access({"coverages", "c1"});
 * @endcode
 */
class PrefetchEngine {
public:
    /**
     * @brief Construct the engine
     * @param config Engine configuration (copied)
     * @param cache Cache the prefetcher warms
     * @param fetcher Backing data source
     * @param durable Durable store for behavior snapshots
     * @param clock Time source
     * @param executor Task executor for prefetch jobs; when null the engine
     *        owns a PrefetchWorkerPool of max_concurrent_prefetch threads.
     *        An injected executor must stop running tasks before the engine
     *        is destroyed.
     */
    PrefetchEngine(
        const PrefetchConfig& config,
        ICacheStore& cache,
        IDataFetcher& fetcher,
        IDurableStore& durable,
        const IClock& clock = SystemClock::instance(),
        ITaskExecutor* executor = nullptr
    );

    ~PrefetchEngine();

    // Non-copyable
    PrefetchEngine(const PrefetchEngine&) = delete;
    PrefetchEngine& operator=(const PrefetchEngine&) = delete;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Consult persisted patterns
     * @return COLD or WARM (current state if already initialized)
     */
    EngineState initialize();

    /**
     * @brief Start the background loop (initializes first if needed)
     */
    void start();

    /**
     * @brief Stop the background loop and join it
     */
    void stop();

    bool is_running() const { return running_.load(); }

    EngineState state() const { return state_.load(); }

    //=========================================================================
    // Events
    //=========================================================================

    /**
     * @brief Host reports a completed navigation
     *
     * Records the transition, persists, then predicts and schedules for the
     * destination route.
     */
    void on_route_change(const RouteChangeEvent& event);

    /**
     * @brief Host reports the route it is currently on
     *
     * Engine-side navigation tracking for hosts without router hooks: a route
     * different from the last observed one becomes a transition whose dwell
     * time is measured with the engine clock. The first observation only
     * sets the current route.
     *
     * @return true if a transition was recorded
     */
    bool observe_route(const std::string& route);

    void on_data_access(const DataAccessEvent& event);

    /**
     * @brief Host reports a UI interaction (raw JSON envelope)
     *
     * Explicit prefetch targets are released after prefetch_delay by poll().
     *
     * @return false if the payload was malformed and dropped
     */
    bool on_component_interaction(const std::string& payload);

    //=========================================================================
    // Prediction and scheduling
    //=========================================================================

    /**
     * @brief Predict for a route and schedule candidates above threshold
     * @return Number of candidates newly scheduled
     */
    size_t predict_and_prefetch(const std::string& route);

    /**
     * @brief Predictions for a route without scheduling anything
     */
    std::vector<PrefetchCandidate> predictions_for(const std::string& route) const;

    /**
     * @brief One background-loop step
     *
     * Releases due interaction targets (with an immediate tick), then drains
     * the scheduler if tick_interval has elapsed since the last drain.
     *
     * @return Number of prefetches dispatched
     */
    size_t poll();

    /**
     * @brief Drain the scheduler now
     */
    size_t process_tick();

    //=========================================================================
    // Observability
    //=========================================================================

    PrefetchStats get_stats() const;

    /**
     * @brief Forget everything learned, drop queued work, delete the snapshot
     */
    void reset();

    /**
     * @brief Interaction targets waiting for prefetch_delay
     */
    size_t deferred_count() const;

    std::optional<std::string> current_route() const;

    //=========================================================================
    // Components
    //=========================================================================

    const PrefetchConfig& config() const { return config_; }
    BehaviorTracker& tracker() { return tracker_; }
    const BehaviorTracker& tracker() const { return tracker_; }
    const PredictionEngine& predictor() const { return predictor_; }
    PrefetchScheduler& scheduler() { return scheduler_; }
    const PrefetchScheduler& scheduler() const { return scheduler_; }
    const CacheBridge& bridge() const { return bridge_; }
    PatternPersistence& persistence() { return persistence_; }

private:
    /**
     * @brief Interaction targets waiting for their delay
     */
    struct DeferredPrefetch {
        Timestamp due_at = 0;
        std::string interaction_key;
        std::vector<DataRequirement> targets;
    };

    PrefetchConfig config_;
    const IClock& clock_;

    // Owned pool when no executor is injected
    std::unique_ptr<PrefetchWorkerPool> owned_pool_;
    ITaskExecutor& executor_;

    BehaviorTracker tracker_;
    PatternPersistence persistence_;
    PredictionEngine predictor_;
    CacheBridge bridge_;
    PrefetchScheduler scheduler_;

    std::atomic<EngineState> state_{EngineState::UNINITIALIZED};
    EngineState idle_state_ = EngineState::COLD;    ///< State to return to on stop()

    // Navigation and deferred targets
    mutable std::mutex mutex_;
    std::optional<std::string> current_route_;
    Timestamp route_entered_at_ = 0;
    std::vector<DeferredPrefetch> deferred_;
    Timestamp last_tick_ = 0;

    // Serializes snapshot + save so an older snapshot never overwrites a newer one
    std::mutex persist_mutex_;

    // Background loop
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> worker_thread_;

    void persist();
    size_t release_due_prefetches(Timestamp now);
    void worker_loop();

    static ITaskExecutor& select_executor(
        ITaskExecutor* injected,
        std::unique_ptr<PrefetchWorkerPool>& owned,
        size_t pool_size
    );
};

/**
 * @brief Create an engine with the built-in collaborators' defaults
 */
inline std::unique_ptr<PrefetchEngine> create_prefetch_engine(
    const PrefetchConfig& config,
    ICacheStore& cache,
    IDataFetcher& fetcher,
    IDurableStore& durable
) {
    return std::make_unique<PrefetchEngine>(config, cache, fetcher, durable);
}

} // namespace snapfetch
