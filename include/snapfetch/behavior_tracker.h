/**
 * @file behavior_tracker.h
 * @brief Windowed statistics of navigation, data access and UI interactions
 *
 * The tracker is the learning half of the prefetch engine. It records three
 * kinds of observations:
 * - Route transitions ("/products -> /coverage"), with a count-based confidence
 * - Data accesses ("coverages:c1"), with timestamps pruned to the tracking
 *   window, parameter variants and co-occurring accesses
 * - UI interaction triggers carrying explicit prefetch targets
 *
 * Co-occurrence is recorded asymmetrically: when key B is accessed shortly
 * after key A, the count lands on A's related_accesses[B], never on B.
 */

#pragma once

#include "interfaces/i_clock.h"
#include "prefetch_config.h"
#include "prefetch_types.h"
#include <mutex>
#include <optional>
#include <string>

namespace snapfetch {

/**
 * @brief Behavior statistics store
 *
 * Thread Safety:
 * - All public methods are thread-safe (single internal mutex)
 */
class BehaviorTracker {
public:
    BehaviorTracker(const PrefetchConfig& config, const IClock& clock);

    // Non-copyable
    BehaviorTracker(const BehaviorTracker&) = delete;
    BehaviorTracker& operator=(const BehaviorTracker&) = delete;

    //=========================================================================
    // Recording
    //=========================================================================

    /**
     * @brief Record a navigation from one route to another
     * @param from_route Route the user left
     * @param to_route Route the user entered
     * @param duration_ms Time spent on from_route
     * @return Updated transition
     */
    RouteTransition record_route_transition(
        const std::string& from_route,
        const std::string& to_route,
        int64_t duration_ms
    );

    /**
     * @brief Record a data read
     * @param category Data category
     * @param identifier Document id or "all"
     * @param params Query parameters
     */
    void record_data_access(
        const std::string& category,
        const std::string& identifier,
        const nlohmann::json& params = nlohmann::json::object()
    );

    /**
     * @brief Record a UI interaction from its JSON envelope
     *
     * Envelope: {"type": ..., "identifier": ..., "prefetchTargets": [...]}.
     * Malformed payloads are logged and dropped.
     *
     * @param payload Raw JSON text
     * @param interaction_key Receives "interaction:type:identifier" on success
     * @return Updated stat, or std::nullopt if the payload was dropped
     */
    std::optional<ComponentInteractionStat> record_component_interaction(
        const std::string& payload,
        std::string* interaction_key = nullptr
    );

    //=========================================================================
    // Queries
    //=========================================================================

    std::optional<RouteTransition> get_route_transition(
        const std::string& from_route,
        const std::string& to_route
    ) const;

    std::optional<AccessPattern> get_access_pattern(const std::string& access_key) const;

    std::optional<ComponentInteractionStat> get_interaction_stat(const std::string& interaction_key) const;

    /**
     * @brief All transitions leaving a route
     */
    std::vector<RouteTransition> transitions_from(const std::string& from_route) const;

    size_t route_transition_count() const;
    size_t access_pattern_count() const;
    size_t interaction_stat_count() const;

    /**
     * @brief Sum of access_count over all patterns
     */
    uint64_t total_observed_accesses() const;

    //=========================================================================
    // Whole-state operations
    //=========================================================================

    BehaviorSnapshot snapshot() const;

    /**
     * @brief Replace all statistics
     */
    void restore(BehaviorSnapshot snapshot);

    void clear();

private:
    const PrefetchConfig& config_;
    const IClock& clock_;

    mutable std::mutex mutex_;
    RouteTransitionMap route_transitions_;
    AccessPatternMap access_patterns_;
    InteractionStatMap interaction_stats_;

    // Caller holds mutex_
    void prune_access_times(AccessPattern& pattern, Timestamp now) const;
    void track_related_accesses(const std::string& current_key, Timestamp now);
};

} // namespace snapfetch
