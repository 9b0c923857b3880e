/**
 * @file prediction_engine.h
 * @brief Turns behavior statistics into ranked prefetch candidates
 *
 * Two independent sources feed the candidate list:
 * - Route-based: likely next routes from the current route, mapped to the
 *   data those routes load through a static prefix table
 * - Correlation-based: data keys that repeatedly co-occur with frequently
 *   accessed patterns
 */

#pragma once

#include "behavior_tracker.h"
#include "interfaces/i_clock.h"
#include "prefetch_config.h"
#include "prefetch_types.h"
#include <string>
#include <vector>

namespace snapfetch {

/**
 * @brief Ordered route-prefix -> data requirements table
 *
 * The first prefix that the route starts with wins. Routes that match no
 * prefix load nothing worth prefetching.
 */
class RouteDataMap {
public:
    RouteDataMap() = default;
    explicit RouteDataMap(RouteDataTable table);

    /**
     * @brief Data requirements for a route (empty if no prefix matches)
     */
    std::vector<DataRequirement> lookup(const std::string& route) const;

    const RouteDataTable& table() const { return table_; }

    /**
     * @brief Built-in table for the product hub screens
     */
    static RouteDataMap defaults();

private:
    RouteDataTable table_;
};

/**
 * @brief Prediction Engine
 *
 * Stateless apart from its references; every call reads the tracker's
 * current state.
 *
 * Usage:
 * @code
 * PredictionEngine predictor(tracker, clock, config);
 * for (const auto& candidate : predictor.generate_predictions("/products")) {
 *     scheduler.schedule(candidate);
 * }
 * @endcode
 */
class PredictionEngine {
public:
    PredictionEngine(
        const BehaviorTracker& tracker,
        const IClock& clock,
        const PrefetchConfig& config
    );

    /**
     * @brief Generate candidates for the current route
     * @param current_route Route the user is on
     * @return Candidates at or above min_confidence_score, highest
     *         confidence first (ties keep generation order)
     */
    std::vector<PrefetchCandidate> generate_predictions(const std::string& current_route) const;

    /**
     * @brief Recompute a candidate's confidence from current statistics
     * @return Fresh confidence, or the stored one if the candidate is pinned
     *         or its source observation is gone
     */
    double rescore(const PrefetchCandidate& candidate) const;

    const RouteDataMap& route_data_map() const { return route_data_map_; }

    /**
     * @brief Split "category:identifier" at the first ':'
     */
    static DataRequirement parse_data_key(const std::string& data_key);

private:
    const BehaviorTracker& tracker_;
    const IClock& clock_;
    const PrefetchConfig& config_;
    RouteDataMap route_data_map_;

    void add_route_predictions(
        const std::string& current_route,
        std::vector<PrefetchCandidate>& out
    ) const;

    void add_correlation_predictions(
        const AccessPatternMap& patterns,
        std::vector<PrefetchCandidate>& out
    ) const;
};

} // namespace snapfetch
