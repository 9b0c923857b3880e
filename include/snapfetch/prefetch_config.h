/**
 * @file prefetch_config.h
 * @brief Tunables for the predictive prefetch engine
 */

#pragma once

#include "prefetch_types.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace snapfetch {

/**
 * @brief Ordered route-prefix table
 */
using RouteDataTable = std::vector<std::pair<std::string, std::vector<DataRequirement>>>;

/**
 * @brief Configuration for the prefetch engine
 */
struct PrefetchConfig {
    // Scheduling
    size_t max_concurrent_prefetch = 3;                             ///< In-flight prefetch budget
    std::chrono::milliseconds prefetch_delay{1000};                 ///< Delay before interaction targets are prefetched
    std::chrono::milliseconds tick_interval{2000};                  ///< Scheduler drain period
    std::chrono::milliseconds poll_interval{100};                   ///< Background loop granularity

    // Learning
    std::chrono::milliseconds behavior_tracking_window{1800000};    ///< 30 minutes
    double min_confidence_score = 0.6;                              ///< Minimum confidence to prefetch

    // Cache
    std::chrono::milliseconds max_prefetch_age{600000};             ///< TTL of prefetched entries (10 minutes)

    // Persistence
    bool persist_patterns = true;                                   ///< Write-through snapshots
    std::chrono::milliseconds max_pattern_age{604800000};           ///< Snapshots older than this are discarded (7 days)

    /// Replaces the built-in route table when set
    std::optional<RouteDataTable> route_data_table;

    static PrefetchConfig defaults() {
        return PrefetchConfig{};
    }

    /**
     * @brief Check ranges
     * @param error Receives the first problem found
     * @return true if the configuration is usable
     */
    bool validate(std::string& error) const;
};

/**
 * @brief Co-occurrence window for related data accesses (5 minutes)
 */
constexpr std::chrono::milliseconds RELATED_ACCESS_WINDOW{300000};

/**
 * @brief Route transition count at which confidence saturates at 1.0
 */
constexpr double ROUTE_CONFIDENCE_SATURATION = 10.0;

/**
 * @brief Apply the "prefetch" section (or top-level keys) of a config document
 * @param root Parsed config document
 * @param config Updated in place; keys that are absent keep their value
 * @param error Receives a message on failure
 * @return false if a present key has the wrong type or the result is invalid
 */
bool apply_prefetch_config(const nlohmann::json& root, PrefetchConfig& config, std::string& error);

/**
 * @brief Read a JSON config file
 * @param path File path
 * @param out Parsed document
 * @param error Receives a message on failure
 * @return false if the file is missing, unreadable or not JSON
 */
bool load_config_file(const std::string& path, nlohmann::json& out, std::string& error);

nlohmann::json prefetch_config_to_json(const PrefetchConfig& config);

} // namespace snapfetch
