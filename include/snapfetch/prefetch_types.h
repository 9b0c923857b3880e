/**
 * @file prefetch_types.h
 * @brief Core data model of the predictive prefetch engine
 *
 * Behavior statistics (route transitions, access patterns, interaction
 * stats), prefetch candidates and queue items, plus their JSON mappings.
 */

#pragma once

#include "interfaces/i_clock.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace snapfetch {

/**
 * @brief One piece of data a prefetch should warm
 */
struct DataRequirement {
    std::string category;                                   ///< products, coverages, forms, ...
    std::string identifier;                                 ///< Document id or "all"
    nlohmann::json params = nlohmann::json::object();      ///< Query parameters

    /**
     * @brief "category:identifier" key, as used by access patterns
     */
    std::string data_key() const { return category + ":" + identifier; }

    bool operator==(const DataRequirement& other) const {
        return category == other.category && identifier == other.identifier &&
               params == other.params;
    }
};

/**
 * @brief Where a prefetch candidate came from
 */
enum class CandidateType {
    ROUTE,          ///< Predicted next route
    RELATED_DATA    ///< Correlated data access or explicit interaction target
};

const char* candidate_type_to_string(CandidateType type);

/**
 * @brief A predicted future data need
 */
struct PrefetchCandidate {
    CandidateType type = CandidateType::ROUTE;
    std::string target;                             ///< Route or "category:identifier"
    double confidence = 0.0;                        ///< [0, 1]
    std::vector<DataRequirement> data_requirements;

    /**
     * Observation the confidence was derived from: the originating route
     * for ROUTE candidates, the originating pattern key for RELATED_DATA.
     * Empty for pinned candidates (interaction targets).
     */
    std::string source;

    /**
     * @brief Scheduler key "${type}:${target}"
     */
    std::string key() const;
};

/**
 * @brief Queued prefetch
 */
struct PrefetchQueueItem {
    std::string key;
    PrefetchCandidate candidate;
    Timestamp scheduled_at = 0;
};

/**
 * @brief Observed navigation from one route to another
 */
struct RouteTransition {
    std::string from_route;
    std::string to_route;
    uint64_t count = 0;
    int64_t total_time_ms = 0;
    Timestamp last_access = 0;
    double confidence = 0.0;        ///< min(count / 10, 1)
};

/**
 * @brief Aggregated access statistics for one "category:identifier"
 */
struct AccessPattern {
    uint64_t access_count = 0;
    Timestamp last_access = 0;
    std::vector<Timestamp> access_times;                ///< Within the tracking window only
    std::map<std::string, uint64_t> related_accesses;   ///< Pattern key -> co-occurrence count
    std::map<std::string, uint64_t> param_variants;     ///< Serialized params -> count
};

/**
 * @brief Aggregated statistics for one UI interaction trigger
 */
struct ComponentInteractionStat {
    uint64_t count = 0;
    Timestamp last_access = 0;
    std::vector<DataRequirement> prefetch_targets;  ///< Fixed at first observation
};

/**
 * @brief (from_route, to_route); routes may contain any text, including " -> "
 */
using RouteKey = std::pair<std::string, std::string>;

using RouteTransitionMap = std::map<RouteKey, RouteTransition>;
using AccessPatternMap = std::map<std::string, AccessPattern>;
using InteractionStatMap = std::map<std::string, ComponentInteractionStat>;

/**
 * @brief Value copy of all behavior statistics
 */
struct BehaviorSnapshot {
    RouteTransitionMap route_transitions;
    AccessPatternMap access_patterns;
    InteractionStatMap interaction_stats;

    bool empty() const {
        return route_transitions.empty() && access_patterns.empty() && interaction_stats.empty();
    }
};

/**
 * @brief Engine counters reported by get_stats()
 */
struct PrefetchStats {
    size_t route_transition_count = 0;
    size_t behavior_pattern_count = 0;
    size_t component_stat_count = 0;
    size_t prefetch_queue_size = 0;
    size_t prefetch_in_progress_count = 0;
    uint64_t total_observed_accesses = 0;
};

//=============================================================================
// Inbound events
//=============================================================================

struct RouteChangeEvent {
    std::string from_route;
    std::string to_route;
    int64_t time_spent_ms = 0;
};

struct DataAccessEvent {
    std::string category;
    std::string identifier;
    nlohmann::json params = nlohmann::json::object();
};

//=============================================================================
// Keys
//=============================================================================

RouteKey make_route_key(const std::string& from_route, const std::string& to_route);

/**
 * @brief Display form "from -> to" (not unique; never used for lookup)
 */
std::string route_key_label(const RouteKey& key);

std::string make_access_key(const std::string& category, const std::string& identifier);

std::string make_interaction_key(const std::string& type, const std::string& identifier);

//=============================================================================
// JSON mapping (field names follow the persisted snapshot format)
//=============================================================================

void to_json(nlohmann::json& j, const DataRequirement& requirement);
void from_json(const nlohmann::json& j, DataRequirement& requirement);

void to_json(nlohmann::json& j, const PrefetchCandidate& candidate);

void to_json(nlohmann::json& j, const RouteTransition& transition);
void from_json(const nlohmann::json& j, RouteTransition& transition);

void to_json(nlohmann::json& j, const AccessPattern& pattern);
void from_json(const nlohmann::json& j, AccessPattern& pattern);

void to_json(nlohmann::json& j, const ComponentInteractionStat& stat);
void from_json(const nlohmann::json& j, ComponentInteractionStat& stat);

void to_json(nlohmann::json& j, const PrefetchStats& stats);

void from_json(const nlohmann::json& j, RouteChangeEvent& event);
void from_json(const nlohmann::json& j, DataAccessEvent& event);

} // namespace snapfetch
