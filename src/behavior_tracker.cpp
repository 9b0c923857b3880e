/**
 * @file behavior_tracker.cpp
 * @brief Behavior statistics store implementation
 */

#include "snapfetch/behavior_tracker.h"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace snapfetch {

BehaviorTracker::BehaviorTracker(const PrefetchConfig& config, const IClock& clock)
    : config_(config)
    , clock_(clock)
{
}

//=============================================================================
// Recording
//=============================================================================

RouteTransition BehaviorTracker::record_route_transition(
    const std::string& from_route,
    const std::string& to_route,
    int64_t duration_ms
) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Timestamp now = clock_.now_ms();
    auto& transition = route_transitions_[make_route_key(from_route, to_route)];
    if (transition.count == 0) {
        transition.from_route = from_route;
        transition.to_route = to_route;
    }

    transition.count++;
    transition.total_time_ms += duration_ms;
    transition.last_access = now;
    transition.confidence = std::min(
        static_cast<double>(transition.count) / ROUTE_CONFIDENCE_SATURATION, 1.0);

    return transition;
}

void BehaviorTracker::record_data_access(
    const std::string& category,
    const std::string& identifier,
    const json& params
) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Timestamp now = clock_.now_ms();
    const std::string access_key = make_access_key(category, identifier);

    auto& pattern = access_patterns_[access_key];
    pattern.access_count++;
    pattern.last_access = now;
    pattern.access_times.push_back(now);
    prune_access_times(pattern, now);

    // nlohmann objects serialize with sorted keys, so equal params share a variant
    pattern.param_variants[params.dump()]++;

    track_related_accesses(access_key, now);
}

std::optional<ComponentInteractionStat> BehaviorTracker::record_component_interaction(
    const std::string& payload,
    std::string* interaction_key
) {
    std::string type;
    std::string identifier;
    std::vector<DataRequirement> targets;

    try {
        json data = json::parse(payload);

        type = data.at("type").get<std::string>();
        const auto& id = data.at("identifier");
        if (id.is_string()) {
            identifier = id.get<std::string>();
        } else if (id.is_number()) {
            identifier = id.dump();
        } else {
            throw std::invalid_argument("identifier must be a string or number");
        }

        if (data.contains("prefetchTargets") && !data["prefetchTargets"].is_null()) {
            targets = data["prefetchTargets"].get<std::vector<DataRequirement>>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[BehaviorTracker] Dropping malformed interaction payload: "
                  << e.what() << std::endl;
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const Timestamp now = clock_.now_ms();
    std::string key = make_interaction_key(type, identifier);
    auto [it, inserted] = interaction_stats_.try_emplace(key);
    auto& stat = it->second;
    if (inserted) {
        stat.prefetch_targets = std::move(targets);
    }

    stat.count++;
    stat.last_access = now;

    if (interaction_key) {
        *interaction_key = std::move(key);
    }
    return stat;
}

//=============================================================================
// Queries
//=============================================================================

std::optional<RouteTransition> BehaviorTracker::get_route_transition(
    const std::string& from_route,
    const std::string& to_route
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = route_transitions_.find(make_route_key(from_route, to_route));
    if (it == route_transitions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AccessPattern> BehaviorTracker::get_access_pattern(const std::string& access_key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = access_patterns_.find(access_key);
    if (it == access_patterns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ComponentInteractionStat> BehaviorTracker::get_interaction_stat(
    const std::string& interaction_key
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = interaction_stats_.find(interaction_key);
    if (it == interaction_stats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RouteTransition> BehaviorTracker::transitions_from(const std::string& from_route) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Keys sort by from_route first, so the transitions form one run
    std::vector<RouteTransition> result;
    for (auto it = route_transitions_.lower_bound(make_route_key(from_route, std::string()));
         it != route_transitions_.end() && it->first.first == from_route; ++it) {
        result.push_back(it->second);
    }
    return result;
}

size_t BehaviorTracker::route_transition_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return route_transitions_.size();
}

size_t BehaviorTracker::access_pattern_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return access_patterns_.size();
}

size_t BehaviorTracker::interaction_stat_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interaction_stats_.size();
}

uint64_t BehaviorTracker::total_observed_accesses() const {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t total = 0;
    for (const auto& [key, pattern] : access_patterns_) {
        total += pattern.access_count;
    }
    return total;
}

//=============================================================================
// Whole-state operations
//=============================================================================

BehaviorSnapshot BehaviorTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    BehaviorSnapshot snapshot;
    snapshot.route_transitions = route_transitions_;
    snapshot.access_patterns = access_patterns_;
    snapshot.interaction_stats = interaction_stats_;
    return snapshot;
}

void BehaviorTracker::restore(BehaviorSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    route_transitions_ = std::move(snapshot.route_transitions);
    access_patterns_ = std::move(snapshot.access_patterns);
    interaction_stats_ = std::move(snapshot.interaction_stats);
}

void BehaviorTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    route_transitions_.clear();
    access_patterns_.clear();
    interaction_stats_.clear();
}

//=============================================================================
// Internal Methods
//=============================================================================

void BehaviorTracker::prune_access_times(AccessPattern& pattern, Timestamp now) const {
    const int64_t window = config_.behavior_tracking_window.count();
    auto& times = pattern.access_times;
    times.erase(
        std::remove_if(times.begin(), times.end(),
            [now, window](Timestamp t) { return now - t >= window; }),
        times.end());
}

void BehaviorTracker::track_related_accesses(const std::string& current_key, Timestamp now) {
    const int64_t window = RELATED_ACCESS_WINDOW.count();

    for (auto& [key, pattern] : access_patterns_) {
        if (key == current_key) {
            continue;
        }
        if (std::llabs(pattern.last_access - now) < window) {
            pattern.related_accesses[current_key]++;
        }
    }
}

} // namespace snapfetch
