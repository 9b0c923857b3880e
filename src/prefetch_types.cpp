/**
 * @file prefetch_types.cpp
 * @brief Keys and JSON mapping for the prefetch data model
 */

#include "snapfetch/prefetch_types.h"
#include <stdexcept>

using json = nlohmann::json;

namespace snapfetch {

namespace {

// Identifiers are commonly numeric in hand-written payloads
std::string identifier_from_json(const json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    if (id.is_number()) {
        return id.dump();
    }
    throw std::invalid_argument("identifier must be a string or number");
}

} // anonymous namespace

const char* candidate_type_to_string(CandidateType type) {
    switch (type) {
        case CandidateType::ROUTE:        return "route";
        case CandidateType::RELATED_DATA: return "related_data";
        default:                          return "unknown";
    }
}

std::string PrefetchCandidate::key() const {
    return std::string(candidate_type_to_string(type)) + ":" + target;
}

RouteKey make_route_key(const std::string& from_route, const std::string& to_route) {
    return RouteKey(from_route, to_route);
}

std::string route_key_label(const RouteKey& key) {
    return key.first + " -> " + key.second;
}

std::string make_access_key(const std::string& category, const std::string& identifier) {
    return category + ":" + identifier;
}

std::string make_interaction_key(const std::string& type, const std::string& identifier) {
    return "interaction:" + type + ":" + identifier;
}

//=============================================================================
// DataRequirement
//=============================================================================

void to_json(json& j, const DataRequirement& requirement) {
    j = json{
        {"category", requirement.category},
        {"identifier", requirement.identifier}
    };
    if (!requirement.params.empty()) {
        j["params"] = requirement.params;
    }
}

void from_json(const json& j, DataRequirement& requirement) {
    j.at("category").get_to(requirement.category);

    requirement.identifier = identifier_from_json(j.at("identifier"));

    requirement.params = j.value("params", json::object());
    if (!requirement.params.is_object()) {
        throw std::invalid_argument("params must be a JSON object");
    }
}

//=============================================================================
// PrefetchCandidate
//=============================================================================

void to_json(json& j, const PrefetchCandidate& candidate) {
    j = json{
        {"type", candidate_type_to_string(candidate.type)},
        {"target", candidate.target},
        {"confidence", candidate.confidence},
        {"dataRequirements", candidate.data_requirements}
    };
}

//=============================================================================
// Behavior statistics
//=============================================================================

void to_json(json& j, const RouteTransition& transition) {
    j = json{
        {"fromRoute", transition.from_route},
        {"toRoute", transition.to_route},
        {"count", transition.count},
        {"totalTime", transition.total_time_ms},
        {"lastAccess", transition.last_access},
        {"confidence", transition.confidence}
    };
}

void from_json(const json& j, RouteTransition& transition) {
    j.at("fromRoute").get_to(transition.from_route);
    j.at("toRoute").get_to(transition.to_route);
    j.at("count").get_to(transition.count);
    j.at("totalTime").get_to(transition.total_time_ms);
    j.at("lastAccess").get_to(transition.last_access);
    j.at("confidence").get_to(transition.confidence);
}

void to_json(json& j, const AccessPattern& pattern) {
    j = json{
        {"accessCount", pattern.access_count},
        {"lastAccess", pattern.last_access},
        {"accessTimes", pattern.access_times},
        {"relatedAccesses", pattern.related_accesses},
        {"params", pattern.param_variants}
    };
}

void from_json(const json& j, AccessPattern& pattern) {
    j.at("accessCount").get_to(pattern.access_count);
    j.at("lastAccess").get_to(pattern.last_access);
    j.at("accessTimes").get_to(pattern.access_times);
    j.at("relatedAccesses").get_to(pattern.related_accesses);
    j.at("params").get_to(pattern.param_variants);
}

void to_json(json& j, const ComponentInteractionStat& stat) {
    j = json{
        {"count", stat.count},
        {"lastAccess", stat.last_access},
        {"prefetchTargets", stat.prefetch_targets}
    };
}

void from_json(const json& j, ComponentInteractionStat& stat) {
    j.at("count").get_to(stat.count);
    j.at("lastAccess").get_to(stat.last_access);
    j.at("prefetchTargets").get_to(stat.prefetch_targets);
}

void to_json(json& j, const PrefetchStats& stats) {
    j = json{
        {"routeTransitions", stats.route_transition_count},
        {"behaviorPatterns", stats.behavior_pattern_count},
        {"componentStats", stats.component_stat_count},
        {"prefetchQueueSize", stats.prefetch_queue_size},
        {"prefetchInProgress", stats.prefetch_in_progress_count},
        {"totalObservedAccesses", stats.total_observed_accesses}
    };
}

//=============================================================================
// Inbound events
//=============================================================================

void from_json(const json& j, RouteChangeEvent& event) {
    j.at("fromRoute").get_to(event.from_route);
    j.at("toRoute").get_to(event.to_route);
    event.time_spent_ms = j.value("timeSpentMs", int64_t{0});
}

void from_json(const json& j, DataAccessEvent& event) {
    j.at("category").get_to(event.category);
    event.identifier = identifier_from_json(j.at("identifier"));
    event.params = j.value("params", json::object());
}

} // namespace snapfetch
