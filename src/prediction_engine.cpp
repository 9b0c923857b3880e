/**
 * @file prediction_engine.cpp
 * @brief Prediction Engine Implementation
 */

#include "snapfetch/prediction_engine.h"
#include <algorithm>

namespace snapfetch {

//=============================================================================
// RouteDataMap
//=============================================================================

RouteDataMap::RouteDataMap(RouteDataTable table)
    : table_(std::move(table))
{
}

std::vector<DataRequirement> RouteDataMap::lookup(const std::string& route) const {
    for (const auto& [prefix, data] : table_) {
        if (route.compare(0, prefix.size(), prefix) == 0) {
            return data;
        }
    }
    return {};
}

RouteDataMap RouteDataMap::defaults() {
    auto all = [](const char* category) {
        DataRequirement requirement;
        requirement.category = category;
        requirement.identifier = "all";
        return requirement;
    };

    return RouteDataMap(RouteDataTable{
        {"/products", {all("products")}},
        {"/coverage", {all("coverages"), all("forms")}},
        {"/pricing",  {all("pricing"), all("steps")}},
        {"/forms",    {all("forms"), all("formCoverages")}},
        {"/rules",    {all("rules")}},
        {"/tasks",    {all("tasks")}},
        {"/news",     {all("news")}}
    });
}

//=============================================================================
// PredictionEngine
//=============================================================================

PredictionEngine::PredictionEngine(
    const BehaviorTracker& tracker,
    const IClock& clock,
    const PrefetchConfig& config
)
    : tracker_(tracker)
    , clock_(clock)
    , config_(config)
    , route_data_map_(config.route_data_table ? RouteDataMap(*config.route_data_table)
                                              : RouteDataMap::defaults())
{
}

std::vector<PrefetchCandidate> PredictionEngine::generate_predictions(const std::string& current_route) const {
    std::vector<PrefetchCandidate> predictions;

    add_route_predictions(current_route, predictions);
    add_correlation_predictions(tracker_.snapshot().access_patterns, predictions);

    std::stable_sort(predictions.begin(), predictions.end(),
        [](const PrefetchCandidate& a, const PrefetchCandidate& b) {
            return a.confidence > b.confidence;
        });

    return predictions;
}

double PredictionEngine::rescore(const PrefetchCandidate& candidate) const {
    if (candidate.source.empty()) {
        return candidate.confidence;
    }

    if (candidate.type == CandidateType::ROUTE) {
        auto transition = tracker_.get_route_transition(candidate.source, candidate.target);
        return transition ? transition->confidence : candidate.confidence;
    }

    auto pattern = tracker_.get_access_pattern(candidate.source);
    if (!pattern || pattern->access_count == 0) {
        return candidate.confidence;
    }
    auto related = pattern->related_accesses.find(candidate.target);
    if (related == pattern->related_accesses.end()) {
        return candidate.confidence;
    }
    return std::min(static_cast<double>(related->second) / pattern->access_count, 1.0);
}

DataRequirement PredictionEngine::parse_data_key(const std::string& data_key) {
    DataRequirement requirement;
    size_t colon = data_key.find(':');
    if (colon == std::string::npos) {
        requirement.category = data_key;
    } else {
        requirement.category = data_key.substr(0, colon);
        requirement.identifier = data_key.substr(colon + 1);
    }
    return requirement;
}

//=============================================================================
// Internal Methods
//=============================================================================

void PredictionEngine::add_route_predictions(
    const std::string& current_route,
    std::vector<PrefetchCandidate>& out
) const {
    for (const auto& transition : tracker_.transitions_from(current_route)) {
        if (transition.confidence < config_.min_confidence_score) {
            continue;
        }

        PrefetchCandidate candidate;
        candidate.type = CandidateType::ROUTE;
        candidate.target = transition.to_route;
        candidate.confidence = transition.confidence;
        candidate.data_requirements = route_data_map_.lookup(transition.to_route);
        candidate.source = current_route;
        out.push_back(std::move(candidate));
    }
}

void PredictionEngine::add_correlation_predictions(
    const AccessPatternMap& patterns,
    std::vector<PrefetchCandidate>& out
) const {
    const Timestamp now = clock_.now_ms();
    const int64_t window = config_.behavior_tracking_window.count();

    for (const auto& [access_key, pattern] : patterns) {
        if (pattern.access_count <= 2 || now - pattern.last_access >= window) {
            continue;
        }

        for (const auto& [related_key, related_count] : pattern.related_accesses) {
            if (related_count <= 1) {
                continue;
            }

            double confidence = std::min(
                static_cast<double>(related_count) / pattern.access_count, 1.0);
            if (confidence < config_.min_confidence_score) {
                continue;
            }

            PrefetchCandidate candidate;
            candidate.type = CandidateType::RELATED_DATA;
            candidate.target = related_key;
            candidate.confidence = confidence;
            candidate.data_requirements = {parse_data_key(related_key)};
            candidate.source = access_key;
            out.push_back(std::move(candidate));
        }
    }
}

} // namespace snapfetch
