/**
 * @file pattern_persistence.cpp
 * @brief Pattern Persistence Implementation
 */

#include "snapfetch/pattern_persistence.h"
#include <iostream>

using json = nlohmann::json;

namespace snapfetch {

namespace {

// Maps travel as [[key, value], ...] so key order survives any JSON tooling
template <typename Map>
json encode_entries(const Map& entries) {
    json list = json::array();
    for (const auto& [key, value] : entries) {
        list.push_back(json::array({key, value}));
    }
    return list;
}

template <typename Map>
Map decode_entries(const json& document, const char* field) {
    Map entries;
    if (!document.contains(field)) {
        return entries;
    }
    for (const auto& pair : document.at(field)) {
        entries.emplace(
            pair.at(0).get<std::string>(),
            pair.at(1).get<typename Map::mapped_type>()
        );
    }
    return entries;
}

// Route labels are for readers only; the key comes back from the stored routes
json encode_route_entries(const RouteTransitionMap& transitions) {
    json list = json::array();
    for (const auto& [key, transition] : transitions) {
        list.push_back(json::array({route_key_label(key), transition}));
    }
    return list;
}

RouteTransitionMap decode_route_entries(const json& document) {
    RouteTransitionMap transitions;
    if (!document.contains("routeTransitions")) {
        return transitions;
    }
    for (const auto& pair : document.at("routeTransitions")) {
        auto transition = pair.at(1).get<RouteTransition>();
        RouteKey key = make_route_key(transition.from_route, transition.to_route);
        transitions.emplace(std::move(key), std::move(transition));
    }
    return transitions;
}

} // anonymous namespace

const char* snapshot_status_to_string(SnapshotStatus status) {
    switch (status) {
        case SnapshotStatus::RESTORED:    return "restored";
        case SnapshotStatus::ABSENT:      return "absent";
        case SnapshotStatus::STALE:       return "stale";
        case SnapshotStatus::CORRUPT:     return "corrupt";
        case SnapshotStatus::UNAVAILABLE: return "unavailable";
        default:                          return "unknown";
    }
}

PatternPersistence::PatternPersistence(IDurableStore& store, const IClock& clock, const PrefetchConfig& config)
    : store_(store)
    , clock_(clock)
    , config_(config)
{
}

bool PatternPersistence::save(const BehaviorSnapshot& snapshot) {
    try {
        store_.set_item(STORAGE_KEY, encode(snapshot, clock_.now_ms()).dump());
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PatternPersistence] Failed to persist behavior patterns: "
                  << e.what() << std::endl;
        return false;
    }
}

SnapshotLoadResult PatternPersistence::load() {
    SnapshotLoadResult result;

    std::optional<std::string> stored;
    try {
        stored = store_.get_item(STORAGE_KEY);
    } catch (const std::exception& e) {
        std::cerr << "[PatternPersistence] Durable store unavailable: " << e.what() << std::endl;
        result.status = SnapshotStatus::UNAVAILABLE;
        return result;
    }

    if (!stored) {
        result.status = SnapshotStatus::ABSENT;
        return result;
    }

    try {
        json document = json::parse(*stored);
        result.age_ms = clock_.now_ms() - document.at("timestamp").get<Timestamp>();

        if (result.age_ms > config_.max_pattern_age.count()) {
            std::cout << "[PatternPersistence] Discarding stale behavior patterns ("
                      << result.age_ms / 1000 << " s old)" << std::endl;
            result.status = SnapshotStatus::STALE;
            return result;
        }

        result.snapshot = decode(document);
        result.status = SnapshotStatus::RESTORED;
        std::cout << "[PatternPersistence] Loaded historical behavior patterns ("
                  << result.snapshot.route_transitions.size() << " transitions, "
                  << result.snapshot.access_patterns.size() << " access patterns, "
                  << result.snapshot.interaction_stats.size() << " interaction stats)" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[PatternPersistence] Failed to load historical patterns: "
                  << e.what() << std::endl;
        result.status = SnapshotStatus::CORRUPT;
        result.snapshot = BehaviorSnapshot{};
    }

    return result;
}

bool PatternPersistence::clear() {
    try {
        store_.remove_item(STORAGE_KEY);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PatternPersistence] Failed to remove behavior patterns: "
                  << e.what() << std::endl;
        return false;
    }
}

//=============================================================================
// Encoding
//=============================================================================

json PatternPersistence::encode(const BehaviorSnapshot& snapshot, Timestamp saved_at) {
    return json{
        {"schema_version", SCHEMA_VERSION},
        {"routeTransitions", encode_route_entries(snapshot.route_transitions)},
        {"userBehaviorPatterns", encode_entries(snapshot.access_patterns)},
        {"componentUsageStats", encode_entries(snapshot.interaction_stats)},
        {"timestamp", saved_at}
    };
}

BehaviorSnapshot PatternPersistence::decode(const json& document) {
    BehaviorSnapshot snapshot;
    snapshot.route_transitions = decode_route_entries(document);
    snapshot.access_patterns = decode_entries<AccessPatternMap>(document, "userBehaviorPatterns");
    snapshot.interaction_stats = decode_entries<InteractionStatMap>(document, "componentUsageStats");
    return snapshot;
}

} // namespace snapfetch
