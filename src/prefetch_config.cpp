/**
 * @file prefetch_config.cpp
 * @brief Prefetch configuration loading and validation
 */

#include "snapfetch/prefetch_config.h"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace snapfetch {

namespace {

constexpr const char* SECTION = "prefetch";

// Section value wins over a top-level value of the same name
const json* find_key(const json& root, const char* key) {
    if (root.contains(SECTION) && root[SECTION].is_object()) {
        const auto& section_obj = root[SECTION];
        if (section_obj.contains(key)) {
            return &section_obj[key];
        }
    }
    if (root.contains(key)) {
        return &root[key];
    }
    return nullptr;
}

bool try_get_millis(const json& root, const char* key, std::chrono::milliseconds& out, std::string& error) {
    const json* value = find_key(root, key);
    if (!value) return true;
    if (!value->is_number_integer()) {
        error = std::string(key) + " must be an integer number of milliseconds";
        return false;
    }
    out = std::chrono::milliseconds(value->get<int64_t>());
    return true;
}

bool try_get_size(const json& root, const char* key, size_t& out, std::string& error) {
    const json* value = find_key(root, key);
    if (!value) return true;
    if (!value->is_number_integer() || value->get<int64_t>() < 0) {
        error = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = value->get<size_t>();
    return true;
}

bool try_get_double(const json& root, const char* key, double& out, std::string& error) {
    const json* value = find_key(root, key);
    if (!value) return true;
    if (!value->is_number()) {
        error = std::string(key) + " must be a number";
        return false;
    }
    out = value->get<double>();
    return true;
}

bool try_get_bool(const json& root, const char* key, bool& out, std::string& error) {
    const json* value = find_key(root, key);
    if (!value) return true;
    if (!value->is_boolean()) {
        error = std::string(key) + " must be a boolean";
        return false;
    }
    out = value->get<bool>();
    return true;
}

// "route_data_map": [{"prefix": "/coverage", "data": [{"category": ..., "identifier": ...}]}]
bool try_get_route_table(const json& root, std::optional<RouteDataTable>& out, std::string& error) {
    const json* value = find_key(root, "route_data_map");
    if (!value) return true;
    if (!value->is_array()) {
        error = "route_data_map must be an array of {prefix, data} entries";
        return false;
    }

    RouteDataTable table;
    try {
        for (const auto& entry : *value) {
            table.emplace_back(
                entry.at("prefix").get<std::string>(),
                entry.at("data").get<std::vector<DataRequirement>>()
            );
        }
    } catch (const std::exception& e) {
        error = std::string("route_data_map: ") + e.what();
        return false;
    }

    out = std::move(table);
    return true;
}

} // anonymous namespace

bool PrefetchConfig::validate(std::string& error) const {
    if (max_concurrent_prefetch == 0) {
        error = "max_concurrent_prefetch must be at least 1";
        return false;
    }
    if (min_confidence_score < 0.0 || min_confidence_score > 1.0) {
        error = "min_confidence_score must be within [0, 1]";
        return false;
    }
    if (tick_interval.count() <= 0 || poll_interval.count() <= 0) {
        error = "tick_interval_ms and poll_interval_ms must be positive";
        return false;
    }
    if (prefetch_delay.count() < 0 || behavior_tracking_window.count() <= 0 ||
        max_prefetch_age.count() <= 0 || max_pattern_age.count() <= 0) {
        error = "durations must be positive";
        return false;
    }
    return true;
}

bool apply_prefetch_config(const json& root, PrefetchConfig& config, std::string& error) {
    if (!root.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }

    PrefetchConfig updated = config;
    bool ok = try_get_size(root, "max_concurrent_prefetch", updated.max_concurrent_prefetch, error)
        && try_get_millis(root, "prefetch_delay_ms", updated.prefetch_delay, error)
        && try_get_millis(root, "tick_interval_ms", updated.tick_interval, error)
        && try_get_millis(root, "poll_interval_ms", updated.poll_interval, error)
        && try_get_millis(root, "behavior_tracking_window_ms", updated.behavior_tracking_window, error)
        && try_get_double(root, "min_confidence_score", updated.min_confidence_score, error)
        && try_get_millis(root, "max_prefetch_age_ms", updated.max_prefetch_age, error)
        && try_get_bool(root, "persist_patterns", updated.persist_patterns, error)
        && try_get_millis(root, "max_pattern_age_ms", updated.max_pattern_age, error)
        && try_get_route_table(root, updated.route_data_table, error);

    if (!ok || !updated.validate(error)) {
        return false;
    }

    config = std::move(updated);
    return true;
}

bool load_config_file(const std::string& path, json& out, std::string& error) {
    if (path.empty()) {
        error = "Config path is empty";
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = "Config file not found: " + path;
        return false;
    }
    std::ifstream in(path);
    if (!in) {
        error = "Failed to open config file: " + path;
        return false;
    }
    try {
        in >> out;
        return true;
    } catch (const std::exception& e) {
        error = std::string("Failed to parse config file: ") + e.what();
        return false;
    }
}

json prefetch_config_to_json(const PrefetchConfig& config) {
    json j = {
        {"max_concurrent_prefetch", config.max_concurrent_prefetch},
        {"prefetch_delay_ms", config.prefetch_delay.count()},
        {"tick_interval_ms", config.tick_interval.count()},
        {"poll_interval_ms", config.poll_interval.count()},
        {"behavior_tracking_window_ms", config.behavior_tracking_window.count()},
        {"min_confidence_score", config.min_confidence_score},
        {"max_prefetch_age_ms", config.max_prefetch_age.count()},
        {"persist_patterns", config.persist_patterns},
        {"max_pattern_age_ms", config.max_pattern_age.count()}
    };

    if (config.route_data_table) {
        json table = json::array();
        for (const auto& [prefix, data] : *config.route_data_table) {
            table.push_back({{"prefix", prefix}, {"data", data}});
        }
        j["route_data_map"] = table;
    }

    return j;
}

} // namespace snapfetch
