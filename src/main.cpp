/**
 * @file main.cpp
 * @brief SnapFetch CLI - learn navigation, warm the cache before it is needed
 */

#include "snapfetch/collection_data_fetcher.h"
#include "snapfetch/data_service.h"
#include "snapfetch/event_replay.h"
#include "snapfetch/file_durable_store.h"
#include "snapfetch/json_document_source.h"
#include "snapfetch/memory_cache_store.h"
#include "snapfetch/memory_durable_store.h"
#include "snapfetch/prefetch_engine.h"
#include "snapfetch/server.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifndef SNAPFETCH_VERSION
#define SNAPFETCH_VERSION "0.0.0"
#endif

using json = nlohmann::json;
using namespace snapfetch;

static std::string get_default_config_path() {
    const char* env_config = std::getenv("SNAPFETCH_CONFIG_PATH");
    if (env_config && std::strlen(env_config) > 0) {
        return std::string(env_config);
    }
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) {
        return std::string(xdg) + "/snapfetch/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/snapfetch/config.json";
    }
    return "/tmp/snapfetch/config.json";
}

static std::string get_default_state_dir() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.snapfetch/state";
    }
    return "/tmp/snapfetch/state";
}

// Section lookup first, then a top-level key of the same name
static const json* find_setting(const json& root, const char* section, const char* key) {
    if (root.contains(section) && root[section].is_object() && root[section].contains(key)) {
        return &root[section][key];
    }
    if (root.contains(key)) {
        return &root[key];
    }
    return nullptr;
}

static bool try_get_string(const json& root, const char* section, const char* key, std::string& out) {
    const json* value = find_setting(root, section, key);
    if (value && value->is_string()) {
        out = value->get<std::string>();
        return true;
    }
    return false;
}

static bool try_get_int(const json& root, const char* section, const char* key, int64_t& out) {
    const json* value = find_setting(root, section, key);
    if (value && value->is_number_integer()) {
        out = value->get<int64_t>();
        return true;
    }
    return false;
}

static bool try_get_bool(const json& root, const char* section, const char* key, bool& out) {
    const json* value = find_setting(root, section, key);
    if (value && value->is_boolean()) {
        out = value->get<bool>();
        return true;
    }
    return false;
}

void print_banner() {
    std::cout << "\n";
    std::cout << "  SnapFetch v" << SNAPFETCH_VERSION << "\n";
    std::cout << "  Predictive data prefetching\n";
    std::cout << std::endl;
}

void print_usage() {
    std::cout << "Usage: snapfetch [OPTIONS]\n\n";
    std::cout << "General Options:\n";
    std::cout << "  --config PATH             JSON config file (default: ~/.config/snapfetch/config.json)\n";
    std::cout << "  --data-dir PATH           Directory of <collection>.json files (default: ./data)\n";
    std::cout << "  --state-dir PATH          Directory for learned patterns (default: ~/.snapfetch/state)\n";
    std::cout << "  --ephemeral               Keep learned patterns in memory only\n";
    std::cout << "\nCommands:\n";
    std::cout << "  --replay FILE             Replay a JSON-lines event log into the engine\n";
    std::cout << "  --predict ROUTE           Print ranked predictions for a route\n";
    std::cout << "  --stats                   Print engine statistics\n";
    std::cout << "  --reset                   Forget all learned behavior\n";
    std::cout << "\nServer Mode (HTTP event API):\n";
    std::cout << "  --server                  Start HTTP server mode\n";
    std::cout << "  --host HOST               Server host (default: 127.0.0.1)\n";
    std::cout << "  --port PORT               Server port (default: 6940)\n";
    std::cout << "  --help                    Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  # Teach the engine from a recorded session, then ask it\n";
    std::cout << "  snapfetch --replay session.jsonl --predict /coverage\n\n";
    std::cout << "  # Serve the event API on a custom port\n";
    std::cout << "  snapfetch --server --port 7000 --data-dir ./fixtures\n";
    std::cout << std::endl;
}

static void print_predictions(const PrefetchEngine& engine, const std::string& route) {
    auto predictions = engine.predictions_for(route);
    std::cout << "\n=== Predictions for " << route << " ===" << std::endl;
    if (predictions.empty()) {
        std::cout << "  (none)" << std::endl;
        return;
    }
    for (const auto& candidate : predictions) {
        std::cout << "  " << std::fixed << std::setprecision(3) << candidate.confidence
                  << "  " << std::left << std::setw(16) << candidate_type_to_string(candidate.type)
                  << std::right << candidate.target;
        if (!candidate.source.empty()) {
            std::cout << "  (from " << candidate.source << ")";
        }
        std::cout << std::endl;
    }
}

static void print_stats(const PrefetchEngine& engine) {
    json stats = engine.get_stats();
    stats["state"] = engine_state_to_string(engine.state());
    stats["deferredTargets"] = engine.deferred_count();
    std::cout << "\n=== Engine Statistics ===" << std::endl;
    std::cout << stats.dump(2) << std::endl;
}

// Give deferred targets and queued prefetches a chance to finish
static void drain(PrefetchEngine& engine) {
    const auto& config = engine.config();
    auto deadline = std::chrono::steady_clock::now() + config.prefetch_delay + std::chrono::seconds(10);

    while (std::chrono::steady_clock::now() < deadline) {
        engine.poll();
        engine.process_tick();
        if (engine.deferred_count() == 0 &&
            engine.scheduler().pending_count() == 0 &&
            engine.scheduler().in_progress_count() == 0) {
            return;
        }
        std::this_thread::sleep_for(config.poll_interval);
    }
    std::cerr << "[Replay] Warning: prefetch queue not drained before timeout" << std::endl;
}

int main(int argc, char** argv) {
    print_banner();

    if (argc == 1) {
        std::cout << "No arguments provided. Showing help:\n\n";
        print_usage();
        return 0;
    }

    std::string config_path = get_default_config_path();
    bool config_explicit = false;

    // First pass: only the config path, so CLI flags override the file
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage();
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            config_explicit = true;
        }
    }

    PrefetchConfig prefetch_config = PrefetchConfig::defaults();
    ServerConfig server_config;
    MemoryCacheConfig cache_config;
    std::string data_dir = "./data";
    std::string state_dir = get_default_state_dir();
    bool ephemeral = false;

    // Load persisted configuration defaults
    json persisted_config;
    std::string config_error;
    std::error_code exists_ec;
    bool config_present = config_explicit || std::filesystem::exists(config_path, exists_ec);
    if (config_present && load_config_file(config_path, persisted_config, config_error)) {
        if (!apply_prefetch_config(persisted_config, prefetch_config, config_error)) {
            std::cerr << "[Config] Error: " << config_error << std::endl;
            return 1;
        }

        std::string config_host;
        if (try_get_string(persisted_config, "server", "host", config_host) && !config_host.empty()) {
            server_config.host = config_host;
        }
        int64_t config_port = 0;
        if (try_get_int(persisted_config, "server", "port", config_port)) {
            if (config_port < 1 || config_port > 65535) {
                std::cerr << "[Config] Error: server.port must be between 1 and 65535" << std::endl;
                return 1;
            }
            server_config.port = static_cast<int>(config_port);
        }
        try_get_bool(persisted_config, "server", "cors_enabled", server_config.cors_enabled);

        try_get_string(persisted_config, "storage", "data_dir", data_dir);
        try_get_string(persisted_config, "storage", "state_dir", state_dir);
        try_get_bool(persisted_config, "storage", "ephemeral", ephemeral);

        int64_t config_ttl = 0;
        if (try_get_int(persisted_config, "storage", "cache_default_ttl_ms", config_ttl)) {
            if (config_ttl <= 0) {
                std::cerr << "[Config] Error: storage.cache_default_ttl_ms must be positive" << std::endl;
                return 1;
            }
            cache_config.default_ttl = std::chrono::milliseconds(config_ttl);
        }
        int64_t config_entries = 0;
        if (try_get_int(persisted_config, "storage", "cache_max_entries", config_entries)) {
            if (config_entries < 0) {
                std::cerr << "[Config] Error: storage.cache_max_entries must not be negative" << std::endl;
                return 1;
            }
            cache_config.max_entries = static_cast<size_t>(config_entries);
        }
        std::cout << "[Config] Loaded " << config_path << std::endl;
    } else if (config_present) {
        std::cerr << "[Config] Error: " << config_error << std::endl;
        return 1;
    }

    // Prefetched entries must expire before normally read ones
    if (cache_config.default_ttl <= prefetch_config.max_prefetch_age) {
        std::cerr << "[Config] Error: storage.cache_default_ttl_ms (" << cache_config.default_ttl.count()
                  << ") must exceed max_prefetch_age_ms (" << prefetch_config.max_prefetch_age.count()
                  << ")" << std::endl;
        return 1;
    }

    // Command-line overrides
    bool server_mode = false;
    bool stats_mode = false;
    bool reset_mode = false;
    std::string replay_file;
    std::string predict_route;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            ++i;
        }
        else if (arg == "--data-dir" && i + 1 < argc) {
            data_dir = argv[++i];
        }
        else if (arg == "--state-dir" && i + 1 < argc) {
            state_dir = argv[++i];
        }
        else if (arg == "--ephemeral") {
            ephemeral = true;
        }
        else if (arg == "--server") {
            server_mode = true;
        }
        else if (arg == "--host" && i + 1 < argc) {
            server_config.host = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            try {
                server_config.port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --port expects a number" << std::endl;
                return 1;
            }
            if (server_config.port < 1 || server_config.port > 65535) {
                std::cerr << "Error: --port must be between 1 and 65535" << std::endl;
                return 1;
            }
        }
        else if (arg == "--replay" && i + 1 < argc) {
            replay_file = argv[++i];
        }
        else if (arg == "--predict" && i + 1 < argc) {
            predict_route = argv[++i];
        }
        else if (arg == "--stats") {
            stats_mode = true;
        }
        else if (arg == "--reset") {
            reset_mode = true;
        }
        else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n\n";
            print_usage();
            return 1;
        }
    }

    // Wire the collaborators
    const IClock& clock = SystemClock::instance();
    MemoryCacheStore cache(clock, cache_config);
    JsonDocumentSource documents(data_dir);
    CollectionDataFetcher fetcher(documents);

    std::unique_ptr<IDurableStore> durable;
    if (ephemeral) {
        durable = std::make_unique<MemoryDurableStore>();
    } else {
        try {
            durable = std::make_unique<FileDurableStore>(state_dir);
        } catch (const std::exception& e) {
            std::cerr << "[Storage] Error: " << e.what() << std::endl;
            return 1;
        }
    }

    auto engine = create_prefetch_engine(prefetch_config, cache, fetcher, *durable);
    EngineState state = engine->initialize();
    std::cout << "[Engine] " << engine_state_to_string(state)
              << " (data: " << data_dir << ", patterns: "
              << (ephemeral ? std::string("memory") : state_dir) << ")" << std::endl;

    if (reset_mode) {
        engine->reset();
        std::cout << "[Engine] Learned behavior cleared" << std::endl;
    }

    if (!replay_file.empty()) {
        std::ifstream in(replay_file);
        if (!in) {
            std::cerr << "[Replay] Error: cannot open " << replay_file << std::endl;
            return 1;
        }
        ReplayResult result = replay_events(*engine, in);
        drain(*engine);
        std::cout << "[Replay] Dispatched " << engine->scheduler().total_dispatched()
                  << " prefetches, cache holds " << cache.size() << " entries" << std::endl;
        if (result.rejected > 0) {
            std::cerr << "[Replay] " << result.rejected << " events rejected" << std::endl;
        }
    }

    if (!predict_route.empty()) {
        print_predictions(*engine, predict_route);
    }

    if (stats_mode) {
        print_stats(*engine);
    }

    if (server_mode) {
        DataService data_service(*engine, cache, fetcher);
        PrefetchServer server(server_config, *engine, data_service, cache);

        engine->start();
        bool ok = server.start();
        engine->stop();

        if (!ok) {
            std::cerr << "[Server] Failed to start HTTP server\n";
            return 1;
        }
    }

    return 0;
}
