/**
 * @file server.cpp
 * @brief SnapFetch HTTP Server Implementation
 *
 * Uses cpp-httplib for HTTP and nlohmann/json for JSON parsing.
 */

// httplib configuration - MUST come before including httplib.h
#define CPPHTTPLIB_LISTEN_BACKLOG 128
#define CPPHTTPLIB_TCP_NODELAY true
#define CPPHTTPLIB_THREAD_POOL_COUNT 4

#include "snapfetch/server.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

#ifndef SNAPFETCH_VERSION
#define SNAPFETCH_VERSION "0.0.0"
#endif

using json = nlohmann::json;

namespace snapfetch {

namespace {

const char* MIMETYPE_JSON = "application/json";

} // anonymous namespace

PrefetchServer::PrefetchServer(
    const ServerConfig& config,
    PrefetchEngine& engine,
    DataService& data_service,
    MemoryCacheStore& cache
)
    : config_(config)
    , engine_(engine)
    , data_service_(data_service)
    , cache_(cache)
    , svr_(std::make_unique<httplib::Server>())
    , start_time_(std::chrono::steady_clock::now())
{
    setup_middleware();
    setup_routes();
}

PrefetchServer::~PrefetchServer() {
    stop();
}

// ============================================================================
// Server Lifecycle
// ============================================================================

bool PrefetchServer::start() {
    std::cout << "\n";
    std::cout << "================================================================\n";
    std::cout << "  SnapFetch Prefetch Server v" << SNAPFETCH_VERSION << "\n";
    std::cout << "================================================================\n";
    std::cout << "  Listening on: http://" << config_.host << ":" << config_.port << "\n";
    std::cout << "  Engine:       " << engine_state_to_string(engine_.state()) << "\n";
    std::cout << "  CORS:         " << (config_.cors_enabled ? "enabled" : "disabled") << "\n";
    std::cout << "================================================================\n";
    std::cout << "\n";
    std::cout << "  API Endpoints:\n";
    std::cout << "    GET  /health                        - Health check\n";
    std::cout << "    GET  /api/v1/stats                  - Engine statistics\n";
    std::cout << "    GET  /api/v1/predictions?route=     - Predictions for a route\n";
    std::cout << "    GET  /api/v1/data/{category}/{id}   - Read-through data access\n";
    std::cout << "    GET  /api/v1/cache/stats            - Cache statistics\n";
    std::cout << "    POST /api/v1/events/route           - Route change event\n";
    std::cout << "    POST /api/v1/events/navigate        - Current route\n";
    std::cout << "    POST /api/v1/events/data-access     - Data access event\n";
    std::cout << "    POST /api/v1/events/interaction     - UI interaction event\n";
    std::cout << "    POST /api/v1/reset                  - Reset learned behavior\n";
    std::cout << "\n";
    std::cout << "  Press Ctrl+C to stop the server.\n";
    std::cout << "================================================================\n\n";

    running_ = true;
    bool result = svr_->listen(config_.host.c_str(), config_.port);
    running_ = false;

    if (!result) {
        std::cerr << "[SnapFetch Server] Failed to start server on "
                  << config_.host << ":" << config_.port << std::endl;
    }

    return result;
}

void PrefetchServer::stop() {
    if (running_) {
        std::cout << "\n[SnapFetch Server] Shutting down...\n";
        svr_->stop();
        running_ = false;
    }
}

bool PrefetchServer::is_running() const {
    return running_;
}

// ============================================================================
// Middleware Setup
// ============================================================================

void PrefetchServer::setup_middleware() {
    // Pre-routing handler for CORS and OPTIONS preflight
    svr_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        total_requests_++;

        if (config_.cors_enabled) {
            std::string origin = req.get_header_value("Origin");
            res.set_header("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
        }

        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.set_header("Access-Control-Max-Age", "86400");
            res.set_content("", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        }

        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        // Handlers that already wrote an error envelope keep it
        if (res.status >= 400 && !res.body.empty()) {
            return;
        }
        send_error(res, "Not found: " + req.path, "not_found", 404);
    });

    svr_->set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            std::cerr << "[SnapFetch Server] " << req.method << " " << req.path
                      << " failed: " << e.what() << std::endl;
            send_error(res, std::string("Server error: ") + e.what(), "server_error", 500);
        } catch (...) {
            send_error(res, "Unknown server error", "server_error", 500);
        }
    });
}

// ============================================================================
// Route Setup
// ============================================================================

bool PrefetchServer::dispatch_post(const httplib::Request& req, httplib::Response& res) {
    const std::string& path = req.path;

    if (path == "/api/v1/events/route") {
        handle_route_event(req, res);
        return true;
    }
    if (path == "/api/v1/events/navigate") {
        handle_navigate_event(req, res);
        return true;
    }
    if (path == "/api/v1/events/data-access") {
        handle_data_access_event(req, res);
        return true;
    }
    if (path == "/api/v1/events/interaction") {
        handle_interaction_event(req, res);
        return true;
    }
    if (path == "/api/v1/reset") {
        handle_reset(req, res);
        return true;
    }

    return false;
}

void PrefetchServer::setup_routes() {
    svr_->Post(R"(/(.*))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!dispatch_post(req, res)) {
            send_error(res, "Not found: " + req.path, "not_found", 404);
        }
    });

    svr_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    svr_->Get("/api/v1/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });

    svr_->Get("/api/v1/predictions", [this](const httplib::Request& req, httplib::Response& res) {
        handle_predictions(req, res);
    });

    svr_->Get("/api/v1/cache/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_cache_stats(req, res);
    });

    // Identifiers may contain ':' but not '/'
    svr_->Get(R"(/api/v1/data/([^/]+)/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_data_get(req, res, req.matches[1].str(), req.matches[2].str());
    });

    std::cout << "[Server] Registered routes" << std::endl;
}

// ============================================================================
// Health & Info
// ============================================================================

void PrefetchServer::handle_health(const httplib::Request& req, httplib::Response& res) {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_).count();

    json response = {
        {"status", "ok"},
        {"version", SNAPFETCH_VERSION},
        {"engine_state", engine_state_to_string(engine_.state())},
        {"uptime_seconds", uptime},
        {"total_requests", total_requests_.load()},
        {"total_errors", total_errors_.load()}
    };
    send_json(res, response.dump());
}

void PrefetchServer::handle_stats(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json stats = engine_.get_stats();
    stats["state"] = engine_state_to_string(engine_.state());
    stats["deferredTargets"] = engine_.deferred_count();
    send_json(res, stats.dump());
}

void PrefetchServer::handle_predictions(const httplib::Request& req, httplib::Response& res) {
    if (!req.has_param("route")) {
        send_error(res, "Missing 'route' query parameter");
        return;
    }

    std::string route = req.get_param_value("route");
    auto predictions = engine_.predictions_for(route);

    json response = {
        {"route", route},
        {"min_confidence", engine_.config().min_confidence_score},
        {"predictions", predictions}
    };
    send_json(res, response.dump());
}

void PrefetchServer::handle_cache_stats(const httplib::Request& req, httplib::Response& res) {
    CacheStoreStats cache = cache_.get_stats();
    CacheBridgeStats bridge = engine_.bridge().get_stats();
    DataServiceStats reads = data_service_.get_stats();

    json response = {
        {"cache", {
            {"entries", cache.total_entries},
            {"hits", cache.hits},
            {"misses", cache.misses},
            {"writes", cache.writes},
            {"evictions", cache.evictions},
            {"expirations", cache.expirations},
            {"hit_rate", cache.hit_rate()}
        }},
        {"prefetch", {
            {"already_cached", bridge.cache_hits},
            {"stored", bridge.stored},
            {"empty", bridge.empty},
            {"failed", bridge.failed},
            {"dispatched", engine_.scheduler().total_dispatched()},
            {"completed", engine_.scheduler().total_completed()}
        }},
        {"reads", {
            {"requests", reads.requests},
            {"cache_hits", reads.cache_hits},
            {"fetches", reads.fetches},
            {"not_found", reads.not_found},
            {"hit_rate", reads.hit_rate()}
        }}
    };
    send_json(res, response.dump());
}

// ============================================================================
// Data
// ============================================================================

void PrefetchServer::handle_data_get(const httplib::Request& req, httplib::Response& res,
                                     const std::string& category, const std::string& identifier) {
    nlohmann::json params = nlohmann::json::object();
    if (req.has_param("params")) {
        try {
            params = nlohmann::json::parse(req.get_param_value("params"));
        } catch (const nlohmann::json::parse_error& e) {
            send_error(res, std::string("Invalid 'params' JSON: ") + e.what());
            return;
        }
        if (!params.is_object()) {
            send_error(res, "'params' must be a JSON object");
            return;
        }
    }

    auto data = data_service_.get(category, identifier, params);
    if (!data) {
        send_error(res, "No data for " + category + ":" + identifier, "not_found", 404);
        return;
    }

    json response = {
        {"category", category},
        {"identifier", identifier},
        {"data", *data}
    };
    send_json(res, response.dump());
}

// ============================================================================
// Events
// ============================================================================

void PrefetchServer::handle_route_event(const httplib::Request& req, httplib::Response& res) {
    RouteChangeEvent event;
    try {
        event = nlohmann::json::parse(req.body).get<RouteChangeEvent>();
    } catch (const nlohmann::json::exception& e) {
        send_error(res, std::string("Invalid route event: ") + e.what());
        return;
    }

    engine_.on_route_change(event);

    json response = {
        {"recorded", true},
        {"queued", engine_.scheduler().pending_count()}
    };
    send_json(res, response.dump());
}

void PrefetchServer::handle_navigate_event(const httplib::Request& req, httplib::Response& res) {
    std::string route;
    try {
        route = nlohmann::json::parse(req.body).at("route").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        send_error(res, std::string("Invalid navigate event: ") + e.what());
        return;
    }

    bool transition = engine_.observe_route(route);

    json response = {
        {"route", route},
        {"transition_recorded", transition}
    };
    send_json(res, response.dump());
}

void PrefetchServer::handle_data_access_event(const httplib::Request& req, httplib::Response& res) {
    DataAccessEvent event;
    try {
        event = nlohmann::json::parse(req.body).get<DataAccessEvent>();
    } catch (const std::exception& e) {
        send_error(res, std::string("Invalid data-access event: ") + e.what());
        return;
    }

    engine_.on_data_access(event);

    json response = {
        {"recorded", true},
        {"key", make_access_key(event.category, event.identifier)}
    };
    send_json(res, response.dump());
}

void PrefetchServer::handle_interaction_event(const httplib::Request& req, httplib::Response& res) {
    // The tracker parses the envelope itself and drops malformed ones
    if (!engine_.on_component_interaction(req.body)) {
        send_error(res, "Malformed interaction payload");
        return;
    }

    json response = {
        {"recorded", true},
        {"deferred_targets", engine_.deferred_count()}
    };
    send_json(res, response.dump());
}

void PrefetchServer::handle_reset(const httplib::Request& req, httplib::Response& res) {
    engine_.reset();

    json response = {
        {"reset", true},
        {"state", engine_state_to_string(engine_.state())}
    };
    send_json(res, response.dump());
}

// ============================================================================
// Response Utilities
// ============================================================================

void PrefetchServer::send_json(httplib::Response& res, const std::string& json_str, int status) {
    res.status = status;
    res.set_content(json_str, MIMETYPE_JSON);
}

void PrefetchServer::send_error(httplib::Response& res, const std::string& message,
                                const std::string& error_type, int status) {
    total_errors_++;
    json error = {
        {"error", {
            {"message", message},
            {"type", error_type},
            {"code", status}
        }}
    };
    res.status = status;
    res.set_content(error.dump(), MIMETYPE_JSON);
}

} // namespace snapfetch
