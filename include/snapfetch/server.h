/**
 * @file server.h
 * @brief SnapFetch HTTP Server - event ingestion and prefetch introspection
 *
 * Lets a front end (or any host) push navigation, data-access and
 * interaction events to the engine, read data through the warmed cache,
 * and inspect what the engine has learned.
 *
 * Endpoints:
 *   GET  /health                          - Server health check
 *   GET  /api/v1/stats                    - Engine statistics
 *   GET  /api/v1/predictions?route=/x     - Ranked predictions for a route
 *   GET  /api/v1/data/{category}/{id}     - Read-through data access
 *   GET  /api/v1/cache/stats              - Cache and prefetch counters
 *   POST /api/v1/events/route             - Route change {fromRoute, toRoute, timeSpentMs}
 *   POST /api/v1/events/navigate          - Current route {route}
 *   POST /api/v1/events/data-access       - Data access {category, identifier, params}
 *   POST /api/v1/events/interaction       - UI interaction {type, identifier, prefetchTargets}
 *   POST /api/v1/reset                    - Forget all learned behavior
 */

#pragma once

#include "data_service.h"
#include "memory_cache_store.h"
#include "prefetch_engine.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// Forward declarations
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace snapfetch {

/**
 * @brief Server configuration
 */
struct ServerConfig {
    std::string host = "127.0.0.1";     ///< Bind address (local-only by default)
    int port = 6940;                    ///< Port number
    bool cors_enabled = true;           ///< Enable CORS for browser access
};

/**
 * @brief SnapFetch HTTP Server
 *
 * The server does not own the engine or the stores; the host wires them
 * once and keeps them alive for the server's lifetime.
 *
 * Usage:
 *   PrefetchServer server(config, engine, data_service, cache);
 *   server.start();   // blocking
 */
class PrefetchServer {
public:
    PrefetchServer(
        const ServerConfig& config,
        PrefetchEngine& engine,
        DataService& data_service,
        MemoryCacheStore& cache
    );

    /**
     * @brief Destructor - stops server if running
     */
    ~PrefetchServer();

    // Non-copyable
    PrefetchServer(const PrefetchServer&) = delete;
    PrefetchServer& operator=(const PrefetchServer&) = delete;

    /**
     * @brief Start the HTTP server (blocking)
     * @return true if the server ran and was stopped, false if it could not bind
     */
    bool start();

    /**
     * @brief Stop the server gracefully
     *
     * Can be called from another thread or signal handler.
     */
    void stop();

    bool is_running() const;

    const ServerConfig& get_config() const { return config_; }

private:
    ServerConfig config_;
    PrefetchEngine& engine_;
    DataService& data_service_;
    MemoryCacheStore& cache_;
    std::unique_ptr<httplib::Server> svr_;
    std::atomic<bool> running_{false};

    // Server metrics tracking
    std::chrono::steady_clock::time_point start_time_;
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> total_errors_{0};

    // Route setup
    void setup_routes();
    void setup_middleware();
    bool dispatch_post(const httplib::Request& req, httplib::Response& res);

    // === Endpoint Handlers ===

    // Health & Info
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_predictions(const httplib::Request& req, httplib::Response& res);
    void handle_cache_stats(const httplib::Request& req, httplib::Response& res);

    // Data
    void handle_data_get(const httplib::Request& req, httplib::Response& res,
                         const std::string& category, const std::string& identifier);

    // Events
    void handle_route_event(const httplib::Request& req, httplib::Response& res);
    void handle_navigate_event(const httplib::Request& req, httplib::Response& res);
    void handle_data_access_event(const httplib::Request& req, httplib::Response& res);
    void handle_interaction_event(const httplib::Request& req, httplib::Response& res);
    void handle_reset(const httplib::Request& req, httplib::Response& res);

    // === Response Utilities ===

    /**
     * @brief Send JSON response
     * @param res HTTP response object
     * @param json_str Serialized JSON body
     * @param status HTTP status code (default 200)
     */
    void send_json(httplib::Response& res, const std::string& json_str, int status = 200);

    /**
     * @brief Send error response
     * @param res HTTP response object
     * @param message Error message
     * @param error_type Error type (invalid_request_error, not_found, server_error)
     * @param status HTTP status code
     */
    void send_error(httplib::Response& res, const std::string& message,
                    const std::string& error_type = "invalid_request_error", int status = 400);
};

} // namespace snapfetch
