/**
 * @file event_replay.cpp
 * @brief JSON-lines event replay
 */

#include "snapfetch/event_replay.h"
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace snapfetch {

namespace {

// Throws on malformed events; the caller counts and reports them
void apply_event(PrefetchEngine& engine, const json& event, const ReplayOptions& options) {
    const std::string type = event.at("type").get<std::string>();

    if (type == "route") {
        engine.on_route_change(event.get<RouteChangeEvent>());
    } else if (type == "navigate") {
        engine.observe_route(event.at("route").get<std::string>());
    } else if (type == "data-access") {
        engine.on_data_access(event.get<DataAccessEvent>());
    } else if (type == "interaction") {
        const json& payload = event.at("payload");
        std::string text = payload.is_string() ? payload.get<std::string>() : payload.dump();
        if (!engine.on_component_interaction(text)) {
            throw std::invalid_argument("malformed interaction payload");
        }
    } else if (type == "wait") {
        std::chrono::milliseconds duration(event.at("ms").get<int64_t>());
        if (options.wait) {
            options.wait(duration);
        } else {
            std::this_thread::sleep_for(duration);
        }
    } else {
        throw std::invalid_argument("unknown event type '" + type + "'");
    }
}

} // anonymous namespace

ReplayResult replay_events(PrefetchEngine& engine, std::istream& in, const ReplayOptions& options) {
    ReplayResult result;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        line_number++;

        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        result.lines++;

        try {
            apply_event(engine, json::parse(line), options);
            result.applied++;
        } catch (const std::exception& e) {
            result.rejected++;
            result.errors.push_back("line " + std::to_string(line_number) + ": " + e.what());
            continue;
        }

        if (options.poll_after_each_event) {
            result.dispatched += engine.poll();
        }
    }

    std::cout << "[Replay] Applied " << result.applied << " of " << result.lines
              << " events (" << result.rejected << " rejected)" << std::endl;
    for (const auto& error : result.errors) {
        std::cerr << "[Replay] " << error << std::endl;
    }
    return result;
}

} // namespace snapfetch
