/**
 * @file event_replay.h
 * @brief Feed recorded host events (JSON lines) into a prefetch engine
 *
 * One event per line:
 * @code
 * {"type": "route", "fromRoute": "/products", "toRoute": "/coverage", "timeSpentMs": 4000}
 * {"type": "navigate", "route": "/forms"}
 * {"type": "data-access", "category": "coverages", "identifier": "c1", "params": {}}
 * {"type": "interaction", "payload": {"type": "card", "identifier": "p1", "prefetchTargets": [...]}}
 * {"type": "wait", "ms": 1500}
 * @endcode
 *
 * Blank lines and lines starting with '#' are skipped.
 */

#pragma once

#include "prefetch_engine.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include <vector>

namespace snapfetch {

/**
 * @brief Replay summary
 */
struct ReplayResult {
    size_t lines = 0;               ///< Non-blank, non-comment lines
    size_t applied = 0;             ///< Events handed to the engine
    size_t rejected = 0;            ///< Malformed or unknown events
    size_t dispatched = 0;          ///< Prefetches dispatched by polling
    std::vector<std::string> errors;    ///< "line N: message" per rejected event
};

/**
 * @brief Replay options
 */
struct ReplayOptions {
    bool poll_after_each_event = true;  ///< Run engine.poll() after every event

    /// Performs "wait" events; defaults to std::this_thread::sleep_for
    std::function<void(std::chrono::milliseconds)> wait;
};

/**
 * @brief Apply every event in the stream to the engine
 */
ReplayResult replay_events(PrefetchEngine& engine, std::istream& in, const ReplayOptions& options = ReplayOptions{});

} // namespace snapfetch
