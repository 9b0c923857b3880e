/**
 * @file pattern_persistence.h
 * @brief Durable snapshots of behavior statistics
 *
 * The snapshot is one JSON document under a fixed key:
 * @code
 * {
 *   "schema_version": 1,
 *   "routeTransitions":     [["/a -> /b", {...}], ...],
 *   "userBehaviorPatterns": [["products:p1", {...}], ...],
 *   "componentUsageStats":  [["interaction:card:p1", {...}], ...],
 *   "timestamp": 1700000000000
 * }
 * @endcode
 */

#pragma once

#include "interfaces/i_clock.h"
#include "interfaces/i_durable_store.h"
#include "prefetch_config.h"
#include "prefetch_types.h"
#include <cstdint>
#include <string>

namespace snapfetch {

/**
 * @brief Outcome of a load attempt
 */
enum class SnapshotStatus {
    RESTORED,       ///< Fresh snapshot decoded
    ABSENT,         ///< No snapshot stored
    STALE,          ///< Older than max_pattern_age; discarded
    CORRUPT,        ///< Stored text could not be decoded
    UNAVAILABLE     ///< Durable store threw
};

const char* snapshot_status_to_string(SnapshotStatus status);

/**
 * @brief Load result
 */
struct SnapshotLoadResult {
    SnapshotStatus status = SnapshotStatus::ABSENT;
    BehaviorSnapshot snapshot;      ///< Populated only when RESTORED
    int64_t age_ms = 0;             ///< Valid for RESTORED and STALE
};

/**
 * @brief Pattern Persistence
 *
 * Every failure is logged and absorbed: a broken durable store degrades the
 * engine to in-memory learning, nothing more.
 */
class PatternPersistence {
public:
    static constexpr const char* STORAGE_KEY = "snapfetch_behavior_patterns";
    static constexpr int SCHEMA_VERSION = 1;

    PatternPersistence(IDurableStore& store, const IClock& clock, const PrefetchConfig& config);

    /**
     * @brief Write a snapshot stamped with the current time
     * @return false if the write failed
     */
    bool save(const BehaviorSnapshot& snapshot);

    /**
     * @brief Read the stored snapshot, applying the staleness cutoff
     */
    SnapshotLoadResult load();

    /**
     * @brief Delete the stored snapshot
     * @return false if the delete failed
     */
    bool clear();

    //=========================================================================
    // Encoding
    //=========================================================================

    static nlohmann::json encode(const BehaviorSnapshot& snapshot, Timestamp saved_at);

    /**
     * @brief Decode a snapshot document
     * @throws std::exception on malformed input
     */
    static BehaviorSnapshot decode(const nlohmann::json& document);

private:
    IDurableStore& store_;
    const IClock& clock_;
    const PrefetchConfig& config_;
};

} // namespace snapfetch
