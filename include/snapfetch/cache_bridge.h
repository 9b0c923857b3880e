/**
 * @file cache_bridge.h
 * @brief "Check cache, else fetch, else store with a short TTL"
 */

#pragma once

#include "interfaces/i_cache_store.h"
#include "interfaces/i_data_fetcher.h"
#include "prefetch_config.h"
#include "prefetch_types.h"
#include <atomic>
#include <cstdint>
#include <vector>

namespace snapfetch {

/**
 * @brief Result of prefetching one requirement
 */
enum class PrefetchOutcome {
    ALREADY_CACHED,     ///< Cache hit; nothing fetched
    STORED,             ///< Fetched and cached with the prefetch TTL
    EMPTY,              ///< Fetcher returned nothing (includes unknown categories)
    FAILED              ///< Fetcher or cache store threw
};

const char* prefetch_outcome_to_string(PrefetchOutcome outcome);

/**
 * @brief Counters for CacheBridge
 */
struct CacheBridgeStats {
    uint64_t cache_hits = 0;
    uint64_t stored = 0;
    uint64_t empty = 0;
    uint64_t failed = 0;
};

/**
 * @brief Cache Bridge
 *
 * Prefetched entries are provisional, so they get max_prefetch_age as TTL,
 * shorter than the store's default. A warm entry is never overwritten or
 * refreshed, whatever its own age.
 *
 * Thread Safety:
 * - Thread-safe as long as the store and fetcher are
 */
class CacheBridge {
public:
    CacheBridge(ICacheStore& cache, IDataFetcher& fetcher, const PrefetchConfig& config);

    // Non-copyable
    CacheBridge(const CacheBridge&) = delete;
    CacheBridge& operator=(const CacheBridge&) = delete;

    /**
     * @brief Warm the cache for one requirement
     *
     * Never throws; failures are logged and reported as FAILED.
     */
    PrefetchOutcome fetch_and_cache(const DataRequirement& requirement);

    /**
     * @brief Warm the cache for each requirement independently
     * @return Number of requirements newly stored
     */
    size_t prefetch_all(const std::vector<DataRequirement>& requirements);

    CacheBridgeStats get_stats() const;

private:
    ICacheStore& cache_;
    IDataFetcher& fetcher_;
    const PrefetchConfig& config_;

    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> stored_{0};
    std::atomic<uint64_t> empty_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace snapfetch
