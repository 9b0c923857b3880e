/**
 * @file data_service.h
 * @brief Read-through data access that feeds the prefetch engine
 *
 * Every host read goes through DataService::get(), so each read is both
 * served from the cache the prefetcher warms and observed as a data access.
 */

#pragma once

#include "interfaces/i_cache_store.h"
#include "interfaces/i_data_fetcher.h"
#include "prefetch_engine.h"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace snapfetch {

/**
 * @brief Read-path counters
 */
struct DataServiceStats {
    uint64_t requests = 0;
    uint64_t cache_hits = 0;
    uint64_t fetches = 0;
    uint64_t not_found = 0;

    double hit_rate() const {
        return requests > 0 ? (double)cache_hits / requests : 0.0;
    }
};

/**
 * @brief Read-through data service
 *
 * Fetched values are cached with the cache's default TTL; only prefetched
 * values get the shorter prefetch TTL.
 */
class DataService {
public:
    DataService(PrefetchEngine& engine, ICacheStore& cache, IDataFetcher& fetcher);

    // Non-copyable
    DataService(const DataService&) = delete;
    DataService& operator=(const DataService&) = delete;

    /**
     * @brief Read data, preferring the cache
     * @return Value, or std::nullopt if the source has nothing
     * @throws std::exception on fetcher failure
     */
    std::optional<nlohmann::json> get(
        const std::string& category,
        const std::string& identifier,
        const nlohmann::json& params = nlohmann::json::object()
    );

    DataServiceStats get_stats() const;

private:
    PrefetchEngine& engine_;
    ICacheStore& cache_;
    IDataFetcher& fetcher_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> fetches_{0};
    std::atomic<uint64_t> not_found_{0};
};

} // namespace snapfetch
