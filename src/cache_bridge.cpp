/**
 * @file cache_bridge.cpp
 * @brief Cache Bridge Implementation
 */

#include "snapfetch/cache_bridge.h"
#include <iostream>

namespace snapfetch {

const char* prefetch_outcome_to_string(PrefetchOutcome outcome) {
    switch (outcome) {
        case PrefetchOutcome::ALREADY_CACHED: return "already_cached";
        case PrefetchOutcome::STORED:         return "stored";
        case PrefetchOutcome::EMPTY:          return "empty";
        case PrefetchOutcome::FAILED:         return "failed";
        default:                              return "unknown";
    }
}

CacheBridge::CacheBridge(ICacheStore& cache, IDataFetcher& fetcher, const PrefetchConfig& config)
    : cache_(cache)
    , fetcher_(fetcher)
    , config_(config)
{
}

PrefetchOutcome CacheBridge::fetch_and_cache(const DataRequirement& requirement) {
    try {
        if (cache_.get(requirement.category, requirement.identifier, requirement.params)) {
            cache_hits_.fetch_add(1);
            return PrefetchOutcome::ALREADY_CACHED;
        }

        auto data = fetcher_.fetch(requirement);
        if (!data || data->is_null()) {
            empty_.fetch_add(1);
            return PrefetchOutcome::EMPTY;
        }

        CacheSetOptions options;
        options.ttl = config_.max_prefetch_age;
        cache_.set(requirement.category, requirement.identifier, *data, requirement.params, options);

        stored_.fetch_add(1);
        std::cout << "[CacheBridge] Prefetched " << requirement.data_key() << std::endl;
        return PrefetchOutcome::STORED;
    } catch (const std::exception& e) {
        failed_.fetch_add(1);
        std::cerr << "[CacheBridge] Failed to prefetch " << requirement.data_key()
                  << ": " << e.what() << std::endl;
        return PrefetchOutcome::FAILED;
    } catch (...) {
        failed_.fetch_add(1);
        std::cerr << "[CacheBridge] Failed to prefetch " << requirement.data_key()
                  << ": unknown error" << std::endl;
        return PrefetchOutcome::FAILED;
    }
}

size_t CacheBridge::prefetch_all(const std::vector<DataRequirement>& requirements) {
    size_t stored = 0;
    for (const auto& requirement : requirements) {
        if (fetch_and_cache(requirement) == PrefetchOutcome::STORED) {
            stored++;
        }
    }
    return stored;
}

CacheBridgeStats CacheBridge::get_stats() const {
    CacheBridgeStats stats;
    stats.cache_hits = cache_hits_.load();
    stats.stored = stored_.load();
    stats.empty = empty_.load();
    stats.failed = failed_.load();
    return stats;
}

} // namespace snapfetch
