/**
 * @file i_cache_store.h
 * @brief Interface for the data cache the prefetcher warms
 *
 * Entries are addressed by (category, identifier, params). The prefetch
 * engine is a pure client: it reads and writes entries but never evicts.
 *
 * Design Principles:
 * - Values are JSON documents or collections
 * - A miss and an expired entry look the same to callers
 * - Writers may shorten an entry's lifetime with a per-write TTL
 */

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace snapfetch {

/**
 * @brief Write options for cache store
 */
struct CacheSetOptions {
    std::optional<std::chrono::milliseconds> ttl;   ///< Overrides the store's default TTL
};

/**
 * @brief Cache store statistics
 */
struct CacheStoreStats {
    size_t total_entries = 0;

    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t writes = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;

    double hit_rate() const {
        uint64_t total = hits + misses;
        return total > 0 ? (double)hits / total : 0.0;
    }
};

/**
 * @brief Interface for the data cache
 *
 * Contract:
 * - get() returns std::nullopt for missing or expired entries
 * - set() replaces any existing entry for the same key
 * - Implementations may throw std::exception on backend failure
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    /**
     * @brief Look up a cached value
     * @param category Data category (products, coverages, ...)
     * @param identifier Document id or "all"
     * @param params Query parameters (JSON object)
     * @return Cached value if present and fresh
     */
    virtual std::optional<nlohmann::json> get(
        const std::string& category,
        const std::string& identifier,
        const nlohmann::json& params = nlohmann::json::object()
    ) = 0;

    /**
     * @brief Store a value
     * @param category Data category
     * @param identifier Document id or "all"
     * @param value Value to cache
     * @param params Query parameters (JSON object)
     * @param options Write options (TTL)
     */
    virtual void set(
        const std::string& category,
        const std::string& identifier,
        const nlohmann::json& value,
        const nlohmann::json& params = nlohmann::json::object(),
        const CacheSetOptions& options = CacheSetOptions{}
    ) = 0;

    /**
     * @brief Get store statistics
     */
    virtual CacheStoreStats get_stats() const = 0;
};

} // namespace snapfetch
