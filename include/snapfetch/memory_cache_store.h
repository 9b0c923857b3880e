/**
 * @file memory_cache_store.h
 * @brief In-process TTL + LRU data cache
 *
 * The cache the prefetcher warms and the data service reads through.
 * Entries expire individually; when the entry budget is full the least
 * recently used entry is evicted.
 */

#pragma once

#include "interfaces/i_cache_store.h"
#include "interfaces/i_clock.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace snapfetch {

/**
 * @brief Cached value
 */
struct MemoryCacheEntry {
    std::string category;
    nlohmann::json value;
    Timestamp stored_at = 0;
    Timestamp expires_at = 0;
    uint64_t access_count = 0;
};

/**
 * @brief Memory cache configuration
 */
struct MemoryCacheConfig {
    std::chrono::milliseconds default_ttl{1800000};  ///< 30 minutes, longer than max_prefetch_age
    size_t max_entries = 1000;                       ///< LRU budget (0 = unbounded)
};

/**
 * @brief In-memory ICacheStore
 *
 * Keys are canonical: "category:identifier" followed, when params are
 * present, by ":" and the params sorted by name as "k:json|k:json". Two
 * param objects with the same members therefore address the same entry.
 *
 * Thread Safety:
 * - All methods are thread-safe (single internal mutex)
 *
 * Example usage:
 * @code
 * MemoryCacheStore cache(SystemClock::instance());
 * cache.set("products", "all", products);
 * if (auto hit = cache.get("products", "all")) { ... }
 * @endcode
 */
class MemoryCacheStore : public ICacheStore {
public:
    explicit MemoryCacheStore(const IClock& clock, MemoryCacheConfig config = MemoryCacheConfig{});

    // Prevent copying
    MemoryCacheStore(const MemoryCacheStore&) = delete;
    MemoryCacheStore& operator=(const MemoryCacheStore&) = delete;

    //=========================================================================
    // ICacheStore
    //=========================================================================

    std::optional<nlohmann::json> get(
        const std::string& category,
        const std::string& identifier,
        const nlohmann::json& params = nlohmann::json::object()
    ) override;

    void set(
        const std::string& category,
        const std::string& identifier,
        const nlohmann::json& value,
        const nlohmann::json& params = nlohmann::json::object(),
        const CacheSetOptions& options = CacheSetOptions{}
    ) override;

    CacheStoreStats get_stats() const override;

    //=========================================================================
    // Maintenance
    //=========================================================================

    /**
     * @brief Drop one entry
     * @return true if an entry was removed
     */
    bool invalidate(
        const std::string& category,
        const std::string& identifier,
        const nlohmann::json& params = nlohmann::json::object()
    );

    /**
     * @brief Drop every entry of a category
     * @return Number of entries removed
     */
    size_t invalidate_category(const std::string& category);

    /**
     * @brief Drop expired entries
     * @return Number of entries removed
     */
    size_t purge_expired();

    void clear();

    size_t size() const;

    const MemoryCacheConfig& config() const { return config_; }

    /**
     * @brief Canonical cache key
     */
    static std::string make_key(
        const std::string& category,
        const std::string& identifier,
        const nlohmann::json& params
    );

private:
    using LRUList = std::list<std::string>;
    using LRUIterator = LRUList::iterator;

    struct Slot {
        MemoryCacheEntry entry;
        LRUIterator lru_position;
    };

    const IClock& clock_;
    MemoryCacheConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> entries_;
    LRUList lru_list_;      ///< Front = most recently used

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t writes_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;

    // Caller holds mutex_
    void touch(Slot& slot);
    void erase(std::unordered_map<std::string, Slot>::iterator it);
    void evict_lru();
};

} // namespace snapfetch
