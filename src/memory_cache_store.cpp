/**
 * @file memory_cache_store.cpp
 * @brief Implementation of the in-memory TTL + LRU cache
 */

#include "snapfetch/memory_cache_store.h"
#include <iostream>
#include <iterator>

using json = nlohmann::json;

namespace snapfetch {

MemoryCacheStore::MemoryCacheStore(const IClock& clock, MemoryCacheConfig config)
    : clock_(clock)
    , config_(config)
{
    std::cout << "[MemoryCacheStore] Initialized (default TTL "
              << config_.default_ttl.count() / 1000 << " s, "
              << config_.max_entries << " entries max)" << std::endl;
}

std::string MemoryCacheStore::make_key(
    const std::string& category,
    const std::string& identifier,
    const json& params)
{
    std::string key = category + ":" + identifier;
    if (!params.is_object() || params.empty()) {
        return key;
    }

    // json objects iterate in sorted key order
    key += ":";
    bool first = true;
    for (auto it = params.begin(); it != params.end(); ++it) {
        if (!first) {
            key += "|";
        }
        key += it.key() + ":" + it.value().dump();
        first = false;
    }
    return key;
}

std::optional<json> MemoryCacheStore::get(
    const std::string& category,
    const std::string& identifier,
    const json& params)
{
    std::string key = make_key(category, identifier, params);
    Timestamp now = clock_.now_ms();

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return std::nullopt;
    }

    if (now >= it->second.entry.expires_at) {
        erase(it);
        expirations_++;
        misses_++;
        return std::nullopt;
    }

    hits_++;
    it->second.entry.access_count++;
    touch(it->second);
    return it->second.entry.value;
}

void MemoryCacheStore::set(
    const std::string& category,
    const std::string& identifier,
    const json& value,
    const json& params,
    const CacheSetOptions& options)
{
    std::string key = make_key(category, identifier, params);
    Timestamp now = clock_.now_ms();
    auto ttl = options.ttl.value_or(config_.default_ttl);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.entry.value = value;
        it->second.entry.stored_at = now;
        it->second.entry.expires_at = now + ttl.count();
        touch(it->second);
        writes_++;
        return;
    }

    if (config_.max_entries > 0) {
        while (entries_.size() >= config_.max_entries && !lru_list_.empty()) {
            evict_lru();
        }
    }

    lru_list_.push_front(key);

    Slot slot;
    slot.entry.category = category;
    slot.entry.value = value;
    slot.entry.stored_at = now;
    slot.entry.expires_at = now + ttl.count();
    slot.lru_position = lru_list_.begin();
    entries_.emplace(std::move(key), std::move(slot));
    writes_++;
}

CacheStoreStats MemoryCacheStore::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStoreStats stats;
    stats.total_entries = entries_.size();
    stats.hits = hits_;
    stats.misses = misses_;
    stats.writes = writes_;
    stats.evictions = evictions_;
    stats.expirations = expirations_;
    return stats;
}

//=============================================================================
// Maintenance
//=============================================================================

bool MemoryCacheStore::invalidate(
    const std::string& category,
    const std::string& identifier,
    const json& params)
{
    std::string key = make_key(category, identifier, params);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    erase(it);
    return true;
}

size_t MemoryCacheStore::invalidate_category(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.entry.category == category) {
            auto next = std::next(it);
            erase(it);
            it = next;
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        std::cout << "[MemoryCacheStore] Invalidated " << removed
                  << " entries for category '" << category << "'" << std::endl;
    }
    return removed;
}

size_t MemoryCacheStore::purge_expired() {
    Timestamp now = clock_.now_ms();

    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.entry.expires_at) {
            auto next = std::next(it);
            erase(it);
            it = next;
            expirations_++;
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

void MemoryCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    entries_.clear();
    lru_list_.clear();

    std::cout << "[MemoryCacheStore] Cleared all entries" << std::endl;
}

size_t MemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

//=============================================================================
// Internal Methods
//=============================================================================

void MemoryCacheStore::touch(Slot& slot) {
    lru_list_.splice(lru_list_.begin(), lru_list_, slot.lru_position);
}

void MemoryCacheStore::erase(std::unordered_map<std::string, Slot>::iterator it) {
    lru_list_.erase(it->second.lru_position);
    entries_.erase(it);
}

void MemoryCacheStore::evict_lru() {
    auto it = entries_.find(lru_list_.back());
    if (it == entries_.end()) {
        lru_list_.pop_back();
        return;
    }
    erase(it);
    evictions_++;
}

} // namespace snapfetch
