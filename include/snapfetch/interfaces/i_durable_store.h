/**
 * @file i_durable_store.h
 * @brief Interface for the durable key-value store behind pattern persistence
 */

#pragma once

#include <optional>
#include <string>

namespace snapfetch {

/**
 * @brief String key-value store that survives restarts
 *
 * Contract:
 * - get_item() returns std::nullopt for absent keys
 * - Failures (unavailable, quota exceeded) throw std::exception
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class IDurableStore {
public:
    virtual ~IDurableStore() = default;

    virtual std::optional<std::string> get_item(const std::string& key) = 0;

    virtual void set_item(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Remove a key
     * @return true if the key existed
     */
    virtual bool remove_item(const std::string& key) = 0;
};

} // namespace snapfetch
