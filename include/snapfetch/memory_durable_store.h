/**
 * @file memory_durable_store.h
 * @brief In-process IDurableStore (ephemeral mode and tests)
 */

#pragma once

#include "interfaces/i_durable_store.h"
#include <map>
#include <mutex>

namespace snapfetch {

/**
 * @brief IDurableStore that lives and dies with the process
 */
class MemoryDurableStore : public IDurableStore {
public:
    std::optional<std::string> get_item(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = items_.find(key);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set_item(const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        items_[key] = value;
    }

    bool remove_item(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.erase(key) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> items_;
};

} // namespace snapfetch
