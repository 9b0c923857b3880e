/**
 * @file file_durable_store.h
 * @brief Directory-backed durable key-value store
 *
 * Features:
 * - One file per key (<key>.json)
 * - Atomic writes (write-to-temp, then rename)
 * - Keys are sanitized to portable file names
 */

#pragma once

#include "interfaces/i_durable_store.h"
#include <filesystem>
#include <mutex>

namespace snapfetch {

namespace fs = std::filesystem;

/**
 * @brief File-based implementation of IDurableStore
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Write operations are atomic (write-rename pattern)
 */
class FileDurableStore : public IDurableStore {
public:
    /**
     * @brief Construct file durable store
     * @param path Directory for stored items (created if missing)
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit FileDurableStore(const fs::path& path);

    // Prevent copying
    FileDurableStore(const FileDurableStore&) = delete;
    FileDurableStore& operator=(const FileDurableStore&) = delete;

    std::optional<std::string> get_item(const std::string& key) override;

    void set_item(const std::string& key, const std::string& value) override;

    bool remove_item(const std::string& key) override;

    const fs::path& path() const { return store_path_; }

    /**
     * @brief File backing a key
     */
    fs::path item_path(const std::string& key) const;

private:
    fs::path store_path_;
    mutable std::mutex mutex_;
};

} // namespace snapfetch
