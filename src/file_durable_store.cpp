/**
 * @file file_durable_store.cpp
 * @brief File-based durable store implementation
 */

#include "snapfetch/file_durable_store.h"
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace snapfetch {

//=============================================================================
// Constructor
//=============================================================================

FileDurableStore::FileDurableStore(const fs::path& path)
    : store_path_(path)
{
    std::error_code ec;
    if (!fs::exists(store_path_)) {
        fs::create_directories(store_path_, ec);
        if (ec) {
            throw std::runtime_error("Failed to create directory " + store_path_.string() +
                                     ": " + ec.message());
        }
    }

    std::cout << "[FileDurableStore] Initialized at " << store_path_.string() << std::endl;
}

//=============================================================================
// IDurableStore
//=============================================================================

std::optional<std::string> FileDurableStore::get_item(const std::string& key) {
    auto file_path = item_path(key);

    std::lock_guard<std::mutex> lock(mutex_);

    if (!fs::exists(file_path)) {
        return std::nullopt;
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + file_path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read " + file_path.string());
    }
    return contents.str();
}

void FileDurableStore::set_item(const std::string& key, const std::string& value) {
    auto file_path = item_path(key);
    auto temp_path = file_path;
    temp_path += ".tmp";

    std::lock_guard<std::mutex> lock(mutex_);

    // Write to temp file first (atomic write pattern)
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to create temp file " + temp_path.string());
        }

        file.write(value.data(), static_cast<std::streamsize>(value.size()));
        file.flush();

        if (!file.good()) {
            std::error_code ec;
            fs::remove(temp_path, ec);
            throw std::runtime_error("Write failed for " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, file_path, ec);
    if (ec) {
        std::string message = "Rename failed: " + ec.message();
        fs::remove(temp_path, ec);
        throw std::runtime_error(message);
    }
}

bool FileDurableStore::remove_item(const std::string& key) {
    auto file_path = item_path(key);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    bool removed = fs::remove(file_path, ec);
    if (ec) {
        throw std::runtime_error("Failed to remove " + file_path.string() + ": " + ec.message());
    }
    return removed;
}

fs::path FileDurableStore::item_path(const std::string& key) const {
    std::string name;
    name.reserve(key.size());
    for (char c : key) {
        unsigned char uc = static_cast<unsigned char>(c);
        name += (std::isalnum(uc) || c == '_' || c == '-' || c == '.') ? c : '_';
    }
    return store_path_ / (name + ".json");
}

} // namespace snapfetch
