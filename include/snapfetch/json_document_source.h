/**
 * @file json_document_source.h
 * @brief Document source backed by a directory of JSON collection files
 *
 * Layout:
 * @code
 * <root>/products.json    [{"id": "p1", ...}, ...]
 * <root>/coverages.json
 * @endcode
 *
 * Query options follow the hub's collection API:
 * - whereConditions: [[field, op, value], ...] with op one of
 *   ==, !=, <, <=, >, >=, in, array-contains
 * - orderByField / orderDirection ("asc" | "desc")
 * - limitCount
 */

#pragma once

#include "interfaces/i_data_fetcher.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>

namespace snapfetch {

namespace fs = std::filesystem;

/**
 * @brief IDocumentSource over <root>/<collection>.json files
 *
 * Thread Safety:
 * - All public methods are thread-safe
 */
class JsonDocumentSource : public IDocumentSource {
public:
    explicit JsonDocumentSource(const fs::path& root);

    /**
     * @throws std::runtime_error if the collection file is unreadable or not
     *         a JSON array
     * @throws std::invalid_argument on malformed query options
     */
    std::optional<nlohmann::json> get_collection(
        const std::string& collection,
        const nlohmann::json& options = nlohmann::json::object()
    ) override;

    /**
     * @throws std::runtime_error if the collection file is unreadable
     */
    std::optional<nlohmann::json> get_document(
        const std::string& collection,
        const std::string& id
    ) override;

    const fs::path& root() const { return root_; }

    /**
     * @brief Apply query options to an array of documents
     */
    static nlohmann::json apply_query(const nlohmann::json& documents, const nlohmann::json& options);

private:
    fs::path root_;
    mutable std::mutex mutex_;

    std::optional<nlohmann::json> load_collection(const std::string& collection) const;
};

} // namespace snapfetch
