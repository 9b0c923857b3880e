/**
 * @file i_data_fetcher.h
 * @brief Interfaces for the backing data source
 *
 * IDocumentSource is the raw collection/document API of the database.
 * IDataFetcher maps a data requirement onto it.
 */

#pragma once

#include "snapfetch/prefetch_types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace snapfetch {

/**
 * @brief Collection/document access to the backing database
 *
 * Contract:
 * - std::nullopt means "no such collection/document"
 * - I/O or decode failures throw std::exception
 */
class IDocumentSource {
public:
    virtual ~IDocumentSource() = default;

    /**
     * @brief Read a collection
     * @param collection Collection name
     * @param options Query options (whereConditions, orderByField,
     *                orderDirection, limitCount)
     * @return JSON array of documents
     */
    virtual std::optional<nlohmann::json> get_collection(
        const std::string& collection,
        const nlohmann::json& options = nlohmann::json::object()
    ) = 0;

    /**
     * @brief Read a single document
     * @param collection Collection name
     * @param id Document id
     * @return Document object
     */
    virtual std::optional<nlohmann::json> get_document(
        const std::string& collection,
        const std::string& id
    ) = 0;
};

/**
 * @brief Fetches the data behind one requirement
 *
 * Contract:
 * - Unknown categories are a soft, logged no-op (std::nullopt)
 * - Backend failures throw; timeout and retry policy belong here, not
 *   to the caller
 */
class IDataFetcher {
public:
    virtual ~IDataFetcher() = default;

    virtual std::optional<nlohmann::json> fetch(const DataRequirement& requirement) = 0;
};

} // namespace snapfetch
