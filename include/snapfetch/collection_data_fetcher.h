/**
 * @file collection_data_fetcher.h
 * @brief Maps data requirements onto collection and document reads
 */

#pragma once

#include "interfaces/i_data_fetcher.h"
#include <string>

namespace snapfetch {

/**
 * @brief IDataFetcher dispatching by category
 *
 * | category                      | read                                   |
 * |-------------------------------|----------------------------------------|
 * | products, forms, rules, tasks | collection of the same name            |
 * | coverages                     | collection if "all", else the document |
 * | pricing, steps                | "steps" collection                     |
 *
 * Requirement params are passed through as collection query options.
 * Any other category logs a warning and yields nothing.
 */
class CollectionDataFetcher : public IDataFetcher {
public:
    explicit CollectionDataFetcher(IDocumentSource& source);

    std::optional<nlohmann::json> fetch(const DataRequirement& requirement) override;

    static bool is_known_category(const std::string& category);

private:
    IDocumentSource& source_;
};

} // namespace snapfetch
