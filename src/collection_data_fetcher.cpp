/**
 * @file collection_data_fetcher.cpp
 * @brief Category dispatch for prefetch and read-through fetches
 */

#include "snapfetch/collection_data_fetcher.h"
#include <iostream>

namespace snapfetch {

CollectionDataFetcher::CollectionDataFetcher(IDocumentSource& source)
    : source_(source)
{
}

bool CollectionDataFetcher::is_known_category(const std::string& category) {
    return category == "products" || category == "coverages" || category == "forms" ||
           category == "rules" || category == "tasks" || category == "pricing" ||
           category == "steps";
}

std::optional<nlohmann::json> CollectionDataFetcher::fetch(const DataRequirement& requirement) {
    const std::string& category = requirement.category;
    const nlohmann::json& options = requirement.params;

    if (category == "products" || category == "forms" || category == "rules" || category == "tasks") {
        return source_.get_collection(category, options);
    }

    if (category == "coverages") {
        if (requirement.identifier == "all") {
            return source_.get_collection("coverages", options);
        }
        return source_.get_document("coverages", requirement.identifier);
    }

    if (category == "pricing" || category == "steps") {
        return source_.get_collection("steps", options);
    }

    std::cerr << "[CollectionDataFetcher] Unknown category for prefetching: " << category << std::endl;
    return std::nullopt;
}

} // namespace snapfetch
