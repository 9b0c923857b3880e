/**
 * @file data_service.cpp
 * @brief Read-through data service implementation
 */

#include "snapfetch/data_service.h"

namespace snapfetch {

DataService::DataService(PrefetchEngine& engine, ICacheStore& cache, IDataFetcher& fetcher)
    : engine_(engine)
    , cache_(cache)
    , fetcher_(fetcher)
{
}

std::optional<nlohmann::json> DataService::get(
    const std::string& category,
    const std::string& identifier,
    const nlohmann::json& params)
{
    requests_.fetch_add(1);

    DataAccessEvent event;
    event.category = category;
    event.identifier = identifier;
    event.params = params;
    engine_.on_data_access(event);

    if (auto cached = cache_.get(category, identifier, params)) {
        cache_hits_.fetch_add(1);
        return cached;
    }

    DataRequirement requirement;
    requirement.category = category;
    requirement.identifier = identifier;
    requirement.params = params;

    fetches_.fetch_add(1);
    auto data = fetcher_.fetch(requirement);
    if (!data || data->is_null()) {
        not_found_.fetch_add(1);
        return std::nullopt;
    }

    cache_.set(category, identifier, *data, params);
    return data;
}

DataServiceStats DataService::get_stats() const {
    DataServiceStats stats;
    stats.requests = requests_.load();
    stats.cache_hits = cache_hits_.load();
    stats.fetches = fetches_.load();
    stats.not_found = not_found_.load();
    return stats;
}

} // namespace snapfetch
