/**
 * @file json_document_source.cpp
 * @brief JSON-directory document source implementation
 */

#include "snapfetch/json_document_source.h"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace snapfetch {

namespace {

// Missing fields compare as null
const json& field_of(const json& document, const std::string& field) {
    static const json null_value;
    if (!document.is_object()) {
        return null_value;
    }
    auto it = document.find(field);
    return it != document.end() ? *it : null_value;
}

bool matches(const json& actual, const std::string& op, const json& expected) {
    if (op == "==") return actual == expected;
    if (op == "!=") return actual != expected;

    if (op == "<" || op == "<=" || op == ">" || op == ">=") {
        // Ordering across types (e.g. string vs number) never matches
        bool comparable = (actual.is_number() && expected.is_number()) ||
                          (actual.is_string() && expected.is_string());
        if (!comparable) return false;
        if (op == "<")  return actual < expected;
        if (op == "<=") return actual <= expected;
        if (op == ">")  return actual > expected;
        return actual >= expected;
    }

    if (op == "in") {
        if (!expected.is_array()) {
            throw std::invalid_argument("'in' condition expects an array value");
        }
        return std::find(expected.begin(), expected.end(), actual) != expected.end();
    }

    if (op == "array-contains") {
        return actual.is_array() &&
               std::find(actual.begin(), actual.end(), expected) != actual.end();
    }

    throw std::invalid_argument("Unsupported where operator: " + op);
}

} // anonymous namespace

JsonDocumentSource::JsonDocumentSource(const fs::path& root)
    : root_(root)
{
    if (!fs::is_directory(root_)) {
        std::cerr << "[JsonDocumentSource] Data directory not found: " << root_.string()
                  << " (every collection will read as missing)" << std::endl;
    } else {
        std::cout << "[JsonDocumentSource] Serving collections from " << root_.string() << std::endl;
    }
}

std::optional<json> JsonDocumentSource::get_collection(
    const std::string& collection,
    const json& options)
{
    auto documents = load_collection(collection);
    if (!documents) {
        return std::nullopt;
    }
    return apply_query(*documents, options);
}

std::optional<json> JsonDocumentSource::get_document(
    const std::string& collection,
    const std::string& id)
{
    auto documents = load_collection(collection);
    if (!documents) {
        return std::nullopt;
    }

    for (const auto& document : *documents) {
        const json& doc_id = field_of(document, "id");
        if ((doc_id.is_string() && doc_id.get<std::string>() == id) ||
            (doc_id.is_number() && doc_id.dump() == id)) {
            return document;
        }
    }
    return std::nullopt;
}

json JsonDocumentSource::apply_query(const json& documents, const json& options) {
    if (!options.is_object()) {
        throw std::invalid_argument("Query options must be a JSON object");
    }

    json result = json::array();

    const json conditions = options.value("whereConditions", json::array());
    if (!conditions.is_array()) {
        throw std::invalid_argument("whereConditions must be an array");
    }

    for (const auto& document : documents) {
        bool keep = true;
        for (const auto& condition : conditions) {
            if (!condition.is_array() || condition.size() != 3 || !condition[0].is_string() ||
                !condition[1].is_string()) {
                throw std::invalid_argument("where condition must be [field, op, value]");
            }
            if (!matches(field_of(document, condition[0].get<std::string>()),
                         condition[1].get<std::string>(), condition[2])) {
                keep = false;
                break;
            }
        }
        if (keep) {
            result.push_back(document);
        }
    }

    auto order_it = options.find("orderByField");
    if (order_it != options.end() && order_it->is_string()) {
        std::string field = order_it->get<std::string>();
        bool descending = options.value("orderDirection", std::string("asc")) == "desc";

        std::stable_sort(result.begin(), result.end(),
            [&field, descending](const json& a, const json& b) {
                const json& lhs = field_of(a, field);
                const json& rhs = field_of(b, field);
                return descending ? rhs < lhs : lhs < rhs;
            });
    }

    auto limit_it = options.find("limitCount");
    if (limit_it != options.end() && limit_it->is_number_integer()) {
        int64_t limit = limit_it->get<int64_t>();
        if (limit >= 0 && static_cast<size_t>(limit) < result.size()) {
            result.erase(result.begin() + limit, result.end());
        }
    }

    return result;
}

std::optional<json> JsonDocumentSource::load_collection(const std::string& collection) const {
    if (collection.empty() || collection.find('/') != std::string::npos ||
        collection.find("..") != std::string::npos) {
        throw std::invalid_argument("Invalid collection name: " + collection);
    }

    fs::path file_path = root_ / (collection + ".json");

    std::lock_guard<std::mutex> lock(mutex_);

    if (!fs::exists(file_path)) {
        return std::nullopt;
    }

    std::ifstream file(file_path);
    if (!file) {
        throw std::runtime_error("Failed to open " + file_path.string());
    }

    json documents;
    try {
        documents = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + file_path.string() + ": " + e.what());
    }

    if (!documents.is_array()) {
        throw std::runtime_error(file_path.string() + " is not a JSON array");
    }
    return documents;
}

} // namespace snapfetch
