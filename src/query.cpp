/**
 * @file query.cpp
 * @brief Query string and filter encoding for the Portainer C++ SDK
 */

#include "portainer/query.hpp"
#include <curl/curl.h>

namespace portainer {

std::string url_encode(const std::string& value) {
    char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        return value;
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string query_value_to_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "1" : "0";
    }
    return value.dump();
}

QueryParams drop_null_params(const QueryParams& query) {
    QueryParams result;
    for (const auto& [key, value] : query) {
        if (!value.is_null()) {
            result.emplace(key, value);
        }
    }
    return result;
}

std::string encode_query(const QueryParams& query) {
    std::string encoded;
    for (const auto& [key, value] : drop_null_params(query)) {
        if (!encoded.empty()) {
            encoded += "&";
        }
        encoded += url_encode(key) + "=" + url_encode(query_value_to_string(value));
    }
    return encoded;
}

static std::string filter_item_to_string(const json& item) {
    if (item.is_string()) {
        return item.get<std::string>();
    }
    if (item.is_boolean()) {
        return item.get<bool>() ? "true" : "false";
    }
    return item.dump();
}

std::string convert_filters(const Filters& filters) {
    json result = json::object();

    for (const auto& [key, value] : filters) {
        json items = json::array();
        if (value.is_array()) {
            for (const auto& item : value) {
                items.push_back(filter_item_to_string(item));
            }
        } else {
            items.push_back(filter_item_to_string(value));
        }
        result[key] = items;
    }

    return result.dump();
}

json signal_param(const Signal& signal) {
    if (const auto* number = std::get_if<int>(&signal)) {
        return *number;
    }
    return std::get<std::string>(signal);
}

} // namespace portainer
