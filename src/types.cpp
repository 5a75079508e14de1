/**
 * @file types.cpp
 * @brief Type implementations for the Portainer C++ SDK
 */

#include "portainer/types.hpp"
#include "portainer/errors.hpp"
#include <cstdlib>

namespace portainer {

std::string method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Delete: return "DELETE";
        default: return "GET";
    }
}

LogLevel string_to_log_level(const std::string& str) {
    if (str == "none" || str == "off") return LogLevel::None;
    if (str == "error") return LogLevel::Error;
    if (str == "warning" || str == "warn") return LogLevel::Warning;
    if (str == "info") return LogLevel::Info;
    if (str == "debug") return LogLevel::Debug;
    if (str == "all" || str == "trace") return LogLevel::All;
    return LogLevel::Warning;
}

json Credentials::to_json() const {
    return {
        {"username", username},
        {"password", password}
    };
}

std::string ResourceRef::id() const {
    if (const auto* raw = std::get_if<std::string>(&ref_)) {
        return *raw;
    }

    const json& entity = std::get<json>(ref_);
    if (!entity.is_object()) {
        return "";
    }
    for (const char* key : {"Id", "ID"}) {
        auto it = entity.find(key);
        if (it != entity.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

static std::optional<std::string> env_value(const char* name) {
    const char* value = getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

static int parse_int_env(const char* name, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid integer for " + std::string(name) + ": " + value, name);
    }
}

ClientOptions ClientOptions::from_env() {
    ClientOptions options;

    if (auto host = env_value("PORTAINER_HOST")) {
        options.host = *host;
    }
    if (auto port = env_value("PORTAINER_PORT")) {
        options.port = parse_int_env("PORTAINER_PORT", *port);
    }
    if (auto scheme = env_value("PORTAINER_SCHEME")) {
        options.scheme = *scheme;
    }
    if (auto endpoint = env_value("PORTAINER_ENDPOINT_ID")) {
        options.endpoint_id = parse_int_env("PORTAINER_ENDPOINT_ID", *endpoint);
    }
    if (auto username = env_value("PORTAINER_USERNAME")) {
        options.username = *username;
    }
    if (auto password = env_value("PORTAINER_PASSWORD")) {
        options.password = *password;
    }
    if (auto timeout = env_value("PORTAINER_TIMEOUT")) {
        try {
            options.timeout = std::stod(*timeout);
        } catch (const std::exception&) {
            throw ConfigurationError("Invalid number for PORTAINER_TIMEOUT: " + *timeout, "PORTAINER_TIMEOUT");
        }
    }
    if (auto verify = env_value("PORTAINER_VERIFY_TLS")) {
        options.verify_tls = !(*verify == "0" || *verify == "false" || *verify == "no");
    }
    if (auto level = env_value("PORTAINER_LOG_LEVEL")) {
        options.log_level = string_to_log_level(*level);
    }

    return options;
}

void ClientOptions::validate() const {
    if (host.empty()) {
        throw ConfigurationError("Portainer host is required", "host");
    }
    if (scheme != "http" && scheme != "https") {
        throw ConfigurationError("Unsupported scheme: " + scheme, "scheme");
    }
    if (port.has_value() && (*port < 1 || *port > 65535)) {
        throw ConfigurationError("Port out of range: " + std::to_string(*port), "port");
    }
    if (endpoint_id < 1) {
        throw ConfigurationError("Endpoint id must be positive", "endpoint_id");
    }
    if (timeout <= 0) {
        throw ConfigurationError("Timeout must be positive", "timeout");
    }
}

std::string ClientOptions::base_url() const {
    std::string url = scheme + "://" + host;
    if (port.has_value()) {
        url += ":" + std::to_string(*port);
    }
    return url;
}

} // namespace portainer
