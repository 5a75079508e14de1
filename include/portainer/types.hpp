/**
 * @file types.hpp
 * @brief Type definitions for the Portainer C++ SDK
 */

#ifndef PORTAINER_TYPES_HPP
#define PORTAINER_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace portainer {

using json = nlohmann::json;

// =============================================================================
// Constants
// =============================================================================

constexpr const char* PORTAINER_API_ROOT = "/api";
constexpr const char* PORTAINER_AUTH_PATH = "/auth";
constexpr const char* PORTAINER_DEFAULT_SCHEME = "http";
constexpr int PORTAINER_DEFAULT_ENDPOINT_ID = 1;
constexpr double PORTAINER_DEFAULT_TIMEOUT_SECONDS = 60.0;
constexpr int DOCKER_DEFAULT_STOP_TIMEOUT = 10;
constexpr size_t DOCKER_SHORT_ID_LENGTH = 12;

// Portainer issues JWTs valid for 8 hours.
constexpr std::chrono::minutes PORTAINER_TOKEN_LIFETIME{7 * 60 + 59};

// =============================================================================
// Enums
// =============================================================================

enum class LogLevel {
    None,
    Error,
    Warning,
    Info,
    Debug,
    All
};

enum class HttpMethod {
    Get,
    Post,
    Put,
    Delete
};

// =============================================================================
// Utility Functions
// =============================================================================

std::string method_to_string(HttpMethod method);
LogLevel string_to_log_level(const std::string& str);

// =============================================================================
// Auth Types
// =============================================================================

struct Credentials {
    std::string username;
    std::string password;

    json to_json() const;
};

struct Token {
    std::string value;
    std::chrono::system_clock::time_point expiry;
};

// =============================================================================
// Request Types
// =============================================================================

/// Query values are JSON scalars; null entries are dropped before encoding.
using QueryParams = std::map<std::string, json>;

/// Filter name to a scalar or a list of scalars.
using Filters = std::map<std::string, json>;

/// A signal number or name such as "SIGTERM".
using Signal = std::variant<int, std::string>;

struct RequestDescriptor {
    HttpMethod method = HttpMethod::Get;
    std::string path;
    QueryParams query;
    std::optional<json> body;
    bool abs_path = false;
    bool authenticated = true;
};

/**
 * Reference to a resource: either a raw identifier or an entity document
 * carrying an "Id" (or "ID") field.
 */
class ResourceRef {
public:
    ResourceRef(const std::string& id) : ref_(std::in_place_index<0>, id) {}
    ResourceRef(const char* id) : ref_(std::in_place_index<0>, id ? id : "") {}
    ResourceRef(const json& entity) : ref_(std::in_place_index<1>, entity) {}

    /// Resolve to a plain identifier, empty when none is present.
    std::string id() const;

private:
    std::variant<std::string, json> ref_;
};

// =============================================================================
// Container Option Types
// =============================================================================

struct ContainerListOptions {
    bool quiet = false;
    bool all = false;
    bool trunc = false;
    bool latest = false;
    std::optional<std::string> since;
    std::optional<std::string> before;
    int limit = -1;
    bool size = false;
    std::optional<Filters> filters;
};

struct ContainerLogsOptions {
    bool stdout_stream = true;
    bool stderr_stream = true;
    bool timestamps = false;
    std::optional<std::string> tail;
    std::optional<int64_t> since;
    std::optional<int64_t> until;
};

struct ContainerRemoveOptions {
    bool v = false;
    bool link = false;
    bool force = false;
};

// =============================================================================
// Client Types
// =============================================================================

struct ClientOptions {
    std::string host;
    std::optional<int> port;
    std::string scheme = PORTAINER_DEFAULT_SCHEME;
    int endpoint_id = PORTAINER_DEFAULT_ENDPOINT_ID;
    std::string username;
    std::string password;
    double timeout = PORTAINER_DEFAULT_TIMEOUT_SECONDS;
    bool verify_tls = true;
    LogLevel log_level = LogLevel::Warning;

    /**
     * Build options from PORTAINER_* environment variables
     * @return Options with unset variables left at their defaults
     */
    static ClientOptions from_env();

    /**
     * Check the options, throwing ConfigurationError on the first problem
     */
    void validate() const;

    /// "{scheme}://{host}[:{port}]"
    std::string base_url() const;
};

} // namespace portainer

#endif // PORTAINER_TYPES_HPP
