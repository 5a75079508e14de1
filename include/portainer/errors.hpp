/**
 * @file errors.hpp
 * @brief Exception types for the Portainer C++ SDK
 */

#ifndef PORTAINER_ERRORS_HPP
#define PORTAINER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <optional>

namespace portainer {

/**
 * Base exception class for Portainer SDK errors
 */
class PortainerError : public std::runtime_error {
public:
    explicit PortainerError(const std::string& message, const std::string& code = "")
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

protected:
    std::string code_;
};

/**
 * Authentication-related errors
 */
class AuthenticationError : public PortainerError {
public:
    explicit AuthenticationError(const std::string& message)
        : PortainerError(message, "AUTHENTICATION_ERROR") {}
};

/**
 * Credential exchange rejected or malformed
 */
class TokenRefreshError : public AuthenticationError {
public:
    TokenRefreshError(
        const std::string& message,
        std::optional<int> status_code = std::nullopt,
        const std::string& response_body = ""
    ) : AuthenticationError(message),
        status_code_(status_code),
        response_body_(response_body) {}

    std::optional<int> status_code() const { return status_code_; }
    const std::string& response_body() const { return response_body_; }

private:
    std::optional<int> status_code_;
    std::string response_body_;
};

/**
 * The HTTP round trip could not be completed
 */
class ConnectionError : public PortainerError {
public:
    explicit ConnectionError(const std::string& message, const std::string& url = "")
        : PortainerError(message, "CONNECTION_ERROR"), url_(url) {}

    const std::string& url() const { return url_; }

protected:
    ConnectionError(const std::string& message, const std::string& url, const std::string& code)
        : PortainerError(message, code), url_(url) {}

private:
    std::string url_;
};

/**
 * The HTTP round trip exceeded its timeout
 */
class TimeoutError : public ConnectionError {
public:
    explicit TimeoutError(const std::string& url = "", std::optional<double> timeout = std::nullopt)
        : ConnectionError("Timeout occurred while connecting to Docker", url, "TIMEOUT_ERROR"),
          timeout_(timeout) {}

    std::optional<double> timeout() const { return timeout_; }

private:
    std::optional<double> timeout_;
};

/**
 * Server answered with a 4xx/5xx status
 */
class APIError : public PortainerError {
public:
    APIError(
        const std::string& message,
        int status_code,
        const std::string& response_body = "",
        const std::string& endpoint = ""
    ) : PortainerError(message, "API_ERROR"),
        status_code_(status_code),
        response_body_(response_body),
        endpoint_(endpoint) {}

    int status_code() const { return status_code_; }
    const std::string& response_body() const { return response_body_; }
    const std::string& endpoint() const { return endpoint_; }

protected:
    int status_code_;
    std::string response_body_;
    std::string endpoint_;
};

/**
 * Resource not found
 */
class NotFoundError : public APIError {
public:
    NotFoundError(
        const std::string& message,
        const std::string& resource = "",
        const std::string& response_body = ""
    ) : APIError(message, 404, response_body), resource_(resource) {}

    const std::string& resource() const { return resource_; }

private:
    std::string resource_;
};

/**
 * A resource operation was invoked without an identifier
 */
class NullResourceError : public PortainerError {
public:
    NullResourceError()
        : PortainerError("Resource ID was not provided", "NULL_RESOURCE") {}
};

/**
 * Validation errors
 */
class ValidationError : public PortainerError {
public:
    ValidationError(
        const std::string& message,
        const std::string& field = "",
        const std::string& value = ""
    ) : PortainerError(message, "VALIDATION_ERROR"),
        field_(field),
        value_(value) {}

    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    std::string field_;
    std::string value_;
};

/**
 * Configuration errors
 */
class ConfigurationError : public PortainerError {
public:
    ConfigurationError(const std::string& message, const std::string& config_key = "")
        : PortainerError(message, "CONFIGURATION_ERROR"), config_key_(config_key) {}

    const std::string& config_key() const { return config_key_; }

private:
    std::string config_key_;
};

/**
 * Cached entity lacks the requested data
 */
class ModelError : public PortainerError {
public:
    explicit ModelError(const std::string& message)
        : PortainerError(message, "MODEL_ERROR") {}
};

} // namespace portainer

#endif // PORTAINER_ERRORS_HPP
