/**
 * @file auth.cpp
 * @brief Bearer token management implementation for the Portainer C++ SDK
 */

#include "portainer/auth.hpp"
#include "portainer/errors.hpp"
#include "portainer/logging.hpp"

namespace portainer {

TokenManager::TokenManager(Credentials credentials, Exchange exchange, Clock clock)
    : credentials_(std::move(credentials)),
      exchange_(std::move(exchange)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return std::chrono::system_clock::now(); };
    }
}

std::chrono::system_clock::time_point TokenManager::now() const {
    return clock_();
}

bool TokenManager::is_token_valid() const {
    return token_.has_value() && now() < token_->expiry;
}

Token TokenManager::exchange_credentials() {
    RequestDescriptor descriptor;
    descriptor.method = HttpMethod::Post;
    descriptor.path = PORTAINER_AUTH_PATH;
    descriptor.abs_path = true;
    descriptor.authenticated = false;
    descriptor.body = credentials_.to_json();

    Outcome outcome = Outcome::empty();
    try {
        outcome = exchange_(descriptor);
    } catch (const ConnectionError& e) {
        throw TokenRefreshError("Credential exchange failed: " + std::string(e.what()));
    } catch (const ValidationError& e) {
        throw TokenRefreshError("Token refresh returned an unreadable payload: " + std::string(e.what()));
    }

    if (!outcome.ok()) {
        throw TokenRefreshError(
            "Token refresh failed: " + std::to_string(outcome.status_code()),
            outcome.status_code(),
            outcome.message()
        );
    }

    if (!outcome.is_json()) {
        throw TokenRefreshError("Token refresh returned no JSON payload");
    }

    const json& data = outcome.payload();
    if (!data.is_object() || !data.contains("jwt") || !data["jwt"].is_string()) {
        throw TokenRefreshError("Token refresh response has no jwt field");
    }

    Token token;
    token.value = data["jwt"].get<std::string>();
    token.expiry = now() + PORTAINER_TOKEN_LIFETIME;
    return token;
}

std::string TokenManager::ensure_fresh_token() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_token_valid()) {
        logger()->info("Token needs to be refreshed");
        token_ = exchange_credentials();
    }

    return token_->value;
}

void TokenManager::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    token_.reset();
}

bool TokenManager::has_valid_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_token_valid();
}

std::optional<std::chrono::system_clock::time_point> TokenManager::expiry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!token_.has_value()) {
        return std::nullopt;
    }
    return token_->expiry;
}

} // namespace portainer
