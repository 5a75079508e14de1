/**
 * @file auth.hpp
 * @brief Bearer token management for the Portainer C++ SDK
 */

#ifndef PORTAINER_AUTH_HPP
#define PORTAINER_AUTH_HPP

#include "types.hpp"
#include "outcome.hpp"
#include <functional>
#include <mutex>

namespace portainer {

/**
 * Holds credentials and the current JWT, refreshing it on demand
 */
class TokenManager {
public:
    /// Performs the unauthenticated credential exchange request.
    using Exchange = std::function<Outcome(const RequestDescriptor&)>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * Create a token manager
     * @param credentials Username and password
     * @param exchange Sends the POST /api/auth request
     * @param clock Time source, system clock when empty
     */
    TokenManager(Credentials credentials, Exchange exchange, Clock clock = nullptr);

    /**
     * Ensure we have a token that has not expired
     * @return Bearer token
     */
    std::string ensure_fresh_token();

    /**
     * Drop the current token so the next call exchanges credentials again
     */
    void invalidate();

    bool has_valid_token() const;
    std::optional<std::chrono::system_clock::time_point> expiry() const;

    const std::string& username() const { return credentials_.username; }

private:
    Token exchange_credentials();
    bool is_token_valid() const;
    std::chrono::system_clock::time_point now() const;

    const Credentials credentials_;
    Exchange exchange_;
    Clock clock_;
    std::optional<Token> token_;
    mutable std::mutex mutex_;
};

} // namespace portainer

#endif // PORTAINER_AUTH_HPP
