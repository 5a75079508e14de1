/**
 * @file api_client.hpp
 * @brief Authenticated request core for the Portainer C++ SDK
 */

#ifndef PORTAINER_API_CLIENT_HPP
#define PORTAINER_API_CLIENT_HPP

#include "types.hpp"
#include "auth.hpp"
#include "outcome.hpp"
#include "transport.hpp"
#include <memory>
#include <mutex>

namespace portainer {

/**
 * Builds, authenticates, dispatches and classifies Portainer API requests.
 *
 * Non-absolute paths are routed through the Docker proxy of the configured
 * endpoint: /api/endpoints/{endpoint_id}/docker{path}. Exactly one attempt
 * is made per request.
 */
class APIClient {
public:
    /**
     * Create an API client
     * @param options Client configuration
     * @param transport HTTP transport, a CurlTransport when null
     * @param clock Time source for token expiry, system clock when empty
     */
    explicit APIClient(
        const ClientOptions& options,
        std::shared_ptr<HttpTransport> transport = nullptr,
        TokenManager::Clock clock = nullptr
    );

    ~APIClient();

    APIClient(const APIClient&) = delete;
    APIClient& operator=(const APIClient&) = delete;

    /**
     * Perform a request
     * @param descriptor Request description
     * @return Classified outcome; 4xx/5xx responses are Failure outcomes
     * @throws TimeoutError, ConnectionError when no response was received
     */
    Outcome request(const RequestDescriptor& descriptor);

    /**
     * Authenticated GET of an endpoint-scoped path
     */
    Outcome get(const std::string& path, const QueryParams& query = {});

    /**
     * Authenticated POST of an endpoint-scoped path
     */
    Outcome post(
        const std::string& path,
        const QueryParams& query = {},
        const std::optional<json>& body = std::nullopt
    );

    /**
     * Authenticated DELETE of an endpoint-scoped path
     */
    Outcome del(const std::string& path, const QueryParams& query = {});

    /**
     * Effective request path
     * @param path Path relative to the API root or the endpoint Docker proxy
     * @param abs_path True when path is relative to the API root
     */
    std::string build_path(const std::string& path, bool abs_path) const;

    /**
     * Full URL including the encoded query string
     */
    std::string build_url(const RequestDescriptor& descriptor) const;

    TokenManager& token_manager() { return token_manager_; }
    const ClientOptions& options() const { return options_; }
    int endpoint_id() const { return options_.endpoint_id; }

    /**
     * Release the transport. Safe to call more than once.
     */
    void close();
    bool closed() const;

private:
    Outcome send(const RequestDescriptor& descriptor, const std::optional<std::string>& token);
    Outcome classify(const HttpResponse& response, const std::string& path) const;

    const ClientOptions options_;
    std::shared_ptr<HttpTransport> transport_;
    TokenManager token_manager_;
    bool closed_;
    mutable std::mutex mutex_;
};

} // namespace portainer

#endif // PORTAINER_API_CLIENT_HPP
