/**
 * @file client.hpp
 * @brief Main client for the Portainer C++ SDK
 */

#ifndef PORTAINER_CLIENT_HPP
#define PORTAINER_CLIENT_HPP

#include "types.hpp"
#include "api_client.hpp"
#include "container_api.hpp"
#include "containers.hpp"
#include "daemon_api.hpp"
#include <memory>

namespace portainer {

/**
 * A client for communicating with a Portainer server.
 *
 * Example:
 *
 *     ClientOptions options;
 *     options.host = "localhost";
 *     options.port = 9000;
 *     options.username = "admin";
 *     options.password = "secret";
 *     PortainerClient client(options);
 *     for (auto& container : client.containers().list()) { ... }
 */
class PortainerClient {
public:
    /**
     * Create a client
     * @param options Configuration options
     * @param transport HTTP transport, a CurlTransport when null
     * @throws ConfigurationError when options are invalid
     */
    explicit PortainerClient(
        const ClientOptions& options,
        std::shared_ptr<HttpTransport> transport = nullptr
    );

    ~PortainerClient();

    PortainerClient(const PortainerClient&) = delete;
    PortainerClient& operator=(const PortainerClient&) = delete;

    /**
     * Low-level API client
     */
    APIClient& api() { return *api_; }

    /**
     * Container endpoints
     */
    ContainerApi& container_api() { return *container_api_; }

    /**
     * Object for managing containers on the server
     */
    ContainerCollection containers() const;

    /**
     * Docker daemon version of the endpoint
     */
    Outcome version();

    /**
     * Docker daemon health check of the endpoint
     */
    Outcome ping();

    /**
     * Release the HTTP transport. Safe to call more than once.
     */
    void close();

    bool closed() const;

private:
    std::shared_ptr<APIClient> api_;
    std::shared_ptr<ContainerApi> container_api_;
    DaemonApi daemon_api_;
};

} // namespace portainer

#endif // PORTAINER_CLIENT_HPP
