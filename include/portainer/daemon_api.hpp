/**
 * @file daemon_api.hpp
 * @brief Docker daemon endpoints proxied by Portainer
 */

#ifndef PORTAINER_DAEMON_API_HPP
#define PORTAINER_DAEMON_API_HPP

#include "api_client.hpp"
#include "outcome.hpp"
#include <memory>

namespace portainer {

class DaemonApi {
public:
    explicit DaemonApi(std::shared_ptr<APIClient> api);

    /**
     * Version information of the endpoint's Docker daemon
     */
    Outcome version();

    /**
     * Health check of the endpoint's Docker daemon ("OK" on success)
     */
    Outcome ping();

private:
    std::shared_ptr<APIClient> api_;
};

} // namespace portainer

#endif // PORTAINER_DAEMON_API_HPP
