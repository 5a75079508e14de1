/**
 * @file client.cpp
 * @brief Client implementation for the Portainer C++ SDK
 */

#include "portainer/client.hpp"
#include "portainer/logging.hpp"

namespace portainer {

static std::shared_ptr<APIClient> make_api_client(
    const ClientOptions& options,
    std::shared_ptr<HttpTransport> transport
) {
    options.validate();
    set_log_level(options.log_level);
    return std::make_shared<APIClient>(options, std::move(transport));
}

PortainerClient::PortainerClient(
    const ClientOptions& options,
    std::shared_ptr<HttpTransport> transport
) : api_(make_api_client(options, std::move(transport))),
    container_api_(std::make_shared<ContainerApi>(api_)),
    daemon_api_(api_) {
    logger()->debug("Portainer client for {} (endpoint {})", options.base_url(), options.endpoint_id);
}

PortainerClient::~PortainerClient() {
    close();
}

ContainerCollection PortainerClient::containers() const {
    return ContainerCollection(container_api_);
}

Outcome PortainerClient::version() {
    return daemon_api_.version();
}

Outcome PortainerClient::ping() {
    return daemon_api_.ping();
}

void PortainerClient::close() {
    api_->close();
}

bool PortainerClient::closed() const {
    return api_->closed();
}

} // namespace portainer
