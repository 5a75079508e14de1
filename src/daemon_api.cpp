/**
 * @file daemon_api.cpp
 * @brief Docker daemon endpoints implementation for the Portainer C++ SDK
 */

#include "portainer/daemon_api.hpp"
#include "portainer/errors.hpp"

namespace portainer {

DaemonApi::DaemonApi(std::shared_ptr<APIClient> api)
    : api_(std::move(api)) {
    if (!api_) {
        throw ConfigurationError("DaemonApi requires an API client");
    }
}

Outcome DaemonApi::version() {
    return api_->get("/version");
}

Outcome DaemonApi::ping() {
    return api_->get("/_ping");
}

} // namespace portainer
