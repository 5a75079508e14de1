/**
 * @file portainer.hpp
 * @brief Main header for the Portainer C++ SDK
 *
 * C++ client for Docker containers managed by a Portainer server.
 * Provides JWT authentication, the container lifecycle endpoints and a
 * cached container model.
 */

#ifndef PORTAINER_HPP
#define PORTAINER_HPP

#include "portainer/types.hpp"
#include "portainer/errors.hpp"
#include "portainer/logging.hpp"
#include "portainer/outcome.hpp"
#include "portainer/query.hpp"
#include "portainer/transport.hpp"
#include "portainer/auth.hpp"
#include "portainer/api_client.hpp"
#include "portainer/container_api.hpp"
#include "portainer/daemon_api.hpp"
#include "portainer/containers.hpp"
#include "portainer/client.hpp"

namespace portainer {

/// SDK version
constexpr const char* VERSION = "0.1.0";

} // namespace portainer

#endif // PORTAINER_HPP
