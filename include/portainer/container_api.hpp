/**
 * @file container_api.hpp
 * @brief Docker container endpoints proxied by Portainer
 */

#ifndef PORTAINER_CONTAINER_API_HPP
#define PORTAINER_CONTAINER_API_HPP

#include "types.hpp"
#include "api_client.hpp"
#include "outcome.hpp"
#include <memory>

namespace portainer {

/**
 * Resolve a resource reference to its identifier
 * @throws NullResourceError when no identifier is present
 */
std::string resolve_resource(const ResourceRef& resource);

/**
 * Container verbs. Every call is authenticated and returns the Outcome of
 * the underlying request unchanged.
 */
class ContainerApi {
public:
    explicit ContainerApi(std::shared_ptr<APIClient> api);

    /**
     * List containers. Similar to the ``docker ps`` command.
     * @param options Listing options
     * @return JSON array of container summaries on success
     */
    Outcome containers(const ContainerListOptions& options = {});

    /**
     * Low-level details of a container, like ``docker inspect``
     */
    Outcome inspect_container(const ResourceRef& container);

    /**
     * Kill a container or send it a signal
     * @param signal Signal number or name, SIGKILL when absent
     */
    Outcome kill(const ResourceRef& container, const std::optional<Signal>& signal = std::nullopt);

    Outcome pause(const ResourceRef& container);
    Outcome unpause(const ResourceRef& container);

    /**
     * Restart a container
     * @param timeout Seconds to wait for stop before killing
     */
    Outcome restart(const ResourceRef& container, int timeout = DOCKER_DEFAULT_STOP_TIMEOUT);

    /**
     * Start a container
     * @param options Must be empty; host configuration belongs to container creation
     * @throws ValidationError when options are given
     */
    Outcome start(const ResourceRef& container, const json& options = json::object());

    /**
     * Single statistics snapshot (stream=false)
     */
    Outcome stats(const ResourceRef& container);

    /**
     * Stop a container
     * @param timeout Seconds before SIGKILL; the container's StopTimeout when absent
     */
    Outcome stop(const ResourceRef& container, std::optional<int> timeout = DOCKER_DEFAULT_STOP_TIMEOUT);

    /**
     * Running processes of a container
     * @param ps_args Arguments passed to ps, e.g. "aux"
     */
    Outcome top(const ResourceRef& container, const std::optional<std::string>& ps_args = std::nullopt);

    /**
     * Log snapshot of a container (never follows)
     */
    Outcome logs(const ResourceRef& container, const ContainerLogsOptions& options = {});

    Outcome remove(const ResourceRef& container, const ContainerRemoveOptions& options = {});

    static QueryParams list_query(const ContainerListOptions& options);
    static QueryParams kill_query(const std::optional<Signal>& signal);

private:
    static std::string container_path(const std::string& id, const std::string& action);

    std::shared_ptr<APIClient> api_;
};

} // namespace portainer

#endif // PORTAINER_CONTAINER_API_HPP
