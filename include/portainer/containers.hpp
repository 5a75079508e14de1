/**
 * @file containers.hpp
 * @brief Container model and collection for the Portainer C++ SDK
 */

#ifndef PORTAINER_CONTAINERS_HPP
#define PORTAINER_CONTAINERS_HPP

#include "types.hpp"
#include "container_api.hpp"
#include "outcome.hpp"
#include <memory>
#include <vector>

namespace portainer {

/**
 * Local representation of a container.
 *
 * Attributes are a cached snapshot of what the server reported; call
 * reload() to replace them with the current state.
 */
class Container {
public:
    Container(json attrs, std::shared_ptr<ContainerApi> api);

    const json& attrs() const { return attrs_; }

    std::string id() const;
    std::string short_id() const;

    /**
     * Container name without the leading '/'
     */
    std::optional<std::string> name() const;

    /**
     * Status such as "running" or "exited"
     */
    std::string status() const;

    /**
     * Full State object, absent for sparse summaries
     */
    std::optional<json> state() const;

    /**
     * Labels of the container
     * @throws ModelError for sparse objects, call reload() first
     */
    json labels() const;

    json ports() const;
    std::optional<std::string> started_at() const;
    std::optional<std::string> image_id() const;

    /**
     * Fetch the current attributes from the server, replacing the cache
     * @throws NotFoundError if the container no longer exists
     */
    void reload();

    Outcome kill(const std::optional<Signal>& signal = std::nullopt);
    Outcome pause();
    Outcome unpause();
    Outcome restart(int timeout = DOCKER_DEFAULT_STOP_TIMEOUT);
    Outcome start();
    Outcome stats();
    Outcome stop(std::optional<int> timeout = DOCKER_DEFAULT_STOP_TIMEOUT);
    Outcome top(const std::optional<std::string>& ps_args = std::nullopt);
    Outcome logs(const ContainerLogsOptions& options = {});
    Outcome remove(const ContainerRemoveOptions& options = {});

private:
    json attrs_;
    std::shared_ptr<ContainerApi> api_;
};

struct ContainerCollectionListOptions {
    bool all = false;
    std::optional<std::string> before;
    std::optional<Filters> filters;
    int limit = -1;
    std::optional<std::string> since;
    bool sparse = false;
    bool ignore_removed = false;
};

/**
 * Lists and fetches containers of the configured endpoint
 */
class ContainerCollection {
public:
    explicit ContainerCollection(std::shared_ptr<ContainerApi> api);

    /**
     * Get a container by name or ID
     * @throws NotFoundError if the container does not exist
     * @throws APIError if the server returns another error
     */
    Container get(const ResourceRef& container);

    /**
     * List containers. Similar to the ``docker ps`` command.
     *
     * Unless sparse is set, every summary entry is inspected. With
     * ignore_removed, containers removed between the listing and their
     * inspection are skipped.
     */
    std::vector<Container> list(const ContainerCollectionListOptions& options = {});

    Container prepare_model(json attrs) const;

private:
    std::shared_ptr<ContainerApi> api_;
};

} // namespace portainer

#endif // PORTAINER_CONTAINERS_HPP
