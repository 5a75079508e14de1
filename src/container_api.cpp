/**
 * @file container_api.cpp
 * @brief Docker container endpoints implementation for the Portainer C++ SDK
 */

#include "portainer/container_api.hpp"
#include "portainer/errors.hpp"
#include "portainer/query.hpp"

namespace portainer {

std::string resolve_resource(const ResourceRef& resource) {
    std::string id = resource.id();
    if (id.empty()) {
        throw NullResourceError();
    }
    return id;
}

ContainerApi::ContainerApi(std::shared_ptr<APIClient> api)
    : api_(std::move(api)) {
    if (!api_) {
        throw ConfigurationError("ContainerApi requires an API client");
    }
}

std::string ContainerApi::container_path(const std::string& id, const std::string& action) {
    std::string path = "/containers/" + id;
    if (!action.empty()) {
        path += "/" + action;
    }
    return path;
}

QueryParams ContainerApi::list_query(const ContainerListOptions& options) {
    QueryParams params = {
        {"limit", options.latest ? 1 : options.limit},
        {"all", options.all ? 1 : 0},
        {"size", options.size ? 1 : 0},
        {"trunc_cmd", options.trunc ? 1 : 0},
        {"since", options.since.has_value() ? json(*options.since) : json(nullptr)},
        {"before", options.before.has_value() ? json(*options.before) : json(nullptr)}
    };

    if (options.filters.has_value() && !options.filters->empty()) {
        params["filters"] = convert_filters(*options.filters);
    }

    return params;
}

QueryParams ContainerApi::kill_query(const std::optional<Signal>& signal) {
    QueryParams params;
    if (signal.has_value()) {
        params["signal"] = signal_param(*signal);
    }
    return params;
}

Outcome ContainerApi::containers(const ContainerListOptions& options) {
    Outcome outcome = api_->get("/containers/json", list_query(options));

    if (!outcome.is_json() || !outcome.payload().is_array()) {
        return outcome;
    }

    json& entries = outcome.payload();
    if (options.quiet) {
        json ids = json::array();
        for (const auto& entry : entries) {
            ids.push_back(json{{"Id", ResourceRef(entry).id()}});
        }
        return Outcome::json_payload(ids);
    }

    if (options.trunc) {
        for (auto& entry : entries) {
            if (entry.is_object() && entry.contains("Id") && entry["Id"].is_string()) {
                entry["Id"] = entry["Id"].get<std::string>().substr(0, DOCKER_SHORT_ID_LENGTH);
            }
        }
    }

    return outcome;
}

Outcome ContainerApi::inspect_container(const ResourceRef& container) {
    return api_->get(container_path(resolve_resource(container), "json"));
}

Outcome ContainerApi::kill(const ResourceRef& container, const std::optional<Signal>& signal) {
    return api_->post(container_path(resolve_resource(container), "kill"), kill_query(signal));
}

Outcome ContainerApi::pause(const ResourceRef& container) {
    return api_->post(container_path(resolve_resource(container), "pause"));
}

Outcome ContainerApi::unpause(const ResourceRef& container) {
    return api_->post(container_path(resolve_resource(container), "unpause"));
}

Outcome ContainerApi::restart(const ResourceRef& container, int timeout) {
    return api_->post(container_path(resolve_resource(container), "restart"), {{"t", timeout}});
}

Outcome ContainerApi::start(const ResourceRef& container, const json& options) {
    std::string id = resolve_resource(container);
    if (!options.is_null() && !options.empty()) {
        throw ValidationError(
            "Providing configuration in start() is no longer supported. "
            "Use the host config when creating the container instead.",
            "options",
            options.dump()
        );
    }
    return api_->post(container_path(id, "start"));
}

Outcome ContainerApi::stats(const ResourceRef& container) {
    return api_->get(container_path(resolve_resource(container), "stats"), {{"stream", "false"}});
}

Outcome ContainerApi::stop(const ResourceRef& container, std::optional<int> timeout) {
    QueryParams params = {{"t", timeout.has_value() ? json(*timeout) : json(nullptr)}};
    return api_->post(container_path(resolve_resource(container), "stop"), params);
}

Outcome ContainerApi::top(const ResourceRef& container, const std::optional<std::string>& ps_args) {
    QueryParams params;
    if (ps_args.has_value()) {
        params["ps_args"] = *ps_args;
    }
    return api_->get(container_path(resolve_resource(container), "top"), params);
}

Outcome ContainerApi::logs(const ResourceRef& container, const ContainerLogsOptions& options) {
    QueryParams params = {
        {"stdout", options.stdout_stream},
        {"stderr", options.stderr_stream},
        {"timestamps", options.timestamps},
        {"follow", false},
        {"tail", options.tail.value_or("all")},
        {"since", options.since.has_value() ? json(*options.since) : json(nullptr)},
        {"until", options.until.has_value() ? json(*options.until) : json(nullptr)}
    };
    return api_->get(container_path(resolve_resource(container), "logs"), params);
}

Outcome ContainerApi::remove(const ResourceRef& container, const ContainerRemoveOptions& options) {
    QueryParams params = {
        {"v", options.v},
        {"link", options.link},
        {"force", options.force}
    };
    return api_->del(container_path(resolve_resource(container), ""), params);
}

} // namespace portainer
