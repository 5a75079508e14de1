/**
 * @file containers.cpp
 * @brief Container model and collection implementation for the Portainer C++ SDK
 */

#include "portainer/containers.hpp"
#include "portainer/errors.hpp"
#include "portainer/logging.hpp"

namespace portainer {

[[noreturn]] static void raise_for_failure(const Outcome& outcome, const std::string& resource, const std::string& endpoint) {
    if (outcome.is_not_found()) {
        throw NotFoundError("No such container: " + resource, resource, outcome.message());
    }
    throw APIError("API error: " + outcome.message(), outcome.status_code(), outcome.message(), endpoint);
}

static json inspect_payload(ContainerApi& api, const std::string& id) {
    Outcome outcome = api.inspect_container(id);
    if (!outcome.ok()) {
        raise_for_failure(outcome, id, "/containers/" + id + "/json");
    }
    if (!outcome.is_json() || !outcome.payload().is_object()) {
        throw ValidationError("Unexpected inspect response for container " + id, "container", id);
    }
    return outcome.payload();
}

static std::string string_field(const json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : "";
}

// =============================================================================
// Container
// =============================================================================

Container::Container(json attrs, std::shared_ptr<ContainerApi> api)
    : attrs_(std::move(attrs)), api_(std::move(api)) {
}

std::string Container::id() const {
    return ResourceRef(attrs_).id();
}

std::string Container::short_id() const {
    return id().substr(0, DOCKER_SHORT_ID_LENGTH);
}

std::optional<std::string> Container::name() const {
    std::string raw;
    if (attrs_.contains("Name") && attrs_["Name"].is_string()) {
        raw = attrs_["Name"].get<std::string>();
    } else if (attrs_.contains("Names") && attrs_["Names"].is_array() &&
               !attrs_["Names"].empty() && attrs_["Names"][0].is_string()) {
        raw = attrs_["Names"][0].get<std::string>();
    } else {
        return std::nullopt;
    }

    size_t start = raw.find_first_not_of('/');
    return start == std::string::npos ? std::string() : raw.substr(start);
}

std::string Container::status() const {
    if (attrs_.contains("State") && attrs_["State"].is_object()) {
        return string_field(attrs_["State"], "Status");
    }
    return string_field(attrs_, "Status");
}

std::optional<json> Container::state() const {
    if (attrs_.contains("State") && attrs_["State"].is_object()) {
        return attrs_["State"];
    }
    return std::nullopt;
}

json Container::labels() const {
    if (!attrs_.contains("Config") || !attrs_["Config"].is_object()) {
        throw ModelError("Label data is not available for sparse objects. Call reload() to retrieve all information");
    }
    const json& labels = attrs_["Config"].value("Labels", json());
    return labels.is_object() ? labels : json::object();
}

json Container::ports() const {
    if (!attrs_.is_object() || !attrs_.contains("NetworkSettings") || !attrs_["NetworkSettings"].is_object()) {
        return json::object();
    }
    const json& settings = attrs_["NetworkSettings"];
    const json& ports = settings.value("Ports", json::object());
    return ports.is_object() ? ports : json::object();
}

std::optional<std::string> Container::started_at() const {
    std::optional<json> current = state();
    if (!current.has_value() || !current->contains("StartedAt") || !(*current)["StartedAt"].is_string()) {
        return std::nullopt;
    }
    return (*current)["StartedAt"].get<std::string>();
}

std::optional<std::string> Container::image_id() const {
    for (const char* key : {"ImageID", "Image"}) {
        if (attrs_.contains(key) && attrs_[key].is_string()) {
            return attrs_[key].get<std::string>();
        }
    }
    return std::nullopt;
}

void Container::reload() {
    attrs_ = inspect_payload(*api_, resolve_resource(attrs_));
}

Outcome Container::kill(const std::optional<Signal>& signal) {
    return api_->kill(id(), signal);
}

Outcome Container::pause() {
    return api_->pause(id());
}

Outcome Container::unpause() {
    return api_->unpause(id());
}

Outcome Container::restart(int timeout) {
    return api_->restart(id(), timeout);
}

Outcome Container::start() {
    return api_->start(id());
}

Outcome Container::stats() {
    return api_->stats(id());
}

Outcome Container::stop(std::optional<int> timeout) {
    return api_->stop(id(), timeout);
}

Outcome Container::top(const std::optional<std::string>& ps_args) {
    return api_->top(id(), ps_args);
}

Outcome Container::logs(const ContainerLogsOptions& options) {
    return api_->logs(id(), options);
}

Outcome Container::remove(const ContainerRemoveOptions& options) {
    return api_->remove(id(), options);
}

// =============================================================================
// ContainerCollection
// =============================================================================

ContainerCollection::ContainerCollection(std::shared_ptr<ContainerApi> api)
    : api_(std::move(api)) {
    if (!api_) {
        throw ConfigurationError("ContainerCollection requires a container API");
    }
}

Container ContainerCollection::prepare_model(json attrs) const {
    return Container(std::move(attrs), api_);
}

Container ContainerCollection::get(const ResourceRef& container) {
    return prepare_model(inspect_payload(*api_, resolve_resource(container)));
}

std::vector<Container> ContainerCollection::list(const ContainerCollectionListOptions& options) {
    ContainerListOptions query;
    query.all = options.all;
    query.before = options.before;
    query.filters = options.filters;
    query.limit = options.limit;
    query.since = options.since;

    Outcome outcome = api_->containers(query);
    if (!outcome.ok()) {
        throw APIError("API error: " + outcome.message(), outcome.status_code(), outcome.message(), "/containers/json");
    }
    if (!outcome.is_json() || !outcome.payload().is_array()) {
        throw ValidationError("Unexpected container list response", "containers");
    }

    std::vector<Container> containers;
    for (const auto& summary : outcome.payload()) {
        if (options.sparse) {
            containers.push_back(prepare_model(summary));
            continue;
        }

        try {
            containers.push_back(get(summary));
        } catch (const NotFoundError& e) {
            // A container may have been removed while iterating.
            if (!options.ignore_removed) {
                throw;
            }
            logger()->debug("Skipping removed container {}", e.resource());
        }
    }

    return containers;
}

} // namespace portainer
