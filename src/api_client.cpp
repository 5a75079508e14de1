/**
 * @file api_client.cpp
 * @brief Authenticated request core implementation for the Portainer C++ SDK
 */

#include "portainer/api_client.hpp"
#include "portainer/errors.hpp"
#include "portainer/logging.hpp"
#include "portainer/query.hpp"

namespace portainer {

static constexpr const char* JSON_CONTENT_TYPE = "application/json";

APIClient::APIClient(
    const ClientOptions& options,
    std::shared_ptr<HttpTransport> transport,
    TokenManager::Clock clock
) : options_(options),
    transport_(transport ? std::move(transport) : std::make_shared<CurlTransport>()),
    token_manager_(
        Credentials{options.username, options.password},
        [this](const RequestDescriptor& descriptor) { return send(descriptor, std::nullopt); },
        std::move(clock)
    ),
    closed_(false) {
}

APIClient::~APIClient() {
    close();
}

std::string APIClient::build_path(const std::string& path, bool abs_path) const {
    if (abs_path) {
        return std::string(PORTAINER_API_ROOT) + path;
    }
    return std::string(PORTAINER_API_ROOT) + "/endpoints/" +
           std::to_string(options_.endpoint_id) + "/docker" + path;
}

std::string APIClient::build_url(const RequestDescriptor& descriptor) const {
    std::string url = options_.base_url() + build_path(descriptor.path, descriptor.abs_path);
    std::string query = encode_query(descriptor.query);
    if (!query.empty()) {
        url += "?" + query;
    }
    return url;
}

Outcome APIClient::request(const RequestDescriptor& descriptor) {
    if (closed()) {
        throw ConfigurationError("Client is closed");
    }

    std::optional<std::string> token;
    if (descriptor.authenticated) {
        token = token_manager_.ensure_fresh_token();
    }

    return send(descriptor, token);
}

Outcome APIClient::get(const std::string& path, const QueryParams& query) {
    RequestDescriptor descriptor;
    descriptor.method = HttpMethod::Get;
    descriptor.path = path;
    descriptor.query = query;
    return request(descriptor);
}

Outcome APIClient::post(const std::string& path, const QueryParams& query, const std::optional<json>& body) {
    RequestDescriptor descriptor;
    descriptor.method = HttpMethod::Post;
    descriptor.path = path;
    descriptor.query = query;
    descriptor.body = body;
    return request(descriptor);
}

Outcome APIClient::del(const std::string& path, const QueryParams& query) {
    RequestDescriptor descriptor;
    descriptor.method = HttpMethod::Delete;
    descriptor.path = path;
    descriptor.query = query;
    return request(descriptor);
}

Outcome APIClient::send(const RequestDescriptor& descriptor, const std::optional<std::string>& token) {
    HttpRequest http_request;
    http_request.method = descriptor.method;
    http_request.url = build_url(descriptor);
    http_request.timeout = options_.timeout;
    http_request.verify_tls = options_.verify_tls;
    http_request.headers["Accept"] = JSON_CONTENT_TYPE;

    if (token.has_value()) {
        http_request.headers["Authorization"] = "Bearer " + *token;
    }

    if (descriptor.body.has_value()) {
        http_request.headers["Content-Type"] = JSON_CONTENT_TYPE;
        http_request.body = descriptor.body->dump();
    }

    std::string path = build_path(descriptor.path, descriptor.abs_path);
    HttpResponse response = transport_->perform(http_request);

    logger()->debug("{} {} -> {}", method_to_string(descriptor.method), path, response.status_code);

    return classify(response, path);
}

Outcome APIClient::classify(const HttpResponse& response, const std::string& path) const {
    if (response.status_code >= 400 && response.status_code <= 599) {
        return Outcome::failure(response.status_code, response.body);
    }

    if (response.status_code == 204) {
        return Outcome::empty();
    }

    std::string content_type = response.header("Content-Type");
    if (content_type.find(JSON_CONTENT_TYPE) != std::string::npos) {
        if (response.body.empty()) {
            return Outcome::empty();
        }
        try {
            return Outcome::json_payload(json::parse(response.body));
        } catch (const json::parse_error& e) {
            throw ValidationError("Invalid JSON in response from " + path + ": " + e.what(), "body");
        }
    }

    return Outcome::text_payload(response.body);
}

void APIClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    transport_->close();
}

bool APIClient::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace portainer
