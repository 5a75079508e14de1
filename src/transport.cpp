/**
 * @file transport.cpp
 * @brief libcurl transport implementation for the Portainer C++ SDK
 */

#include "portainer/transport.hpp"
#include "portainer/errors.hpp"
#include "portainer/logging.hpp"
#include <algorithm>
#include <cctype>
#include <memory>

namespace portainer {

static std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool HeaderNameLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return "";
    }
    return it->second;
}

CurlTransport::CurlTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    handle_ = curl_easy_init();
    if (!handle_) {
        curl_global_cleanup();
        throw ConnectionError("Failed to initialize CURL");
    }
}

CurlTransport::~CurlTransport() {
    close();
    curl_global_cleanup();
}

void CurlTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        curl_easy_cleanup(handle_);
        handle_ = nullptr;
    }
}

bool CurlTransport::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ == nullptr;
}

size_t CurlTransport::write_cb(char* data, size_t size, size_t n_items, void* userdata) {
    auto* response = static_cast<HttpResponse*>(userdata);
    response->body.append(data, size * n_items);
    return size * n_items;
}

size_t CurlTransport::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
    auto* response = static_cast<HttpResponse*>(userdata);
    const size_t bytes = size * n_items;
    std::string line(buffer, bytes);

    // A new status line starts a new header block (redirects, 100 Continue).
    if (line.rfind("HTTP/", 0) == 0) {
        response->headers.clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        response->headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    return bytes;
}

void CurlTransport::reset_handle() {
    // Keeps live connections and the DNS cache.
    curl_easy_reset(handle_);
    error_buf_[0] = '\0';
    curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, error_buf_.data());
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L);
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!handle_) {
        throw ConnectionError("Transport is closed", request.url);
    }

    reset_handle();

    HttpResponse response;

    curl_easy_setopt(handle_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &CurlTransport::write_cb);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(handle_, CURLOPT_HEADERFUNCTION, &CurlTransport::header_cb);
    curl_easy_setopt(handle_, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout * 1000));
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);

    const std::string body = request.body.value_or("");
    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(handle_, CURLOPT_POST, 1L);
            curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
            curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, body.c_str());
            break;
        default:
            curl_easy_setopt(handle_, CURLOPT_CUSTOMREQUEST, method_to_string(request.method).c_str());
            if (request.body.has_value()) {
                curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
                curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, body.c_str());
            }
            break;
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr, &curl_slist_free_all);
    for (const auto& [key, value] : request.headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), (key + ": " + value).c_str());
        if (!appended) {
            throw ConnectionError("Failed to build request headers", request.url);
        }
        header_list.release();
        header_list.reset(appended);
    }
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, header_list.get());

    CURLcode res = curl_easy_perform(handle_);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        logger()->error("Timeout after {}s: {} {}", request.timeout, method_to_string(request.method), request.url);
        throw TimeoutError(request.url, request.timeout);
    }

    if (res != CURLE_OK) {
        std::string detail = error_buf_[0] != '\0' ? std::string(error_buf_.data()) : curl_easy_strerror(res);
        logger()->error("Transport failure: {} {}: {}", method_to_string(request.method), request.url, detail);
        throw ConnectionError("Error occurred while communicating with Docker: " + detail, request.url);
    }

    long http_code = 0;
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);

    return response;
}

} // namespace portainer
