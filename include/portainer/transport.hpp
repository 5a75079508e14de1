/**
 * @file transport.hpp
 * @brief HTTP transport used by the Portainer C++ SDK
 */

#ifndef PORTAINER_TRANSPORT_HPP
#define PORTAINER_TRANSPORT_HPP

#include "types.hpp"
#include <array>
#include <map>
#include <mutex>
#include <string>
#include <curl/curl.h>

namespace portainer {

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
    double timeout = PORTAINER_DEFAULT_TIMEOUT_SECONDS;
    bool verify_tls = true;
};

/// Orders header names ignoring ASCII case.
struct HeaderNameLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using ResponseHeaders = std::map<std::string, std::string, HeaderNameLess>;

struct HttpResponse {
    int status_code = 0;
    ResponseHeaders headers;
    std::string body;

    /**
     * Look up a response header, ignoring case
     * @return Header value or empty string
     */
    std::string header(const std::string& name) const;
};

/**
 * Performs one HTTP round trip.
 *
 * Implementations throw TimeoutError or ConnectionError when no response
 * was received; any status code received is returned as a response.
 */
class HttpTransport {
public:
    HttpTransport() = default;
    virtual ~HttpTransport() = default;
    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    virtual HttpResponse perform(const HttpRequest& request) = 0;

    /// Release the underlying connection. Safe to call more than once.
    virtual void close() {}
};

/**
 * libcurl transport holding a single easy handle for connection reuse
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    HttpResponse perform(const HttpRequest& request) override;
    void close() override;

    bool closed() const;

private:
    static size_t write_cb(char* data, size_t size, size_t n_items, void* userdata);
    static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

    void reset_handle();

    CURL* handle_ = nullptr;
    std::array<char, 256> error_buf_{};
    mutable std::mutex mutex_;
};

} // namespace portainer

#endif // PORTAINER_TRANSPORT_HPP
