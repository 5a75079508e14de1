#include <catch2/catch.hpp>
#include <portainer/transport.hpp>
#include <portainer/errors.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>

using namespace portainer;

namespace {

/// Bound IPv4 socket on 127.0.0.1 with a kernel-assigned port.
int bind_loopback(int& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port = ntohs(addr.sin_port);
    return fd;
}

/**
 * One-connection HTTP server on loopback.
 *
 * Reads the request head, writes the canned reply verbatim and holds the
 * connection until destroyed. An empty reply never answers.
 */
class LoopbackServer {
public:
    explicit LoopbackServer(std::string reply) : reply_(std::move(reply)) {
        listen_fd_ = bind_loopback(port_);
        REQUIRE(::listen(listen_fd_, 4) == 0);
        worker_ = std::thread([this]() { serve(); });
    }

    ~LoopbackServer() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        worker_.join();
    }

    std::string url(const std::string& path = "/") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    void serve() {
        int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }

        if (!reply_.empty()) {
            std::string head;
            char buffer[1024];
            while (head.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) {
                    break;
                }
                head.append(buffer, static_cast<size_t>(n));
            }
            ::send(client, reply_.data(), reply_.size(), MSG_NOSIGNAL);
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return stopping_; });
        ::close(client);
    }

    std::string reply_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

/// Loopback requests must not be routed through a proxy from the environment.
void clear_proxy_environment() {
    for (const char* key : {"http_proxy", "HTTP_PROXY", "https_proxy", "HTTPS_PROXY", "all_proxy", "ALL_PROXY"}) {
        unsetenv(key);
    }
}

HttpRequest get_request(const std::string& url, double timeout = 5.0) {
    HttpRequest request;
    request.method = HttpMethod::Get;
    request.url = url;
    request.headers["Accept"] = "application/json";
    request.timeout = timeout;
    return request;
}

} // namespace

//==============================================================================
TEST_CASE("HttpResponse header lookup ignores case", "[transport]") {
    HttpResponse response;
    response.headers["Content-Type"] = "application/json";
    response.headers["x-request-id"] = "42";

    REQUIRE(response.header("content-type") == "application/json");
    REQUIRE(response.header("CONTENT-TYPE") == "application/json");
    REQUIRE(response.header("X-Request-Id") == "42");
    REQUIRE(response.header("Location").empty());

    response.headers["content-type"] = "text/plain";
    REQUIRE(response.headers.size() == 2);
    REQUIRE(response.header("Content-Type") == "text/plain");
}

//==============================================================================
TEST_CASE("CurlTransport round trip", "[transport]") {
    clear_proxy_environment();
    CurlTransport transport;

    SECTION("status, body and lowercased headers are captured") {
        LoopbackServer server(
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: application/json\r\n"
            "X-Portainer-Trace: abc\r\n"
            "Content-Length: 11\r\n"
            "Connection: close\r\n"
            "\r\n"
            "{\"Id\":\"c1\"}");

        HttpResponse response = transport.perform(get_request(server.url("/api/status")));
        REQUIRE(response.status_code == 200);
        REQUIRE(response.body == "{\"Id\":\"c1\"}");
        REQUIRE(response.headers.count("content-type") == 1);
        REQUIRE(response.headers.begin()->first == "connection");
        REQUIRE(response.header("Content-Type") == "application/json");
        REQUIRE(response.header("x-portainer-trace") == "abc");
    }

    SECTION("an interim status line starts a new header block") {
        LoopbackServer server(
            "HTTP/1.1 100 Continue\r\n"
            "X-Interim: yes\r\n"
            "\r\n"
            "HTTP/1.1 404 Not Found\r\n"
            "Content-Type: text/plain\r\n"
            "Content-Length: 17\r\n"
            "Connection: close\r\n"
            "\r\n"
            "no such container");

        HttpResponse response = transport.perform(get_request(server.url("/api/containers/x/json")));
        REQUIRE(response.status_code == 404);
        REQUIRE(response.body == "no such container");
        REQUIRE(response.header("X-Interim").empty());
        REQUIRE(response.header("Content-Type") == "text/plain");
    }

    SECTION("error statuses are returned, not thrown") {
        LoopbackServer server(
            "HTTP/1.1 500 Internal Server Error\r\n"
            "Content-Length: 4\r\n"
            "Connection: close\r\n"
            "\r\n"
            "boom");

        HttpResponse response = transport.perform(get_request(server.url()));
        REQUIRE(response.status_code == 500);
        REQUIRE(response.body == "boom");
    }
}

//==============================================================================
TEST_CASE("CurlTransport failures", "[transport]") {
    clear_proxy_environment();
    CurlTransport transport;

    SECTION("a refused connection is a ConnectionError, not a timeout") {
        int port = 0;
        int fd = bind_loopback(port);
        ::close(fd);

        std::string url = "http://127.0.0.1:" + std::to_string(port) + "/api/auth";
        try {
            transport.perform(get_request(url));
            FAIL("expected ConnectionError");
        } catch (const TimeoutError&) {
            FAIL("refused connection reported as timeout");
        } catch (const ConnectionError& e) {
            REQUIRE(e.code() == "CONNECTION_ERROR");
            REQUIRE(e.url() == url);
        }
    }

    SECTION("a silent server is a TimeoutError") {
        LoopbackServer server("");
        try {
            transport.perform(get_request(server.url(), 0.2));
            FAIL("expected TimeoutError");
        } catch (const TimeoutError& e) {
            REQUIRE(e.code() == "TIMEOUT_ERROR");
            REQUIRE(e.timeout().has_value());
            REQUIRE(*e.timeout() == Approx(0.2));
            REQUIRE(e.url() == server.url());
        }
    }

    SECTION("a closed transport refuses to perform") {
        transport.close();
        transport.close();
        REQUIRE(transport.closed());
        REQUIRE_THROWS_AS(transport.perform(get_request("http://127.0.0.1:1/")), ConnectionError);
    }
}
