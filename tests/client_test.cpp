#include <catch2/catch.hpp>
#include "fake_transport.hpp"
#include <cstdlib>

using namespace portainer;
using namespace portainer::testing;

namespace {

const char* const PORTAINER_ENV_KEYS[] = {
    "PORTAINER_HOST", "PORTAINER_PORT", "PORTAINER_SCHEME", "PORTAINER_ENDPOINT_ID",
    "PORTAINER_USERNAME", "PORTAINER_PASSWORD", "PORTAINER_TIMEOUT",
    "PORTAINER_VERIFY_TLS", "PORTAINER_LOG_LEVEL"
};

struct ScopedEnvironment {
    ScopedEnvironment() { clear(); }
    ~ScopedEnvironment() { clear(); }

    void set(const char* key, const char* value) { setenv(key, value, 1); }

    static void clear() {
        for (const char* key : PORTAINER_ENV_KEYS) {
            unsetenv(key);
        }
    }
};

} // namespace

//==============================================================================
TEST_CASE("ClientOptions validation", "[client]") {
    ClientOptions options = test_options();
    REQUIRE_NOTHROW(options.validate());

    SECTION("host is required") {
        options.host.clear();
        try {
            options.validate();
            FAIL("expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.config_key() == "host");
        }
    }

    SECTION("scheme must be http or https") {
        options.scheme = "ftp";
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("port must be in range") {
        options.port = 70000;
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("endpoint id must be positive") {
        options.endpoint_id = 0;
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("timeout must be positive") {
        options.timeout = 0;
        REQUIRE_THROWS_AS(options.validate(), ConfigurationError);
    }

    SECTION("the client refuses invalid options before any I/O") {
        auto transport = std::make_shared<FakeTransport>();
        options.host.clear();
        REQUIRE_THROWS_AS(PortainerClient(options, transport), ConfigurationError);
        REQUIRE(transport->requests().empty());
    }
}

//==============================================================================
TEST_CASE("ClientOptions from environment", "[client]") {
    ScopedEnvironment env;

    SECTION("defaults") {
        ClientOptions options = ClientOptions::from_env();
        REQUIRE(options.scheme == "http");
        REQUIRE(options.endpoint_id == 1);
        REQUIRE(options.timeout == Approx(60.0));
        REQUIRE(options.verify_tls);
        REQUIRE_FALSE(options.port.has_value());
    }

    SECTION("values are read") {
        env.set("PORTAINER_HOST", "portainer.example");
        env.set("PORTAINER_PORT", "9443");
        env.set("PORTAINER_SCHEME", "https");
        env.set("PORTAINER_ENDPOINT_ID", "2");
        env.set("PORTAINER_USERNAME", "ops");
        env.set("PORTAINER_PASSWORD", "hunter2");
        env.set("PORTAINER_TIMEOUT", "15.5");
        env.set("PORTAINER_VERIFY_TLS", "false");
        env.set("PORTAINER_LOG_LEVEL", "debug");

        ClientOptions options = ClientOptions::from_env();
        REQUIRE(options.host == "portainer.example");
        REQUIRE(options.port == std::optional<int>(9443));
        REQUIRE(options.endpoint_id == 2);
        REQUIRE(options.username == "ops");
        REQUIRE(options.password == "hunter2");
        REQUIRE(options.timeout == Approx(15.5));
        REQUIRE_FALSE(options.verify_tls);
        REQUIRE(options.log_level == LogLevel::Debug);
        REQUIRE(options.base_url() == "https://portainer.example:9443");
    }

    SECTION("malformed numbers are configuration errors") {
        env.set("PORTAINER_PORT", "90x");
        try {
            ClientOptions::from_env();
            FAIL("expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.config_key() == "PORTAINER_PORT");
        }
    }
}

//==============================================================================
TEST_CASE("PortainerClient", "[client]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->route(HttpMethod::Get, endpoint_path("/version"), json_response(200, {{"ApiVersion", "1.43"}}));
    transport->route(HttpMethod::Get, endpoint_path("/_ping"), text_response(200, "OK"));
    PortainerClient client(test_options(), transport);

    SECTION("version and ping go through the endpoint proxy") {
        Outcome version = client.version();
        REQUIRE(version.payload()["ApiVersion"] == "1.43");

        Outcome ping = client.ping();
        REQUIRE(ping.text() == "OK");
        REQUIRE(transport->auth_count() == 1);
    }

    SECTION("all components share one session") {
        client.version();
        client.container_api().pause("abc");
        transport->route(HttpMethod::Get, endpoint_path("/containers/json"), json_response(200, json::array()));
        ContainerCollectionListOptions sparse;
        sparse.sparse = true;
        REQUIRE(client.containers().list(sparse).empty());
        REQUIRE(transport->auth_count() == 1);
    }

    SECTION("close is idempotent and ends the session") {
        client.close();
        client.close();
        REQUIRE(client.closed());
        REQUIRE(transport->close_count() == 1);
        REQUIRE_THROWS_AS(client.version(), ConfigurationError);
    }
}
