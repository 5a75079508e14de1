#include <catch2/catch.hpp>
#include "fake_transport.hpp"
#include <thread>

using namespace portainer;
using namespace portainer::testing;
using namespace std::chrono_literals;

//==============================================================================
TEST_CASE("Token refresh on demand", "[auth]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->route(HttpMethod::Get, endpoint_path("/containers/json"), json_response(200, json::array()));
    ManualClock clock;
    APIClient api(test_options(), transport, clock.as_clock());

    SECTION("no token yet triggers exactly one exchange") {
        REQUIRE_FALSE(api.token_manager().has_valid_token());
        api.get("/containers/json");
        REQUIRE(transport->auth_count() == 1);
        REQUIRE(api.token_manager().has_valid_token());
    }

    SECTION("a token with future expiry is reused") {
        api.get("/containers/json");
        clock.advance(7h + 58min);
        api.get("/containers/json");
        api.get("/containers/json");
        REQUIRE(transport->auth_count() == 1);
    }

    SECTION("an expired token triggers exactly one more exchange") {
        api.get("/containers/json");
        clock.advance(8h);
        api.get("/containers/json");
        REQUIRE(transport->auth_count() == 2);
        api.get("/containers/json");
        REQUIRE(transport->auth_count() == 2);
    }

    SECTION("a token is not used at its expiry instant") {
        api.get("/containers/json");
        clock.advance(7h + 59min);
        api.get("/containers/json");
        REQUIRE(transport->auth_count() == 2);
    }

    SECTION("expiry is set to 7h59m after the exchange") {
        api.token_manager().ensure_fresh_token();
        auto expiry = api.token_manager().expiry();
        REQUIRE(expiry.has_value());
        REQUIRE(*expiry == clock.now() + 7h + 59min);
    }

    SECTION("invalidate forces a new exchange") {
        api.get("/containers/json");
        api.token_manager().invalidate();
        api.get("/containers/json");
        REQUIRE(transport->auth_count() == 2);
    }
}

//==============================================================================
TEST_CASE("Credential exchange request", "[auth]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->route(HttpMethod::Get, endpoint_path("/containers/json"), json_response(200, json::array()));
    APIClient api(test_options(), transport);

    api.get("/containers/json");
    auto requests = transport->requests();
    REQUIRE(requests.size() == 2);

    SECTION("posts the credentials to /api/auth without a bearer token") {
        const HttpRequest& exchange = requests[0];
        REQUIRE(exchange.method == HttpMethod::Post);
        REQUIRE(exchange.url == "http://portainer.local:9000/api/auth");
        REQUIRE(exchange.headers.count("Authorization") == 0);
        REQUIRE(exchange.body.has_value());
        REQUIRE(json::parse(*exchange.body) == json({{"username", "admin"}, {"password", "secret"}}));
    }

    SECTION("the returned jwt becomes the bearer token") {
        const HttpRequest& call = requests[1];
        REQUIRE(call.headers.at("Authorization") == "Bearer jwt-1");
        REQUIRE(call.headers.at("Accept") == "application/json");
    }
}

//==============================================================================
TEST_CASE("Credential exchange failures", "[auth]") {
    auto transport = std::make_shared<FakeTransport>();
    APIClient api(test_options(), transport);

    SECTION("rejected credentials raise TokenRefreshError with the body") {
        transport->route(HttpMethod::Post, "/api/auth",
                         text_response(422, "{\"message\":\"Invalid credentials\"}", "application/json"));
        try {
            api.get("/containers/json");
            FAIL("expected TokenRefreshError");
        } catch (const TokenRefreshError& e) {
            REQUIRE(e.status_code() == 422);
            REQUIRE(e.response_body() == "{\"message\":\"Invalid credentials\"}");
            REQUIRE(e.code() == "AUTHENTICATION_ERROR");
        }
        REQUIRE_FALSE(api.token_manager().has_valid_token());
        REQUIRE(transport->count(HttpMethod::Get, endpoint_path("/containers/json")) == 0);
    }

    SECTION("a response without jwt is not accepted as an empty token") {
        transport->route(HttpMethod::Post, "/api/auth", json_response(200, {{"token", "x"}}));
        REQUIRE_THROWS_AS(api.get("/containers/json"), TokenRefreshError);
        REQUIRE_FALSE(api.token_manager().has_valid_token());
    }

    SECTION("an unreadable success payload is an authentication error") {
        transport->route(HttpMethod::Post, "/api/auth", text_response(200, "{\"jwt\":", "application/json"));
        REQUIRE_THROWS_AS(api.get("/containers/json"), TokenRefreshError);
        REQUIRE_FALSE(api.token_manager().has_valid_token());
        REQUIRE(transport->count(HttpMethod::Get, endpoint_path("/containers/json")) == 0);
    }

    SECTION("transport failure during the exchange is an authentication error") {
        transport->route(HttpMethod::Post, "/api/auth", [](const HttpRequest& request) -> HttpResponse {
            throw ConnectionError("connection refused", request.url);
        });
        REQUIRE_THROWS_AS(api.get("/containers/json"), AuthenticationError);
    }
}

//==============================================================================
TEST_CASE("Concurrent callers share one refresh", "[auth]") {
    auto transport = std::make_shared<FakeTransport>();
    transport->route(HttpMethod::Get, endpoint_path("/_ping"), text_response(200, "OK"));
    APIClient api(test_options(), transport);

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; i++) {
        workers.emplace_back([&api]() { api.get("/_ping"); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(transport->auth_count() == 1);
    REQUIRE(transport->count(HttpMethod::Get, endpoint_path("/_ping")) == 8);
}
