#include <catch2/catch_test_macros.hpp>

#include "infrastructure/mapping/HttpClient.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <chrono>
#include <future>

using namespace trafficpulse::infra;

TEST_CASE("HttpClient URL parsing", "[HttpClient]") {
    SECTION("Host, port and target") {
        auto url = HttpClient::parseUrl("http://localhost:32599/status");
        REQUIRE(url.has_value());
        CHECK(url->host == "localhost");
        CHECK(url->port == "32599");
        CHECK(url->target == "/status");
    }

    SECTION("Default port and target") {
        auto url = HttpClient::parseUrl("http://10.40.0.1");
        REQUIRE(url.has_value());
        CHECK(url->host == "10.40.0.1");
        CHECK(url->port == "80");
        CHECK(url->target == "/");
    }

    SECTION("Query string is kept in the target") {
        auto url = HttpClient::parseUrl("http://router:8080/status?full=1");
        REQUIRE(url.has_value());
        CHECK(url->target == "/status?full=1");
    }

    SECTION("Unsupported or malformed URLs") {
        CHECK_FALSE(HttpClient::parseUrl("https://localhost/status").has_value());
        CHECK_FALSE(HttpClient::parseUrl("localhost:32599/status").has_value());
        CHECK_FALSE(HttpClient::parseUrl("http://:80/status").has_value());
        CHECK_FALSE(HttpClient::parseUrl("http://localhost:/status").has_value());
        CHECK_FALSE(HttpClient::parseUrl("http://localhost:abc/status").has_value());
    }
}

TEST_CASE("HttpClient response parsing", "[HttpClient]") {
    SECTION("Successful response") {
        auto response = HttpClient::parseResponse(
            "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 2\r\n\r\n{}");
        CHECK(response.success);
        CHECK(response.statusCode == 200);
        CHECK(response.headers.at("content-type") == "application/json");
        CHECK(response.body == "{}");
    }

    SECTION("Body is truncated to Content-Length") {
        auto response = HttpClient::parseResponse(
            "HTTP/1.0 200 OK\r\nContent-Length: 4\r\n\r\nabcdefgh");
        CHECK(response.body == "abcd");
    }

    SECTION("Body without Content-Length runs to the end") {
        auto response = HttpClient::parseResponse("HTTP/1.0 200 OK\r\n\r\nabcdefgh");
        CHECK(response.body == "abcdefgh");
    }

    SECTION("Non-2xx status is a failure") {
        auto response = HttpClient::parseResponse(
            "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\n\r\n");
        CHECK_FALSE(response.success);
        CHECK(response.statusCode == 503);
        CHECK(response.errorMessage == "HTTP error: 503");
    }

    SECTION("Garbage is a failure") {
        CHECK_FALSE(HttpClient::parseResponse("").success);
        CHECK_FALSE(HttpClient::parseResponse("hello world\r\n\r\n").success);
    }

    SECTION("Invalid Content-Length is a failure") {
        auto response =
            HttpClient::parseResponse("HTTP/1.1 200 OK\r\nContent-Length: lots\r\n\r\n{}");
        CHECK_FALSE(response.success);
        CHECK(response.errorMessage == "Invalid Content-Length");
    }
}

TEST_CASE("HttpClient request failures", "[HttpClient]") {
    AsioContext context(1);
    context.start();
    HttpClient client(context);

    SECTION("Unsupported URL fails immediately") {
        HttpResponse result;
        client.getAsync("ftp://localhost/status", 1000,
                        [&result](const HttpResponse& response) { result = response; });
        CHECK_FALSE(result.success);
        CHECK(result.errorMessage.find("Unsupported URL") != std::string::npos);
    }

    SECTION("Closed port fails to connect") {
        std::promise<HttpResponse> promise;
        auto future = promise.get_future();
        client.getAsync("http://127.0.0.1:1/status", 2000,
                        [&promise](const HttpResponse& response) { promise.set_value(response); });

        REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        auto response = future.get();
        CHECK_FALSE(response.success);
        CHECK_FALSE(response.errorMessage.empty());
    }

    context.stop();
}
