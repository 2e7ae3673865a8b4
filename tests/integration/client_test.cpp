#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <vertopal/http/client/client.hpp>
#include <vertopal/http/client/form.hpp>
#include "../fixtures/mock_server_fixture.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace vertopal;
using namespace std::chrono_literals;
using test::mock_server;

namespace {

    std::shared_ptr<http::http_request> make_request(http::method method, const std::string& url) {
        auto request = std::make_shared<http::http_request>();
        request->set_method(method);
        request->set_url(url);
        return request;
    }

    struct buffered {
        http::stream_result result;
        std::string body;
    };

    buffered fetch(http::client& client, std::shared_ptr<http::http_request> request,
                   std::chrono::milliseconds timeout = 5000ms) {
        buffered out;
        out.result = client.send_streaming(std::move(request), [&out](const http::stream_info& info) {
            out.body.append(info.data);
            return true;
        }, timeout);
        return out;
    }

}

TEST_CASE("HTTP Client exchanges", "[http][client][integration]") {

    SECTION("GET returns status, headers and body") {
        mock_server server([](const test::captured_request&) {
            return mock_server::json_reply(200, R"({"status":"ok"})");
        });

        http::client client;
        client.user_agent("VertopalTest/1.0");
        auto request = make_request(http::method::GET, server.url("/v1/format/get"));
        request->add_header("X-Trace", "abc");
        auto response = fetch(client, request);

        REQUIRE(response.result.ok());
        REQUIRE(response.result.status_code == 200);
        REQUIRE(response.result.content_type == "application/json");
        REQUIRE(response.body == R"({"status":"ok"})");

        auto requests = server.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].method == "GET");
        REQUIRE(requests[0].target == "/v1/format/get");
        REQUIRE(requests[0].header("User-Agent") == "VertopalTest/1.0");
        REQUIRE(requests[0].header("Accept-Encoding") == "gzip, deflate");
        REQUIRE(requests[0].header("X-Trace") == "abc");
        REQUIRE(requests[0].header("Host") == "127.0.0.1:" + std::to_string(server.port()));
    }

    SECTION("POST multipart form arrives intact") {
        mock_server server([](const test::captured_request&) {
            return mock_server::json_reply(200, "{}");
        });

        http::form form;
        form.field("data", R"({"app":"free"})")
            .file("file", std::string("bin\0ary", 7), "input.bin");

        http::client client;
        auto request = make_request(http::method::POST, server.url("/v1/upload/file"));
        request->set_content(form.body(), form.content_type());
        REQUIRE(fetch(client, request).result.ok());

        auto requests = server.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].method == "POST");
        REQUIRE(requests[0].header("Content-Type") == form.content_type());
        REQUIRE(requests[0].body == form.body());
        REQUIRE(requests[0].header("Content-Length") == std::to_string(form.body().size()));
    }

    SECTION("HTTP errors are responses, not network errors") {
        mock_server server([](const test::captured_request&) {
            return mock_server::reply(503, "text/html", "<h1>maintenance</h1>");
        });

        http::client client;
        auto response = fetch(client, make_request(http::method::GET, server.url("/")));
        REQUIRE_FALSE(response.result.ok());
        REQUIRE(response.result.completed());
        REQUIRE_FALSE(response.result.has_network_error());
        REQUIRE(response.result.status_code == 503);
        REQUIRE(response.body == "<h1>maintenance</h1>");
    }

    SECTION("gzip bodies are decoded transparently") {
        std::string document(10000, 'd');
        mock_server server([&document](const test::captured_request&) {
            return mock_server::gzip_reply(200, "application/octet-stream", document);
        });

        http::client client;
        auto response = fetch(client, make_request(http::method::GET, server.url("/file")));
        REQUIRE(response.result.ok());
        REQUIRE(response.body == document);
        REQUIRE(response.result.bytes_transferred == document.size());
    }

    SECTION("sequential requests to a closing server") {
        mock_server server([](const test::captured_request& req) {
            return mock_server::reply(200, "text/plain", req.target);
        });

        http::client client;
        REQUIRE(fetch(client, make_request(http::method::GET, server.url("/one"))).body == "/one");
        REQUIRE(fetch(client, make_request(http::method::GET, server.url("/two"))).body == "/two");
        REQUIRE(server.requests().size() == 2);
    }
}

TEST_CASE("HTTP Client streaming", "[http][client][integration]") {

    SECTION("chunks are delivered in order with progress") {
        std::vector<std::string> chunks{"alpha-", "beta-", "gamma"};
        mock_server server([&chunks](const test::captured_request&) {
            return mock_server::chunked_reply(200, "application/pdf", chunks);
        });

        http::client client;
        std::string received;
        size_t last_downloaded = 0;
        auto result = client.send_streaming(make_request(http::method::GET, server.url("/dl")),
            [&](const http::stream_info& info) {
                received.append(info.data);
                REQUIRE(info.downloaded >= last_downloaded);
                REQUIRE(info.total == 0);
                REQUIRE(info.status_code == 200);
                REQUIRE(info.content_type == "application/pdf");
                last_downloaded = info.downloaded;
                return true;
            }, 5000ms);

        REQUIRE(result.ok());
        REQUIRE(received == "alpha-beta-gamma");
        REQUIRE(result.bytes_transferred == received.size());
        REQUIRE(result.content_type == "application/pdf");
    }

    SECTION("Content-Length is reported as total") {
        mock_server server([](const test::captured_request&) {
            return mock_server::reply(200, "application/octet-stream", std::string(2048, 'x'));
        });

        http::client client;
        size_t total = 0;
        auto result = client.send_streaming(make_request(http::method::GET, server.url("/")),
            [&total](const http::stream_info& info) {
                total = info.total;
                return true;
            }, 5000ms);
        REQUIRE(result.ok());
        REQUIRE(total == 2048);
        REQUIRE(result.bytes_transferred == 2048);
    }

    SECTION("callback can abort the download") {
        mock_server server([](const test::captured_request&) {
            return mock_server::reply(200, "application/octet-stream", std::string(100000, 'x'));
        });

        http::client client;
        auto result = client.send_streaming(make_request(http::method::GET, server.url("/")),
            [](const http::stream_info&) { return false; }, 5000ms);
        REQUIRE(result.aborted);
        REQUIRE_FALSE(result.has_network_error());
    }

    SECTION("callback exceptions reach the caller without waiting for the deadline") {
        mock_server server([](const test::captured_request& req) {
            return mock_server::reply(200, "application/octet-stream", req.target);
        });

        http::client client;
        auto start = std::chrono::steady_clock::now();
        REQUIRE_THROWS_WITH(
            client.send_streaming(make_request(http::method::GET, server.url("/broken")),
                [](const http::stream_info&) -> bool { throw std::runtime_error("disk full"); }, 3000ms),
            "disk full");
        REQUIRE(std::chrono::steady_clock::now() - start < 2000ms);

        // the client stays usable afterwards
        auto response = fetch(client, make_request(http::method::GET, server.url("/next")));
        REQUIRE(response.result.ok());
        REQUIRE(response.body == "/next");
    }
}

TEST_CASE("HTTP Client failures", "[http][client][integration]") {

    SECTION("timeout when the service does not answer") {
        mock_server server([](const test::captured_request&) {
            std::this_thread::sleep_for(1500ms);
            return mock_server::json_reply(200, "{}");
        });

        http::client client;
        auto start = std::chrono::steady_clock::now();
        auto response = fetch(client, make_request(http::method::GET, server.url("/slow")), 300ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(response.result.has_network_error());
        REQUIRE_THAT(response.result.error, Catch::Matchers::ContainsSubstring("timed out"));
        REQUIRE(elapsed < 1400ms);
    }

    SECTION("connection refused") {
        uint16_t port;
        {
            mock_server closed([](const test::captured_request&) { return std::string(); });
            port = closed.port();
        }

        http::client client;
        auto response = fetch(client, make_request(http::method::GET, "http://127.0.0.1:" + std::to_string(port) + "/"));
        REQUIRE(response.result.has_network_error());
        REQUIRE_FALSE(response.result.completed());
    }

    SECTION("invalid url") {
        http::client client;
        auto response = fetch(client, make_request(http::method::GET, "not a url"));
        REQUIRE(response.result.has_network_error());
        REQUIRE(response.result.error == "invalid request url");
    }

    SECTION("garbage instead of HTTP") {
        mock_server server([](const test::captured_request&) {
            return std::string("SSH-2.0-OpenSSH\r\n\r\n");
        });

        http::client client;
        auto response = fetch(client, make_request(http::method::GET, server.url("/"));
        REQUIRE(response.result.has_network_error());
        REQUIRE(response.result.error == "invalid http response");
    }
}
