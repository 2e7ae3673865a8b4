#include <catch2/catch_test_macros.hpp>
#include <vertopal/http/client/response_parser.hpp>
#include <vertopal/http/common/http_response.hpp>
#include <string>

using namespace vertopal::http;

namespace {

    boost::tribool feed(response_parser& parser, const std::string& data) {
        auto begin = reinterpret_cast<const uint8_t*>(data.data());
        return parser.parse(begin, begin + data.size());
    }

    // feeds one byte at a time, returns the first determinate result
    boost::tribool feed_bytewise(response_parser& parser, const std::string& data) {
        boost::tribool result = boost::indeterminate;
        for (char c : data) {
            auto byte = reinterpret_cast<const uint8_t*>(&c);
            result = parser.parse(byte, byte + 1);
            if (!boost::indeterminate(result)) return result;
        }
        return result;
    }

}

TEST_CASE("Response parser content length bodies", "[parser][unit]") {
    response_parser parser;

    SECTION("complete response in one read") {
        auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 11\r\n\r\n{\"ok\":true}");
        REQUIRE(result == true);

        auto response = parser.consume_response();
        REQUIRE(response);
        REQUIRE(response->get_status_code() == 200);
        REQUIRE(response->get_content() == "{\"ok\":true}");
        REQUIRE(response->get_content_type() == "application/json");
    }

    SECTION("byte by byte") {
        auto result = feed_bytewise(parser, "HTTP/1.1 404 Not Found\r\nContent-Length: 5\r\n\r\nnope!");
        REQUIRE(result == true);
        auto response = parser.consume_response();
        REQUIRE(response->get_status_code() == 404);
        REQUIRE(response->get_content() == "nope!");
    }

    SECTION("needs more data") {
        auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n12345");
        REQUIRE(boost::indeterminate(result));
        REQUIRE(parser.headers_complete());
        REQUIRE(parser.get_status_code() == 200);
    }

    SECTION("invalid status line") {
        auto result = feed(parser, "HTTP/x.1 200 OK\r\n\r\n");
        REQUIRE(result == false);
    }
}

TEST_CASE("Response parser chunked bodies", "[parser][unit]") {
    response_parser parser;
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5;ext=1\r\nhello\r\n"
        "6\r\n world\r\n"
        "0\r\n"
        "X-Trailer: yes\r\n"
        "\r\n";

    SECTION("whole message") {
        REQUIRE(feed(parser, raw) == true);
        REQUIRE(parser.consume_response()->get_content() == "hello world");
    }

    SECTION("byte by byte") {
        REQUIRE(feed_bytewise(parser, raw) == true);
        REQUIRE(parser.consume_response()->get_content() == "hello world");
    }
}

TEST_CASE("Response parser streaming callbacks", "[parser][unit]") {
    response_parser parser;
    int status_seen = 0;
    std::string content_type_seen;
    std::string body;

    parser.set_on_headers([&](const http_response& response) {
        status_seen = response.get_status_code();
        content_type_seen = response.get_content_type();
        return true;
    });
    parser.set_on_body([&](std::string_view data) {
        body.append(data);
        return true;
    });

    SECTION("headers are reported before the body") {
        REQUIRE(boost::indeterminate(feed(parser, "HTTP/1.1 200 OK\r\nContent-Type: application/pdf\r\nContent-Length: 6\r\n\r\n")));
        REQUIRE(status_seen == 200);
        REQUIRE(content_type_seen == "application/pdf");
        REQUIRE(body.empty());

        REQUIRE(feed(parser, "%PDF-1") == true);
        REQUIRE(body == "%PDF-1");
    }

    SECTION("body until close") {
        REQUIRE(boost::indeterminate(feed(parser, "HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nsome data")));
        REQUIRE(parser.on_eof());
        REQUIRE(body == "some data");
    }

    SECTION("truncated content length body") {
        REQUIRE(boost::indeterminate(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort")));
        REQUIRE_FALSE(parser.on_eof());
    }

    SECTION("callback can abort") {
        parser.set_on_body([](std::string_view) { return false; });
        REQUIRE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nabc") == false);
    }
}
