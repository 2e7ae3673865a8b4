#include <catch2/catch_test_macros.hpp>
#include <vertopal/api/api_v1.hpp>
#include <vertopal/api/errors.hpp>
#include <vertopal/io/memory.hpp>
#include "../../fixtures/scripted_backend.hpp"

using namespace vertopal;
using test::scripted_backend;
using test::scripted_reply;
using nlohmann::json;

namespace {

    struct api_fixture {
        config cfg;
        std::shared_ptr<scripted_backend> backend = std::make_shared<scripted_backend>();
        api::api_v1 client{api::credential("app-1", "tok-1"), backend, cfg,
                           [](std::chrono::milliseconds) {}};

        json sent_data(size_t index = 0) const {
            return json::parse(test::form_field(backend->requests().at(index).body, "data"));
        }
    };

    const json empty_result = {{"result", {{"output", json::object()}}}};

}

TEST_CASE("API v1 upload", "[api][unit]") {
    api_fixture f;
    f.backend->push("/v1/upload/file", scripted_reply::json({{"result", {{"output", {{"connector", "file-1"}}}}}}));

    SECTION("readable metadata is used") {
        io::memory_input input(std::string("file content"), "report.docx", "application/vnd.openxmlformats");
        auto response = f.client.upload_file(input);

        REQUIRE(response["result"]["output"]["connector"] == "file-1");
        const auto& request = f.backend->requests().at(0);
        REQUIRE(request.url == "https://api.vertopal.com/v1/upload/file");
        REQUIRE(f.sent_data() == json{{"app", "app-1"}});
        REQUIRE(test::form_file(request.body, "file") == "file content");
        REQUIRE(request.body.find("filename=\"report.docx\"") != std::string::npos);
        REQUIRE(request.body.find("Content-Type: application/vnd.openxmlformats") != std::string::npos);
    }

    SECTION("defaults for anonymous readables") {
        io::memory_input input(std::vector<std::string>{"a", "b", "c"});
        f.client.upload_file(input, 1);

        const auto& body = f.backend->requests().at(0).body;
        REQUIRE(test::form_file(body, "file") == "abc");
        REQUIRE(body.find("filename=\"upload.bin\"") != std::string::npos);
        REQUIRE(body.find("Content-Type: application/octet-stream") != std::string::npos);
    }
}

TEST_CASE("API v1 request bodies", "[api][unit]") {
    api_fixture f;
    for (int i = 0; i < 4; ++i) f.backend->push(scripted_reply::json(empty_result));

    SECTION("convert_file with input format") {
        f.client.convert_file("file-1", "pdf", std::string("docx"));
        REQUIRE(f.backend->requests().at(0).resource == "/v1/convert/file");
        REQUIRE(f.sent_data() == json{
            {"app", "app-1"},
            {"connector", "file-1"},
            {"include", json::array({"result", "entity"})},
            {"mode", "async"},
            {"parameters", {{"input", "docx"}, {"output", "pdf"}}}
        });
    }

    SECTION("convert_file without input format, sync mode") {
        f.client.convert_file("file-1", "png", std::nullopt, api::strategy_mode::sync);
        auto data = f.sent_data();
        REQUIRE(data["mode"] == "sync");
        REQUIRE(data["parameters"] == json{{"output", "png"}});
    }

    SECTION("task and status calls") {
        f.client.convert_status("task-1");
        f.client.task_response("task-1");
        f.client.download_url("task-1");

        REQUIRE(f.backend->requests().at(0).resource == "/v1/convert/status");
        REQUIRE(f.sent_data(0) == json{{"app", "app-1"}, {"connector", "task-1"}});
        REQUIRE(f.backend->requests().at(1).resource == "/v1/task/response");
        REQUIRE(f.sent_data(1) == json{{"app", "app-1"}, {"connector", "task-1"}, {"include", json::array({"result"})}});
        REQUIRE(f.backend->requests().at(2).resource == "/v1/download/url");
        REQUIRE(f.sent_data(2) == json{{"app", "app-1"}, {"connector", "task-1"}});
    }

    SECTION("format metadata calls") {
        f.client.format_get("pdf");
        f.client.convert_graph("docx", "pdf");
        f.client.convert_formats(api::sublist_mode::outputs, std::string("docx"));
        f.client.convert_formats(api::sublist_mode::inputs);

        REQUIRE(f.backend->requests().at(0).resource == "/v1/format/get");
        REQUIRE(f.sent_data(0)["parameters"] == json{{"format", "pdf"}});
        REQUIRE(f.backend->requests().at(1).resource == "/v1/convert/graph");
        REQUIRE(f.sent_data(1)["parameters"] == json{{"input", "docx"}, {"output", "pdf"}});
        REQUIRE(f.backend->requests().at(2).resource == "/v1/convert/formats");
        REQUIRE(f.sent_data(2)["parameters"] == json{{"sublist", "outputs"}, {"format", "docx"}});
        REQUIRE(f.sent_data(3)["parameters"] == json{{"sublist", "inputs"}});
    }
}

TEST_CASE("API v1 download", "[api][unit]") {
    api_fixture f;
    io::memory_output output;

    SECTION("body is streamed into the writable") {
        f.backend->push("/v1/download/url/get", scripted_reply::binary("converted bytes", 4));
        auto written = f.client.download_url_get(output, "dl-1", 5);

        REQUIRE(written == 15);
        REQUIRE(output.data() == "converted bytes");
        REQUIRE(output.open_count() == 1);
        REQUIRE(f.sent_data() == json{{"app", "app-1"}, {"connector", "dl-1"}});
        REQUIRE(f.backend->requests().at(0).timeout == std::chrono::milliseconds(300000));
    }

    SECTION("service error leaves the writable untouched") {
        f.backend->push("/v1/download/url/get",
                        scripted_reply::json({{"error", {{"code", "DOWNLOAD_EXPIRED"}, {"message", "Expired."}}}}));
        try {
            f.client.download_url_get(output, "dl-1");
            FAIL("expected an api_error");
        } catch (const api_error& e) {
            REQUIRE(e.kind() == error_kind::download_expired);
        }
        REQUIRE(output.open_count() == 0);
    }

    SECTION("empty body still creates the output") {
        f.backend->push("/v1/download/url/get", scripted_reply::binary(""));
        REQUIRE(f.client.download_url_get(output, "dl-1") == 0);
        REQUIRE(output.open_count() == 1);
        REQUIRE(output.data().empty());
    }

    SECTION("zero chunk size is rejected") {
        REQUIRE_THROWS_AS(f.client.download_url_get(output, "dl-1", 0), std::invalid_argument);
        REQUIRE(f.backend->requests().empty());
    }
}
