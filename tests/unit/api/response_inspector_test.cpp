#include <catch2/catch_test_macros.hpp>
#include <vertopal/api/response_inspector.hpp>
#include <vertopal/api/errors.hpp>

using namespace vertopal;
using api::response_inspector;
using nlohmann::json;

TEST_CASE("Response inspector errors", "[inspector][unit]") {

    SECTION("clean envelope has no error") {
        json envelope = {{"result", {{"output", {{"connector", "abc"}}}}}};
        REQUIRE_FALSE(response_inspector::has_error(envelope));
        REQUIRE(response_inspector::get_error(envelope).empty());
        REQUIRE_NOTHROW(response_inspector::raise_for_response(envelope));
    }

    SECTION("root level code counts as error") {
        json envelope = {{"code", "NOT_FOUND"}, {"message", "Not found."}};
        REQUIRE(response_inspector::has_error(envelope));
        REQUIRE(response_inspector::get_error(envelope).code == "NOT_FOUND");
    }

    SECTION("first matching path wins") {
        json envelope = {
            {"error", {{"code", "INVALID_FIELD"}, {"message", "top"}}},
            {"result", {{"error", {{"code", "FAILED_CONVERT"}, {"message", "nested"}}}}}
        };
        auto error = response_inspector::get_error(envelope);
        REQUIRE(error.code == "INVALID_FIELD");
        REQUIRE(error.message == "top");
    }

    SECTION("deeply nested error") {
        json envelope = {{"result", {{"output", {{"result", {{"error", {{"message", "conversion crashed"}}}}}}}}}};
        REQUIRE(response_inspector::has_error(envelope));
        auto error = response_inspector::get_error(envelope);
        REQUIRE_FALSE(error.code.has_value());
        REQUIRE(error.message == "conversion crashed");
    }

    SECTION("empty code and message do not count") {
        json envelope = {{"error", {{"code", ""}, {"message", ""}}}};
        REQUIRE_FALSE(response_inspector::has_error(envelope));
    }

    SECTION("non-object values along a path are ignored") {
        json envelope = {{"error", "text"}, {"result", {{"output", 42}}}};
        REQUIRE_FALSE(response_inspector::has_error(envelope));
        REQUIRE_FALSE(response_inspector::has_error(json::array({1, 2})));
        REQUIRE_FALSE(response_inspector::has_error(json("string")));
    }

    SECTION("raise_for_response throws the mapped kind") {
        json envelope = {{"error", {{"code", "INVALID_CREDENTIAL"}, {"message", "Bad token."}}}};
        try {
            response_inspector::raise_for_response(envelope);
            FAIL("expected an api_error");
        } catch (const api_error& e) {
            REQUIRE(e.kind() == error_kind::invalid_credential);
            REQUIRE(std::string(e.what()) == "[INVALID_CREDENTIAL] Bad token.");
        }
    }

    SECTION("unknown code raises the catch-all kind") {
        json envelope = {{"error", {{"code", "BRAND_NEW"}}}};
        try {
            response_inspector::raise_for_response(envelope);
            FAIL("expected an api_error");
        } catch (const api_error& e) {
            REQUIRE(e.kind() == error_kind::api_exception);
            REQUIRE(std::string(e.what()) == "[BRAND_NEW] No error message available.");
        }
    }
}

TEST_CASE("Response inspector warnings", "[inspector][unit]") {

    SECTION("warnings from every path are collected") {
        json envelope = {
            {"warning", {{"code", "DEPRECATED"}, {"message", "old endpoint"}}},
            {"result", {{"output", {{"warning", {{"code", "SLOW"}}}}}}}
        };
        REQUIRE(response_inspector::has_warning(envelope));
        auto warnings = response_inspector::get_warnings(envelope);
        REQUIRE(warnings.size() == 2);
        REQUIRE(warnings[0].code == "DEPRECATED");
        REQUIRE(warnings[1].code == "SLOW");
    }

    SECTION("warnings never raise") {
        json envelope = {{"result", {{"warning", {{"message", "heads up"}}}}}};
        REQUIRE_FALSE(response_inspector::has_error(envelope));
        REQUIRE_NOTHROW(response_inspector::raise_for_response(envelope));
    }
}
