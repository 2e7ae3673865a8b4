#include <catch2/catch_test_macros.hpp>
#include <vertopal/api/errors.hpp>
#include <string>

using namespace vertopal;

TEST_CASE("Service error codes map to kinds", "[errors][unit]") {

    SECTION("known codes") {
        REQUIRE(kind_for_code("INTERNAL_SERVER_ERROR") == error_kind::internal_server);
        REQUIRE(kind_for_code("INVALID_CREDENTIAL") == error_kind::invalid_credential);
        REQUIRE(kind_for_code("INSUFFICIENT_VCREDITS") == error_kind::insufficient_vcredits);
        REQUIRE(kind_for_code("NO_CONVERTER_INPUT_TO_OUTPUT") == error_kind::no_converter_input_to_output);
        REQUIRE(kind_for_code("MISMATCH_VERSION_DEPENDENT_TASK") == error_kind::mismatch_version_dependent_task);
        REQUIRE(kind_for_code("FAILED_CONVERT") == error_kind::failed_convert);
    }

    SECTION("unknown and empty codes fall back to api_exception") {
        REQUIRE(kind_for_code("SOMETHING_NEW") == error_kind::api_exception);
        REQUIRE(kind_for_code("") == error_kind::api_exception);
        REQUIRE(kind_for_code("invalid_credential") == error_kind::api_exception);
    }

    SECTION("every service kind is in the service category") {
        REQUIRE(category(error_kind::too_many_requests) == error_category::service);
        REQUIRE(category(error_kind::api_exception) == error_category::service);
        REQUIRE(category(error_kind::input_not_found) == error_category::input_missing);
        REQUIRE(category(error_kind::network_connection) == error_category::transport);
        REQUIRE(category(error_kind::invalid_json_response) == error_category::decode);
        REQUIRE(category(error_kind::entity_status_not_running) == error_category::workflow_state);
        REQUIRE(category(error_kind::output_write) == error_category::output_write);
    }

    SECTION("every service kind has a name") {
        auto first = static_cast<int>(error_kind::internal_server);
        auto last = static_cast<int>(error_kind::failed_convert);
        REQUIRE(last - first + 1 == 44);
        for (int value = first; value <= last; ++value) {
            auto kind = static_cast<error_kind>(value);
            REQUIRE(std::string(to_string(kind)) != "unknown");
            REQUIRE(category(kind) == error_category::service);
        }
    }

    SECTION("kind names") {
        REQUIRE(std::string(to_string(error_kind::free_app_limited)) == "free_app_limited");
        REQUIRE(std::string(to_string(error_kind::network_connection)) == "network_connection");
        REQUIRE(std::string(to_string(error_category::workflow_state)) == "workflow_state");
    }
}

TEST_CASE("api_error construction", "[errors][unit]") {

    SECTION("service errors carry code and formatted message") {
        auto error = api_error::from_service("INVALID_OUTPUT_FORMAT", "Output format is not valid.");
        REQUIRE(error.kind() == error_kind::invalid_output_format);
        REQUIRE(error.code() == "INVALID_OUTPUT_FORMAT");
        REQUIRE(std::string(error.what()) == "[INVALID_OUTPUT_FORMAT] Output format is not valid.");
        REQUIRE(error.is_service_error());
    }

    SECTION("missing code and message use defaults") {
        auto error = api_error::from_service("", "");
        REQUIRE(error.kind() == error_kind::api_exception);
        REQUIRE(std::string(error.what()) == "[UNKNOWN_ERROR] No error message available.");
    }

    SECTION("local errors") {
        api_error error(error_kind::output_write, "disk full");
        REQUIRE(error.category() == error_category::output_write);
        REQUIRE(error.code().empty());
        REQUIRE_FALSE(error.is_service_error());
    }
}
