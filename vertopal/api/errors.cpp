#include "errors.hpp"
#include <algorithm>
#include <utility>

namespace vertopal {

namespace {

    constexpr std::string_view UNKNOWN_ERROR_CODE = "UNKNOWN_ERROR";
    constexpr std::string_view NO_ERROR_MESSAGE = "No error message available.";

    struct code_entry {
        std::string_view code;
        error_kind kind;
    };

    constexpr code_entry code_table[] = {
        {"INTERNAL_SERVER_ERROR",           error_kind::internal_server},
        {"NOT_FOUND",                       error_kind::not_found},
        {"POST_METHOD_ALLOWED",             error_kind::post_method_allowed},
        {"MISSING_AUTHORIZATION_HEADER",    error_kind::missing_authorization_header},
        {"INVALID_AUTHORIZATION_HEADER",    error_kind::invalid_authorization_header},
        {"INVALID_FIELD",                   error_kind::invalid_field},
        {"MISSING_REQUIRED_FIELD",          error_kind::missing_required_field},
        {"WRONG_TYPE_FIELD",                error_kind::wrong_type_field},
        {"INVALID_DATA_KEY",                error_kind::invalid_data_key},
        {"MISSING_REQUIRED_DATA_KEY",       error_kind::missing_required_data_key},
        {"WRONG_TYPE_DATA_KEY",             error_kind::wrong_type_data_key},
        {"WRONG_VALUE_DATA_KEY",            error_kind::wrong_value_data_key},
        {"INVALID_CREDENTIAL",              error_kind::invalid_credential},
        {"FREE_PLAN_DISALLOWED",            error_kind::free_plan_disallowed},
        {"INSUFFICIENT_VCREDITS",           error_kind::insufficient_vcredits},
        {"INVALID_CALLBACK",                error_kind::invalid_callback},
        {"UNVERIFIED_DOMAIN_CALLBACK",      error_kind::unverified_domain_callback},
        {"NO_CONNECTOR_DEPENDENT_TASK",     error_kind::no_connector_dependent_task},
        {"NOT_READY_DEPENDENT_TASK",        error_kind::not_ready_dependent_task},
        {"MISMATCH_VERSION_DEPENDENT_TASK", error_kind::mismatch_version_dependent_task},
        {"MISMATCH_DEPENDENT_TASK",         error_kind::mismatch_dependent_task},
        {"FILE_NOT_EXISTS",                 error_kind::file_not_exists},
        {"DOWNLOAD_EXPIRED",                error_kind::download_expired},
        {"ONLY_DEVELOPMENT_REQUEST",        error_kind::only_development_request},
        {"INVALID_PARAMETER",               error_kind::invalid_parameter},
        {"MISSING_REQUIRED_PARAMETER",      error_kind::missing_required_parameter},
        {"WRONG_TYPE_PARAMETER",            error_kind::wrong_type_parameter},
        {"WRONG_VALUE_PARAMETER",           error_kind::wrong_value_parameter},
        {"ONLY_DEVELOPMENT_FILE",           error_kind::only_development_file},
        {"NOT_VALID_EXTENSION",             error_kind::not_valid_extension},
        {"LIMIT_UPLOAD_SIZE",               error_kind::limit_upload_size},
        {"EMPTY_FILE",                      error_kind::empty_file},
        {"WRONG_OUTPUT_FORMAT_STRUCTURE",   error_kind::wrong_output_format_structure},
        {"INVALID_OUTPUT_FORMAT",           error_kind::invalid_output_format},
        {"WRONG_INPUT_FORMAT_STRUCTURE",    error_kind::wrong_input_format_structure},
        {"INVALID_INPUT_FORMAT",            error_kind::invalid_input_format},
        {"NO_CONVERTER_INPUT_TO_OUTPUT",    error_kind::no_converter_input_to_output},
        {"NOT_MATCH_EXTENSION_AND_INPUT",   error_kind::not_match_extension_and_input},
        {"TOO_MANY_REQUESTS",               error_kind::too_many_requests},
        {"FREE_APP_LIMITED",                error_kind::free_app_limited},
        {"DISABLED_FOR_FREE_APP",           error_kind::disabled_for_free_app},
        {"WRONG_FORMAT_STRUCTURE",          error_kind::wrong_format_structure},
        {"INVALID_FORMAT",                  error_kind::invalid_format},
        {"FAILED_CONVERT",                  error_kind::failed_convert},
    };

}

error_kind kind_for_code(std::string_view code) {
    auto it = std::find_if(std::begin(code_table), std::end(code_table),
                           [code](const code_entry& entry) { return entry.code == code; });
    return it != std::end(code_table) ? it->kind : error_kind::api_exception;
}

error_category category(error_kind kind) {
    switch (kind) {
        case error_kind::input_not_found:           return error_category::input_missing;
        case error_kind::network_connection:        return error_category::transport;
        case error_kind::invalid_json_response:     return error_category::decode;
        case error_kind::entity_status_not_running: return error_category::workflow_state;
        case error_kind::output_write:              return error_category::output_write;
        default:                                    return error_category::service;
    }
}

const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::api_exception:                   return "api_exception";
        case error_kind::input_not_found:                 return "input_not_found";
        case error_kind::network_connection:              return "network_connection";
        case error_kind::invalid_json_response:           return "invalid_json_response";
        case error_kind::entity_status_not_running:       return "entity_status_not_running";
        case error_kind::output_write:                    return "output_write";
        case error_kind::internal_server:                 return "internal_server";
        case error_kind::not_found:                       return "not_found";
        case error_kind::post_method_allowed:             return "post_method_allowed";
        case error_kind::missing_authorization_header:    return "missing_authorization_header";
        case error_kind::invalid_authorization_header:    return "invalid_authorization_header";
        case error_kind::invalid_field:                   return "invalid_field";
        case error_kind::missing_required_field:          return "missing_required_field";
        case error_kind::wrong_type_field:                return "wrong_type_field";
        case error_kind::invalid_data_key:                return "invalid_data_key";
        case error_kind::missing_required_data_key:       return "missing_required_data_key";
        case error_kind::wrong_type_data_key:             return "wrong_type_data_key";
        case error_kind::wrong_value_data_key:            return "wrong_value_data_key";
        case error_kind::invalid_credential:              return "invalid_credential";
        case error_kind::free_plan_disallowed:            return "free_plan_disallowed";
        case error_kind::insufficient_vcredits:           return "insufficient_vcredits";
        case error_kind::invalid_callback:                return "invalid_callback";
        case error_kind::unverified_domain_callback:      return "unverified_domain_callback";
        case error_kind::no_connector_dependent_task:     return "no_connector_dependent_task";
        case error_kind::not_ready_dependent_task:        return "not_ready_dependent_task";
        case error_kind::mismatch_version_dependent_task: return "mismatch_version_dependent_task";
        case error_kind::mismatch_dependent_task:         return "mismatch_dependent_task";
        case error_kind::file_not_exists:                 return "file_not_exists";
        case error_kind::download_expired:                return "download_expired";
        case error_kind::only_development_request:        return "only_development_request";
        case error_kind::invalid_parameter:               return "invalid_parameter";
        case error_kind::missing_required_parameter:      return "missing_required_parameter";
        case error_kind::wrong_type_parameter:            return "wrong_type_parameter";
        case error_kind::wrong_value_parameter:           return "wrong_value_parameter";
        case error_kind::only_development_file:           return "only_development_file";
        case error_kind::not_valid_extension:             return "not_valid_extension";
        case error_kind::limit_upload_size:               return "limit_upload_size";
        case error_kind::empty_file:                      return "empty_file";
        case error_kind::wrong_output_format_structure:   return "wrong_output_format_structure";
        case error_kind::invalid_output_format:           return "invalid_output_format";
        case error_kind::wrong_input_format_structure:    return "wrong_input_format_structure";
        case error_kind::invalid_input_format:            return "invalid_input_format";
        case error_kind::no_converter_input_to_output:    return "no_converter_input_to_output";
        case error_kind::not_match_extension_and_input:   return "not_match_extension_and_input";
        case error_kind::too_many_requests:               return "too_many_requests";
        case error_kind::free_app_limited:                return "free_app_limited";
        case error_kind::disabled_for_free_app:           return "disabled_for_free_app";
        case error_kind::wrong_format_structure:          return "wrong_format_structure";
        case error_kind::invalid_format:                  return "invalid_format";
        case error_kind::failed_convert:                  return "failed_convert";
    }
    return "unknown";
}

const char* to_string(error_category category) {
    switch (category) {
        case error_category::input_missing:  return "input_missing";
        case error_category::transport:      return "transport";
        case error_category::decode:         return "decode";
        case error_category::service:        return "service";
        case error_category::workflow_state: return "workflow_state";
        case error_category::output_write:   return "output_write";
    }
    return "unknown";
}

api_error::api_error(error_kind kind, const std::string& message, std::string code)
    : std::runtime_error(message), kind_(kind), code_(std::move(code)) {}

api_error api_error::from_service(std::string_view code, std::string_view message) {
    std::string effective_code(code.empty() ? UNKNOWN_ERROR_CODE : code);
    std::string effective_message(message.empty() ? NO_ERROR_MESSAGE : message);
    auto kind = kind_for_code(effective_code);
    return api_error(kind, "[" + effective_code + "] " + effective_message, effective_code);
}

}
