#ifndef VERTOPAL_API_ERRORS_HPP
#define VERTOPAL_API_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace vertopal {

enum class error_kind {
    // generic catch-all, also used for unknown service codes
    api_exception,

    input_not_found,
    network_connection,
    invalid_json_response,
    entity_status_not_running,
    output_write,

    // service reported codes, see kind_for_code
    internal_server,
    not_found,
    post_method_allowed,
    missing_authorization_header,
    invalid_authorization_header,
    invalid_field,
    missing_required_field,
    wrong_type_field,
    invalid_data_key,
    missing_required_data_key,
    wrong_type_data_key,
    wrong_value_data_key,
    invalid_credential,
    free_plan_disallowed,
    insufficient_vcredits,
    invalid_callback,
    unverified_domain_callback,
    no_connector_dependent_task,
    not_ready_dependent_task,
    mismatch_version_dependent_task,
    mismatch_dependent_task,
    file_not_exists,
    download_expired,
    only_development_request,
    invalid_parameter,
    missing_required_parameter,
    wrong_type_parameter,
    wrong_value_parameter,
    only_development_file,
    not_valid_extension,
    limit_upload_size,
    empty_file,
    wrong_output_format_structure,
    invalid_output_format,
    wrong_input_format_structure,
    invalid_input_format,
    no_converter_input_to_output,
    not_match_extension_and_input,
    too_many_requests,
    free_app_limited,
    disabled_for_free_app,
    wrong_format_structure,
    invalid_format,
    failed_convert
};

enum class error_category {
    input_missing,
    transport,
    decode,
    service,
    workflow_state,
    output_write
};

error_category category(error_kind kind);
const char* to_string(error_kind kind);
const char* to_string(error_category category);

/**
 * Maps a service error code ("INVALID_CREDENTIAL", ...) to its kind.
 * Unknown or empty codes map to error_kind::api_exception.
 */
error_kind kind_for_code(std::string_view code);

/**
 * Single exception type raised by the library. Callers branch on kind()
 * or category() instead of parsing what().
 */
class api_error : public std::runtime_error {
public:
    api_error(error_kind kind, const std::string& message, std::string code = {});

    // builds the "[CODE] message" form used for service reported errors
    static api_error from_service(std::string_view code, std::string_view message);

    error_kind kind() const noexcept { return kind_; }
    error_category category() const noexcept { return vertopal::category(kind_); }
    const std::string& code() const noexcept { return code_; }

    // true for errors where repeating the same request cannot help
    bool is_service_error() const noexcept { return category() == error_category::service; }

private:
    error_kind kind_;
    std::string code_;
};

}

#endif
