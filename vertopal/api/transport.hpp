#ifndef VERTOPAL_API_TRANSPORT_HPP
#define VERTOPAL_API_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

#include "credential.hpp"
#include "retry_policy.hpp"
#include "../config/config.hpp"
#include "../http/client/form.hpp"
#include "../http/client/http_backend.hpp"
#include "../http/common/http_request.hpp"
#include "../io/streams.hpp"

namespace vertopal::api {

// file part of a request, streamed through the chunker into the body
struct file_field {
    std::shared_ptr<io::byte_source> source;
    std::string filename = "upload.bin";
    std::string content_type = "application/octet-stream";
    size_t chunk_size = 4096;
};

using field_value = std::variant<std::string, file_field>;
using request_fields = std::map<std::string, field_value>;

// non-JSON response, the body is empty when it went to a body_consumer
struct raw_response {
    int status_code = 0;
    std::string content_type;
    std::map<std::string, std::string> headers;
    std::string body;
    size_t bytes_received = 0;
};

using api_response = std::variant<nlohmann::json, raw_response>;

// receives the body of a non-JSON response while it is downloaded
using body_consumer = std::function<void(std::string_view)>;

using sleep_function = std::function<void(std::chrono::milliseconds)>;

/**
 * Turns a logical API call into authenticated HTTP requests.
 *
 * - URL is endpoint[/v{version}]{path}.
 * - Timeout is the explicit one, or connectionSettings.longTimeout for the
 *   upload and download endpoints, or connectionSettings.defaultTimeout.
 * - String fields go to a multipart body (with "%app-id%" replaced by the
 *   credential app), file fields are read through the stream chunker.
 * - JSON responses are checked by the response inspector. Service errors
 *   and undecodable JSON are raised at once.
 * - Network failures, timeouts and non-2xx responses without JSON are
 *   retried up to connectionSettings.retries attempts with 2^attempt
 *   seconds between attempts, then raised as network_connection.
 * - A failure after body bytes reached the body_consumer is not retried.
 */
class transport {
public:
    transport(credential cred,
              std::shared_ptr<http::http_backend> backend = nullptr,
              const config& cfg = config::global(),
              sleep_function sleep = {});

    api_response send_request(std::string path,
                              http::method method = http::method::POST,
                              request_fields fields = {},
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                              std::optional<int> version = std::nullopt,
                              const body_consumer& consumer = {});

    // send_request for calls that must answer with JSON
    nlohmann::json send_json(std::string path, request_fields fields,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                             std::optional<int> version = std::nullopt);

    std::string build_url(const std::string& path, std::optional<int> version) const;
    std::chrono::milliseconds select_timeout(const std::string& path,
                                             std::optional<std::chrono::milliseconds> timeout) const;

    std::string endpoint() const;
    std::chrono::milliseconds default_timeout() const;
    std::chrono::milliseconds long_timeout() const;
    size_t stream_chunk_size() const;
    retry_policy retries() const;

    const credential& get_credential() const { return credential_; }
    const config& get_config() const { return config_; }
    http::http_backend& get_backend() { return *backend_; }

private:
    http::form encode_fields(request_fields& fields, bool multipart) const;
    std::shared_ptr<http::http_request> build_request(const std::string& url, http::method method,
                                                      const http::form& form) const;
    std::string substitute(std::string value) const;

    credential credential_;
    std::shared_ptr<http::http_backend> backend_;
    const config& config_;
    sleep_function sleep_;
};

}

#endif
