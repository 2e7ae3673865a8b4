#ifndef VERTOPAL_API_V1_HPP
#define VERTOPAL_API_V1_HPP

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "enums.hpp"
#include "transport.hpp"
#include "../io/protocols.hpp"

namespace vertopal::api {

/**
 * Version 1 of the Vertopal API. Every call posts a "data" JSON field
 * holding the application id plus the call parameters, and returns the
 * decoded response envelope. Service errors are raised as api_error.
 */
class api_v1 {
public:
    static constexpr int VERSION = 1;

    explicit api_v1(credential cred,
                    std::shared_ptr<http::http_backend> backend = nullptr,
                    const config& cfg = config::global(),
                    sleep_function sleep = {});

    // builds the credential from api.app / api.token
    explicit api_v1(const config& cfg = config::global());

    // streams the readable to /upload/file, result.output.connector holds the file connector
    nlohmann::json upload_file(io::readable& readable, std::optional<size_t> chunk_size = std::nullopt);

    // requests a conversion of an uploaded file, the response includes "result" and "entity"
    nlohmann::json convert_file(const std::string& connector,
                                const std::string& output_format,
                                const std::optional<std::string>& input_format = std::nullopt,
                                strategy_mode mode = strategy_mode::async);

    nlohmann::json convert_status(const std::string& connector);
    nlohmann::json task_response(const std::string& connector);
    nlohmann::json download_url(const std::string& connector);

    /**
     * Downloads the file behind a download connector into the writable. The
     * writable is opened when the first byte of a non-JSON body arrives (or
     * once an empty body completed), so an error response leaves the
     * destination untouched. Returns the number of bytes written.
     */
    size_t download_url_get(io::writable& writable,
                            const std::string& connector,
                            std::optional<size_t> chunk_size = std::nullopt);

    nlohmann::json format_get(const std::string& format);
    nlohmann::json convert_graph(const std::string& input_format, const std::string& output_format);
    nlohmann::json convert_formats(sublist_mode sublist,
                                   const std::optional<std::string>& format = std::nullopt);

    transport& get_transport() { return transport_; }
    const credential& get_credential() const { return transport_.get_credential(); }

private:
    nlohmann::json call(const char* path, nlohmann::json data);
    nlohmann::json base_data() const;

    transport transport_;
};

}

#endif
