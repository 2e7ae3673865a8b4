#ifndef VERTOPAL_API_CONVERTER_HPP
#define VERTOPAL_API_CONVERTER_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api_v1.hpp"
#include "../io/protocols.hpp"

namespace vertopal::api {

enum class conversion_state {
    created,
    uploading,
    converting,
    completed
};

const char* to_string(conversion_state state);

/**
 * One conversion workflow: upload, convert, poll until the task completes,
 * download. Every step is driven by the caller, nothing runs in background.
 *
 * Usage:
 *   auto conversion = converter.convert(input, output, "pdf");
 *   conversion.wait();
 *   if (conversion.successful()) conversion.download();
 *
 * An instance is not meant to be shared between threads.
 */
class conversion {
public:
    conversion(std::shared_ptr<api_v1> client,
               std::shared_ptr<io::readable> input,
               std::shared_ptr<io::writable> output,
               const std::string& output_format,
               const std::optional<std::string>& input_format = std::nullopt);

    /**
     * Uploads the input and starts an asynchronous conversion of it. Raises
     * entity_status_not_running when the service does not report the new
     * task as running.
     */
    void init();

    /**
     * Polls the task until it completes, sleeping intervals[i] seconds
     * between polls. The index advances once per poll and stays on the last
     * interval once the sequence is exhausted. Throws std::invalid_argument
     * when the interval needed next is missing or not a positive number.
     */
    void wait(const std::vector<double>& intervals = default_intervals(),
              const sleep_function& sleep = {});

    // single status poll, true once the task (not the conversion) completed
    bool done();

    // conversion outcome observed by the last poll, only meaningful after done()
    bool successful() const;

    /**
     * Streams the converted file into the output. With use_server_filename
     * and a path_writable output, the output file name is replaced with the
     * name reported by the service first.
     */
    void download(bool use_server_filename = false);

    std::optional<double> credits_used() const { return credits_; }

    conversion_state state() const { return state_; }
    const std::optional<std::string>& task_status() const { return task_status_; }
    const std::optional<std::string>& convert_status() const { return convert_status_; }
    const std::optional<std::string>& connector() const { return connector_; }
    const std::optional<std::string>& input_format() const { return input_format_; }
    const std::string& output_format() const { return output_format_; }

    static const std::vector<double>& default_intervals();

private:
    const std::string& require_connector() const;

    std::shared_ptr<api_v1> client_;
    std::shared_ptr<io::readable> input_;
    std::shared_ptr<io::writable> output_;
    std::optional<std::string> input_format_;
    std::string output_format_;

    conversion_state state_ = conversion_state::created;
    std::optional<std::string> connector_;
    std::optional<std::string> task_status_;
    std::optional<std::string> convert_status_;
    std::optional<double> credits_;
};

/**
 * Entry point for conversions. Owns one API client shared by the
 * conversions it starts.
 */
class converter {
public:
    // credential from api.app / api.token when none is given
    explicit converter(std::optional<credential> cred = std::nullopt,
                       const config& cfg = config::global(),
                       std::shared_ptr<http::http_backend> backend = nullptr,
                       sleep_function sleep = {});

    explicit converter(std::shared_ptr<api_v1> client);

    // returns a conversion with init() already performed
    conversion convert(std::shared_ptr<io::readable> input,
                       std::shared_ptr<io::writable> output,
                       const std::string& output_format,
                       const std::optional<std::string>& input_format = std::nullopt);

    api_v1& client() { return *client_; }

private:
    std::shared_ptr<api_v1> client_;
};

}

#endif
