#include "converter.hpp"
#include "errors.hpp"
#include "../config/settings.hpp"
#include "../util/format.hpp"
#include "../util/logger.hpp"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <initializer_list>
#include <stdexcept>
#include <thread>

namespace vertopal::api {

namespace {

    // saturates at milliseconds::max() instead of overflowing on huge intervals
    std::chrono::milliseconds poll_delay(double seconds) {
        const std::chrono::duration<double> requested(seconds);
        const std::chrono::duration<double, std::milli> limit(std::chrono::milliseconds::max());
        if (requested >= limit) return std::chrono::milliseconds::max();
        return std::chrono::duration_cast<std::chrono::milliseconds>(requested);
    }

    const nlohmann::json* find_path(const nlohmann::json& document, std::initializer_list<const char*> path) {
        const nlohmann::json* node = &document;
        for (const char* key : path) {
            if (!node->is_object()) return nullptr;
            auto it = node->find(std::string(key));
            if (it == node->end()) return nullptr;
            node = &(*it);
        }
        return node;
    }

    std::string path_name(std::initializer_list<const char*> path) {
        std::string name;
        for (const char* key : path) {
            if (!name.empty()) name += '.';
            name += key;
        }
        return name;
    }

    std::string required_string(const nlohmann::json& document, std::initializer_list<const char*> path) {
        auto node = find_path(document, path);
        if (!node || !node->is_string()) {
            throw api_error(error_kind::invalid_json_response,
                            "Unexpected response: missing '" + path_name(path) + "'");
        }
        return node->get<std::string>();
    }

    std::optional<std::string> optional_string(const nlohmann::json& document, std::initializer_list<const char*> path) {
        auto node = find_path(document, path);
        if (!node || !node->is_string()) return std::nullopt;
        return node->get<std::string>();
    }

}

const char* to_string(conversion_state state) {
    switch (state) {
        case conversion_state::created:    return "created";
        case conversion_state::uploading:  return "uploading";
        case conversion_state::converting: return "converting";
        case conversion_state::completed:  return "completed";
    }
    return "unknown";
}

conversion::conversion(std::shared_ptr<api_v1> client,
                       std::shared_ptr<io::readable> input,
                       std::shared_ptr<io::writable> output,
                       const std::string& output_format,
                       const std::optional<std::string>& input_format)
    : client_(std::move(client)),
      input_(std::move(input)),
      output_(std::move(output)),
      input_format_(util::canonicalize_format(input_format)) {
    if (!client_ || !input_ || !output_) {
        throw std::invalid_argument("conversion requires a client, an input and an output");
    }
    auto format = util::canonicalize_format(output_format);
    if (!format) {
        throw std::invalid_argument("output format must not be empty");
    }
    output_format_ = std::move(*format);
}

const std::vector<double>& conversion::default_intervals() {
    static const std::vector<double> intervals(settings::SLEEP_PATTERN.begin(), settings::SLEEP_PATTERN.end());
    return intervals;
}

const std::string& conversion::require_connector() const {
    if (!connector_) {
        throw std::logic_error("conversion has not been started, call init() first");
    }
    return *connector_;
}

void conversion::init() {
    state_ = conversion_state::uploading;
    auto upload = client_->upload_file(*input_);
    auto file_connector = required_string(upload, {"result", "output", "connector"});
    LOG_DEBUG("uploaded input, connector {}", file_connector);

    state_ = conversion_state::converting;
    auto convert = client_->convert_file(file_connector, output_format_, input_format_, strategy_mode::async);

    auto status = optional_string(convert, {"entity", "status"});
    task_status_ = status;
    if (status != "running") {
        VERTOPAL_LOG_ERROR_TAG("conversion", "task is not running (status: {})", status.value_or("unknown"));
        throw api_error(error_kind::entity_status_not_running,
                        "Conversion task is not running (status: " + status.value_or("unknown") + ")");
    }

    connector_ = required_string(convert, {"entity", "id"});
    VERTOPAL_LOG_TAG("conversion", "conversion to {} started, task {}", output_format_, *connector_);
}

void conversion::wait(const std::vector<double>& intervals, const sleep_function& sleep) {
    size_t step = 0;
    while (!done()) {
        if (step >= intervals.size() || !std::isfinite(intervals[step]) || intervals[step] <= 0) {
            throw std::invalid_argument("poll interval " + std::to_string(step) + " is not a valid positive number");
        }

        auto duration = poll_delay(intervals[step]);
        LOG_TRACE("task {} still running, next poll in {} ms", *connector_, duration.count());
        if (sleep) {
            sleep(duration);
        } else {
            std::this_thread::sleep_for(duration);
        }

        if (step + 1 < intervals.size()) ++step;
    }
}

bool conversion::done() {
    const auto& task = require_connector();
    auto response = client_->task_response(task);

    auto output = find_path(response, {"result", "output"});
    if (!output || !output->is_object()) {
        throw api_error(error_kind::invalid_json_response, "Unexpected response: missing 'result.output'");
    }

    // the inner result only exists once the conversion itself finished
    auto inner = output->find("result");
    if (inner != output->end() && inner->is_object()) {
        convert_status_ = optional_string(*inner, {"output", "status"});
        auto credits = find_path(*output, {"entity", "vcredits"});
        if (credits && credits->is_number()) credits_ = credits->get<double>();
    } else {
        convert_status_.reset();
    }

    task_status_ = required_string(*output, {"entity", "status"});
    if (*task_status_ == "completed") {
        state_ = conversion_state::completed;
    }
    LOG_TRACE("task {}: {} (conversion: {})", task, *task_status_, convert_status_.value_or("pending"));
    return *task_status_ == "completed";
}

bool conversion::successful() const {
    return convert_status_ == "successful";
}

void conversion::download(bool use_server_filename) {
    auto response = client_->download_url(require_connector());
    auto download_connector = required_string(response, {"result", "output", "connector"});
    auto filename = optional_string(response, {"result", "output", "name"});

    if (use_server_filename && filename && !filename->empty()) {
        if (auto destination = dynamic_cast<io::path_writable*>(output_.get())) {
            // keep the destination directory, never let the name escape it
            std::filesystem::path target(destination->path());
            auto name = std::filesystem::path(*filename).filename();
            if (!name.empty()) {
                destination->set_path((target.parent_path() / name).string());
                LOG_DEBUG("using server filename {}", destination->path());
            }
        }
    }

    auto written = client_->download_url_get(*output_, download_connector);
    LOG_DEBUG("conversion result downloaded ({} bytes)", written);
}

converter::converter(std::optional<credential> cred,
                     const config& cfg,
                     std::shared_ptr<http::http_backend> backend,
                     sleep_function sleep)
    : client_(std::make_shared<api_v1>(cred ? std::move(*cred) : credential::from_config(cfg),
                                       std::move(backend), cfg, std::move(sleep))) {}

converter::converter(std::shared_ptr<api_v1> client) : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("converter requires an API client");
    }
}

conversion converter::convert(std::shared_ptr<io::readable> input,
                              std::shared_ptr<io::writable> output,
                              const std::string& output_format,
                              const std::optional<std::string>& input_format) {
    conversion result(client_, std::move(input), std::move(output), output_format, input_format);
    result.init();
    return result;
}

}
