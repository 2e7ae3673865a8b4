#include "transport.hpp"
#include "errors.hpp"
#include "response_inspector.hpp"
#include "../config/settings.hpp"
#include "../http/client/client.hpp"
#include "../util/logger.hpp"
#include "../util/platform.hpp"
#include "../util/stream_chunker.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <array>
#include <thread>

namespace vertopal::api {

namespace {

    constexpr std::string_view APP_ID_PLACEHOLDER = "%app-id%";

    // endpoints moving whole files use the long timeout
    constexpr std::array<std::string_view, 2> LONG_TIMEOUT_PATHS{"/upload/file", "/download/url/get"};

    bool is_json_content(std::string_view content_type) {
        return boost::algorithm::icontains(content_type, "application/json");
    }

}

transport::transport(credential cred,
                     std::shared_ptr<http::http_backend> backend,
                     const config& cfg,
                     sleep_function sleep)
    : credential_(std::move(cred)),
      backend_(std::move(backend)),
      config_(cfg),
      sleep_(std::move(sleep)) {
    if (!backend_) {
        auto client = std::make_shared<http::client>();
        client->user_agent(util::user_agent());
        backend_ = std::move(client);
    }
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

std::string transport::endpoint() const {
    auto value = config_.get<std::string>(settings::section::api, settings::key::endpoint, "");
    while (!value.empty() && value.back() == '/') value.pop_back();
    return value;
}

std::chrono::milliseconds transport::default_timeout() const {
    return std::chrono::milliseconds(config_.get<int64_t>(
        settings::section::connection_settings, settings::key::default_timeout, 30000));
}

std::chrono::milliseconds transport::long_timeout() const {
    return std::chrono::milliseconds(config_.get<int64_t>(
        settings::section::connection_settings, settings::key::long_timeout, 300000));
}

size_t transport::stream_chunk_size() const {
    return config_.get<size_t>(settings::section::connection_settings, settings::key::stream_chunk_size, 4096);
}

retry_policy transport::retries() const {
    retry_config retry;
    retry.max_attempts = config_.get<int>(settings::section::connection_settings, settings::key::retries, 5);
    return retry_policy(retry);
}

std::string transport::build_url(const std::string& path, std::optional<int> version) const {
    std::string url = endpoint();
    if (version) url += "/v" + std::to_string(*version);
    url += path;
    return url;
}

std::chrono::milliseconds transport::select_timeout(const std::string& path,
                                                    std::optional<std::chrono::milliseconds> timeout) const {
    if (timeout) return *timeout;
    for (auto long_path : LONG_TIMEOUT_PATHS) {
        if (path == long_path) return long_timeout();
    }
    return default_timeout();
}

std::string transport::substitute(std::string value) const {
    // first occurrence only
    auto pos = value.find(APP_ID_PLACEHOLDER);
    if (pos != std::string::npos) {
        value.replace(pos, APP_ID_PLACEHOLDER.size(), credential_.app());
    }
    return value;
}

http::form transport::encode_fields(request_fields& fields, bool multipart) const {
    http::form form;
    form.multipart(multipart);

    for (auto& [name, value] : fields) {
        if (auto text = std::get_if<std::string>(&value)) {
            form.field(name, substitute(std::move(*text)));
            continue;
        }

        auto& file = std::get<file_field>(value);
        if (!file.source) {
            throw std::invalid_argument("file field '" + name + "' has no source");
        }

        // the whole file is collected in memory before it is attached
        util::stream_chunker chunker(file.chunk_size);
        std::vector<std::string> chunks;
        chunker.process(*file.source, chunks);

        std::string content;
        content.reserve(chunker.bytes_emitted());
        for (const auto& chunk : chunks) content += chunk;

        LOG_DEBUG("file field '{}' ({}): {} bytes in {} chunks", name, file.filename,
                  chunker.bytes_emitted(), chunker.chunks_emitted());
        form.file(name, std::move(content), file.filename, file.content_type);
    }
    return form;
}

std::shared_ptr<http::http_request> transport::build_request(const std::string& url, http::method method,
                                                             const http::form& form) const {
    auto request = std::make_shared<http::http_request>();
    request->set_method(method);

    std::string target = url;
    if (method == http::method::GET) {
        // GET carries its fields in the query string
        if (form.is_multipart()) {
            throw std::invalid_argument("file fields require a POST request");
        }
        if (!form.empty()) target += "?" + form.body();
    } else {
        request->set_content(form.body(), form.content_type());
    }

    if (!request->set_url(target)) {
        throw std::invalid_argument("invalid request url: " + target);
    }

    request->add_header(std::string(http::header::authorization), "Bearer " + credential_.token());
    request->add_header(std::string(http::header::user_agent), util::user_agent());
    return request;
}

api_response transport::send_request(std::string path,
                                     http::method method,
                                     request_fields fields,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     std::optional<int> version,
                                     const body_consumer& consumer) {
    if (path.empty() || path.front() != '/') path.insert(path.begin(), '/');

    const auto url = build_url(path, version);
    const auto deadline = select_timeout(path, timeout);
    const auto form = encode_fields(fields, method != http::method::GET);
    const auto policy = retries();

    std::string last_error;
    for (int attempt = 1; ; ++attempt) {
        auto request = build_request(url, method, form);
        LOG_DEBUG("{} {} (attempt {}/{}, timeout {} ms)", http::get_method(method), url,
                  attempt, policy.max_attempts(), deadline.count());

        std::string json_body;
        raw_response raw;
        bool forwarded = false;
        std::exception_ptr consumer_failure;

        auto result = backend_->send_streaming(request, [&](const http::stream_info& info) {
            if (is_json_content(info.content_type)) {
                json_body.append(info.data);
                return true;
            }
            // a non-2xx body without JSON is dropped, the attempt failed
            if (info.status_code < 200 || info.status_code >= 300) return true;

            raw.bytes_received += info.data.size();
            if (!consumer) {
                raw.body.append(info.data);
                return true;
            }
            forwarded = true;
            try {
                consumer(info.data);
            } catch (...) {
                consumer_failure = std::current_exception();
                return false;
            }
            return true;
        }, deadline);

        if (consumer_failure) std::rethrow_exception(consumer_failure);

        if (result.completed() && is_json_content(result.content_type)) {
            nlohmann::json document;
            try {
                document = nlohmann::json::parse(json_body);
            } catch (const nlohmann::json::parse_error& e) {
                LOG_ERROR("invalid JSON response from {}: {}", url, e.what());
                throw api_error(error_kind::invalid_json_response, e.what());
            }
            response_inspector::raise_for_response(document);
            return api_response(std::in_place_index<0>, std::move(document));
        }

        if (result.ok()) {
            raw.status_code = result.status_code;
            raw.content_type = result.content_type;
            raw.headers = std::move(result.headers);
            LOG_DEBUG("{} answered {} ({}, {} bytes)", url, raw.status_code, raw.content_type, raw.bytes_received);
            return api_response(std::in_place_index<1>, std::move(raw));
        }

        last_error = result.has_network_error() ? result.error
                                                : "HTTP status " + std::to_string(result.status_code);

        if (forwarded) {
            LOG_ERROR("{} failed after {} body bytes: {}", url, raw.bytes_received, last_error);
            throw api_error(error_kind::network_connection,
                            "Transfer interrupted after " + std::to_string(raw.bytes_received) +
                            " bytes! Error: " + last_error);
        }

        if (!policy.should_retry(attempt)) break;

        auto wait = policy.delay(attempt);
        LOG_WARNING("{} failed ({}), retrying in {} ms", url, last_error, wait.count());
        sleep_(wait);
    }

    VERTOPAL_LOG_ERROR_TAG("transport", "{} failed after {} attempts: {}", url, policy.max_attempts(), last_error);
    throw api_error(error_kind::network_connection,
                    "All " + std::to_string(policy.max_attempts()) + " retries failed! Error: " + last_error);
}

nlohmann::json transport::send_json(std::string path, request_fields fields,
                                    std::optional<std::chrono::milliseconds> timeout,
                                    std::optional<int> version) {
    auto response = send_request(std::move(path), http::method::POST, std::move(fields), timeout, version);
    if (auto document = std::get_if<nlohmann::json>(&response)) {
        return std::move(*document);
    }
    const auto& raw = std::get<raw_response>(response);
    throw api_error(error_kind::invalid_json_response,
                    "expected a JSON response but received '" + raw.content_type + "'");
}

}
