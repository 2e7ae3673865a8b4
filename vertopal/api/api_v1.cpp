#include "api_v1.hpp"
#include "../util/logger.hpp"
#include "../util/stream_chunker.hpp"

namespace vertopal::api {

api_v1::api_v1(credential cred,
               std::shared_ptr<http::http_backend> backend,
               const config& cfg,
               sleep_function sleep)
    : transport_(std::move(cred), std::move(backend), cfg, std::move(sleep)) {}

api_v1::api_v1(const config& cfg)
    : transport_(credential::from_config(cfg), nullptr, cfg) {}

nlohmann::json api_v1::base_data() const {
    return {{"app", transport_.get_credential().app()}};
}

nlohmann::json api_v1::call(const char* path, nlohmann::json data) {
    request_fields fields;
    fields.emplace("data", data.dump());
    return transport_.send_json(path, std::move(fields), std::nullopt, VERSION);
}

nlohmann::json api_v1::upload_file(io::readable& readable, std::optional<size_t> chunk_size) {
    file_field file;
    file.source = readable.open();
    file.filename = readable.filename().value_or("upload.bin");
    file.content_type = readable.content_type().value_or("application/octet-stream");
    file.chunk_size = chunk_size.value_or(transport_.stream_chunk_size());
    if (file.filename.empty()) file.filename = "upload.bin";
    if (file.content_type.empty()) file.content_type = "application/octet-stream";

    LOG_DEBUG("uploading {} ({})", file.filename, file.content_type);

    request_fields fields;
    fields.emplace("data", base_data().dump());
    fields.emplace("file", std::move(file));
    return transport_.send_json("/upload/file", std::move(fields), std::nullopt, VERSION);
}

nlohmann::json api_v1::convert_file(const std::string& connector,
                                    const std::string& output_format,
                                    const std::optional<std::string>& input_format,
                                    strategy_mode mode) {
    nlohmann::json parameters;
    if (input_format && !input_format->empty()) {
        parameters["input"] = *input_format;
    }
    parameters["output"] = output_format;

    auto data = base_data();
    data["connector"] = connector;
    data["include"] = nlohmann::json::array({"result", "entity"});
    data["mode"] = std::string(to_string(mode));
    data["parameters"] = std::move(parameters);
    return call("/convert/file", std::move(data));
}

nlohmann::json api_v1::convert_status(const std::string& connector) {
    auto data = base_data();
    data["connector"] = connector;
    return call("/convert/status", std::move(data));
}

nlohmann::json api_v1::task_response(const std::string& connector) {
    auto data = base_data();
    data["connector"] = connector;
    data["include"] = nlohmann::json::array({"result"});
    return call("/task/response", std::move(data));
}

nlohmann::json api_v1::download_url(const std::string& connector) {
    auto data = base_data();
    data["connector"] = connector;
    return call("/download/url", std::move(data));
}

size_t api_v1::download_url_get(io::writable& writable,
                                const std::string& connector,
                                std::optional<size_t> chunk_size) {
    const auto chunk = chunk_size.value_or(transport_.stream_chunk_size());
    if (chunk == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }

    auto data = base_data();
    data["connector"] = connector;

    request_fields fields;
    fields.emplace("data", data.dump());

    std::unique_ptr<util::chunked_sink> sink;
    auto open_sink = [&]() {
        if (!sink) sink = std::make_unique<util::chunked_sink>(writable.open(), chunk);
    };

    auto response = transport_.send_request("/download/url/get", http::method::POST, std::move(fields),
                                            std::nullopt, VERSION,
                                            [&](std::string_view bytes) {
                                                open_sink();
                                                sink->write(bytes);
                                            });

    if (std::holds_alternative<nlohmann::json>(response)) {
        LOG_WARNING("download of {} answered with JSON, nothing written", connector);
        return 0;
    }

    open_sink();
    sink->close();
    auto written = sink->chunker().bytes_emitted();
    LOG_DEBUG("downloaded {} bytes for {}", written, connector);
    return written;
}

nlohmann::json api_v1::format_get(const std::string& format) {
    auto data = base_data();
    data["parameters"] = {{"format", format}};
    return call("/format/get", std::move(data));
}

nlohmann::json api_v1::convert_graph(const std::string& input_format, const std::string& output_format) {
    auto data = base_data();
    data["parameters"] = {{"input", input_format}, {"output", output_format}};
    return call("/convert/graph", std::move(data));
}

nlohmann::json api_v1::convert_formats(sublist_mode sublist, const std::optional<std::string>& format) {
    nlohmann::json parameters{{"sublist", std::string(to_string(sublist))}};
    if (format && !format->empty()) {
        parameters["format"] = *format;
    }

    auto data = base_data();
    data["parameters"] = std::move(parameters);
    return call("/convert/formats", std::move(data));
}

}
