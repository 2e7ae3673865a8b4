#include "file.hpp"
#include "../api/errors.hpp"
#include "../util/logger.hpp"
#include <system_error>

namespace vertopal::io {

file_source::file_source(const std::filesystem::path& path)
    : path_(path), stream_(path, std::ios::binary) {
    if (!stream_) {
        throw api_error(error_kind::input_not_found, "Cannot open input file: " + path.string());
    }
}

size_t file_source::read_some(char* buffer, size_t size) {
    stream_.read(buffer, static_cast<std::streamsize>(size));
    auto count = static_cast<size_t>(stream_.gcount());
    if (count == 0 && stream_.bad()) {
        throw api_error(error_kind::input_not_found, "Error reading input file: " + path_.string());
    }
    return count;
}

file_sink::file_sink(const std::filesystem::path& path, bool append, size_t buffer_size)
    : path_(path) {
    if (buffer_size > 0) {
        // must be installed before the file is opened
        buffer_.resize(buffer_size);
        stream_.rdbuf()->pubsetbuf(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    }
    stream_.open(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!stream_) {
        throw api_error(error_kind::output_write, "Cannot open output file: " + path.string());
    }
}

file_sink::~file_sink() {
    if (stream_.is_open()) {
        stream_.close();
        if (stream_.fail()) {
            LOG_ERROR("error closing output file {}", path_.string());
        }
    }
}

void file_sink::write(std::string_view data) {
    stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        throw api_error(error_kind::output_write, "Error writing output file: " + path_.string());
    }
}

void file_sink::close() {
    if (!stream_.is_open()) return;
    stream_.close();
    if (stream_.fail()) {
        throw api_error(error_kind::output_write, "Error closing output file: " + path_.string());
    }
}

file_input::file_input(std::filesystem::path path,
                       std::optional<std::string> filename,
                       std::optional<std::string> content_type)
    : path_(std::move(path)) {
    if (filename && !filename->empty()) {
        filename_ = std::move(*filename);
    } else {
        filename_ = path_.filename().string();
        if (filename_.empty()) filename_ = "upload.bin";
    }
    content_type_ = content_type && !content_type->empty() ? std::move(*content_type)
                                                          : "application/octet-stream";
}

std::unique_ptr<byte_source> file_input::open() {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw api_error(error_kind::input_not_found, "Input file not found: " + path_.string());
    }
    LOG_DEBUG("opening input file {}", path_.string());
    return std::make_unique<file_source>(path_);
}

file_output::file_output(std::string path, bool append, size_t buffer_size)
    : path_(std::move(path)), append_(append), buffer_size_(buffer_size) {}

std::unique_ptr<byte_sink> file_output::open() {
    LOG_DEBUG("opening output file {} ({})", path_, append_ ? "append" : "truncate");
    return std::make_unique<file_sink>(path_, append_, buffer_size_);
}

}
