#ifndef VERTOPAL_IO_MEMORY_HPP
#define VERTOPAL_IO_MEMORY_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "protocols.hpp"

namespace vertopal::io {

// push source delivering a fixed list of segments
class segment_source : public push_source {
public:
    explicit segment_source(std::vector<std::string> segments);

    void drain(const data_callback& callback) override;

private:
    std::vector<std::string> segments_;
};

// sink appending to a string owned by someone else
class string_sink : public byte_sink {
public:
    explicit string_sink(std::string& target) : target_(target) {}

    void write(std::string_view data) override { target_.append(data); }

private:
    std::string& target_;
};

/**
 * In-memory conversion input. The content is delivered as the configured
 * segments, so a source split at arbitrary boundaries can be reproduced.
 */
class memory_input : public readable {
public:
    explicit memory_input(std::string content,
                          std::optional<std::string> filename = std::nullopt,
                          std::optional<std::string> content_type = std::nullopt);
    explicit memory_input(std::vector<std::string> segments,
                          std::optional<std::string> filename = std::nullopt,
                          std::optional<std::string> content_type = std::nullopt);

    std::unique_ptr<byte_source> open() override;

    std::optional<std::string> filename() const override { return filename_; }
    std::optional<std::string> content_type() const override { return content_type_; }

private:
    std::vector<std::string> segments_;
    std::optional<std::string> filename_;
    std::optional<std::string> content_type_;
};

// in-memory conversion output, open() clears previous content
class memory_output : public path_writable {
public:
    memory_output() = default;
    explicit memory_output(std::string path) : path_(std::move(path)) {}

    std::unique_ptr<byte_sink> open() override;

    const std::string& data() const { return data_; }
    unsigned open_count() const { return open_count_; }

    const std::string& path() const override { return path_; }
    void set_path(std::string path) override { path_ = std::move(path); }

private:
    std::string data_;
    std::string path_;
    unsigned open_count_ = 0;
};

}

#endif
