#include "memory.hpp"

namespace vertopal::io {

segment_source::segment_source(std::vector<std::string> segments)
    : segments_(std::move(segments)) {}

void segment_source::drain(const data_callback& callback) {
    auto segments = std::move(segments_);
    segments_.clear();
    for (const auto& segment : segments) {
        if (!segment.empty()) callback(segment);
    }
}

memory_input::memory_input(std::string content,
                           std::optional<std::string> filename,
                           std::optional<std::string> content_type)
    : filename_(std::move(filename)), content_type_(std::move(content_type)) {
    segments_.push_back(std::move(content));
}

memory_input::memory_input(std::vector<std::string> segments,
                           std::optional<std::string> filename,
                           std::optional<std::string> content_type)
    : segments_(std::move(segments)), filename_(std::move(filename)),
      content_type_(std::move(content_type)) {}

std::unique_ptr<byte_source> memory_input::open() {
    return std::make_unique<segment_source>(segments_);
}

std::unique_ptr<byte_sink> memory_output::open() {
    data_.clear();
    ++open_count_;
    return std::make_unique<string_sink>(data_);
}

}
