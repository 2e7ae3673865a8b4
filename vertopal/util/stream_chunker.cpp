#include "stream_chunker.hpp"
#include "logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace vertopal::util {

stream_chunker::stream_chunker(size_t chunk_size) : chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
}

io::byte_sink& stream_chunker::process(io::byte_source& source, io::byte_sink& sink) {
    consume(source, [&sink](std::string_view chunk) { sink.write(chunk); });
    return sink;
}

std::vector<std::string>& stream_chunker::process(io::byte_source& source,
                                                  std::vector<std::string>& collector) {
    consume(source, [&collector](std::string_view chunk) { collector.emplace_back(chunk); });
    return collector;
}

void stream_chunker::consume(io::byte_source& source, const chunk_handler& emit) {
    switch (source.kind()) {
        case io::byte_source::source_kind::pull: {
            auto& pull = static_cast<io::pull_source&>(source);
            std::vector<char> buffer(std::max<size_t>(chunk_size_, 8192));
            size_t read;
            while ((read = pull.read_some(buffer.data(), buffer.size())) > 0) {
                feed(std::string_view(buffer.data(), read), emit);
            }
            break;
        }
        case io::byte_source::source_kind::push: {
            auto& push = static_cast<io::push_source&>(source);
            push.drain([this, &emit](std::string_view data) { feed(data, emit); });
            break;
        }
    }
    flush(emit);
    LOG_TRACE("stream chunker emitted {} bytes in {} chunks", bytes_emitted_, chunks_emitted_);
}

void stream_chunker::feed(std::string_view data, const chunk_handler& emit) {
    // complete the pending partial chunk first
    if (!buffer_.empty()) {
        auto take = std::min(chunk_size_ - buffer_.size(), data.size());
        buffer_.append(data.substr(0, take));
        data.remove_prefix(take);
        if (buffer_.size() < chunk_size_) return;
        emit_chunk(buffer_, emit);
        buffer_.clear();
    }

    while (data.size() >= chunk_size_) {
        emit_chunk(data.substr(0, chunk_size_), emit);
        data.remove_prefix(chunk_size_);
    }

    buffer_.append(data);
}

void stream_chunker::flush(const chunk_handler& emit) {
    if (buffer_.empty()) return;
    emit_chunk(buffer_, emit);
    buffer_.clear();
}

void stream_chunker::emit_chunk(std::string_view chunk, const chunk_handler& emit) {
    emit(chunk);
    bytes_emitted_ += chunk.size();
    ++chunks_emitted_;
}

chunked_sink::chunked_sink(std::unique_ptr<io::byte_sink> target, size_t chunk_size)
    : target_(std::move(target)), chunker_(chunk_size) {}

void chunked_sink::write(std::string_view data) {
    chunker_.feed(data, [this](std::string_view chunk) { target_->write(chunk); });
}

void chunked_sink::close() {
    if (closed_) return;
    closed_ = true;
    chunker_.flush([this](std::string_view chunk) { target_->write(chunk); });
    target_->close();
}

}
