#ifndef VERTOPAL_UTIL_STREAM_CHUNKER_HPP
#define VERTOPAL_UTIL_STREAM_CHUNKER_HPP

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "../io/streams.hpp"

namespace vertopal::util {

/**
 * Re-chunks a byte stream into fixed size chunks. Every emitted chunk holds
 * exactly chunk_size bytes except the last one, which may be shorter. An
 * empty source emits nothing. Boundaries depend only on the byte count, not
 * on how the source splits its data.
 *
 * Usage:
 *   util::stream_chunker chunker(4096);
 *   std::vector<std::string> chunks;
 *   chunker.process(*source, chunks);
 *
 * or incrementally, when bytes arrive from a callback:
 *   chunker.feed(data, emit);
 *   ...
 *   chunker.flush(emit);
 */
class stream_chunker {
public:
    using chunk_handler = std::function<void(std::string_view)>;

    // throws std::invalid_argument when chunk_size is 0
    explicit stream_chunker(size_t chunk_size);

    io::byte_sink& process(io::byte_source& source, io::byte_sink& sink);
    std::vector<std::string>& process(io::byte_source& source, std::vector<std::string>& collector);

    void feed(std::string_view data, const chunk_handler& emit);
    void flush(const chunk_handler& emit);

    size_t chunk_size() const { return chunk_size_; }
    size_t bytes_emitted() const { return bytes_emitted_; }
    size_t chunks_emitted() const { return chunks_emitted_; }
    size_t pending() const { return buffer_.size(); }

private:
    void consume(io::byte_source& source, const chunk_handler& emit);
    void emit_chunk(std::string_view chunk, const chunk_handler& emit);

    size_t chunk_size_;
    std::string buffer_;
    size_t bytes_emitted_ = 0;
    size_t chunks_emitted_ = 0;
};

/**
 * byte_sink adapter forwarding fixed size chunks to another sink. close()
 * flushes the trailing partial chunk before closing the target.
 */
class chunked_sink : public io::byte_sink {
public:
    chunked_sink(std::unique_ptr<io::byte_sink> target, size_t chunk_size);

    void write(std::string_view data) override;
    void close() override;

    const stream_chunker& chunker() const { return chunker_; }

private:
    std::unique_ptr<io::byte_sink> target_;
    stream_chunker chunker_;
    bool closed_ = false;
};

}

#endif
