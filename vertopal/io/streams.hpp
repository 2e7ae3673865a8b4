#ifndef VERTOPAL_IO_STREAMS_HPP
#define VERTOPAL_IO_STREAMS_HPP

#include <cstddef>
#include <functional>
#include <string_view>

namespace vertopal::io {

/**
 * Byte source consumed by the stream chunker. A source is either pulled
 * (the consumer asks for the next bytes) or pushes its bytes into a
 * callback until it is exhausted. kind() tells which interface to use.
 */
class byte_source {
public:
    enum class source_kind { pull, push };

    virtual ~byte_source() = default;
    virtual source_kind kind() const = 0;
};

class pull_source : public byte_source {
public:
    source_kind kind() const final { return source_kind::pull; }

    // reads up to size bytes, 0 means the source is exhausted
    virtual size_t read_some(char* buffer, size_t size) = 0;
};

class push_source : public byte_source {
public:
    using data_callback = std::function<void(std::string_view)>;

    source_kind kind() const final { return source_kind::push; }

    // delivers every remaining segment, returns once the source is exhausted
    virtual void drain(const data_callback& callback) = 0;
};

/**
 * Streaming destination. close() flushes and releases the underlying
 * resource and is also performed on destruction.
 */
class byte_sink {
public:
    virtual ~byte_sink() = default;

    virtual void write(std::string_view data) = 0;
    virtual void close() {}
};

}

#endif
