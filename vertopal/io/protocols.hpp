#ifndef VERTOPAL_IO_PROTOCOLS_HPP
#define VERTOPAL_IO_PROTOCOLS_HPP

#include <memory>
#include <optional>
#include <string>
#include "streams.hpp"

namespace vertopal::io {

// something that can be opened for reading, like a local file
class readable {
public:
    virtual ~readable() = default;

    virtual std::unique_ptr<byte_source> open() = 0;
    virtual std::optional<std::string> filename() const { return std::nullopt; }
    virtual std::optional<std::string> content_type() const { return std::nullopt; }
};

// something that can be opened for writing
class writable {
public:
    virtual ~writable() = default;

    virtual std::unique_ptr<byte_sink> open() = 0;
};

// writable destination whose location can be reassigned before open()
class path_writable : public writable {
public:
    virtual const std::string& path() const = 0;
    virtual void set_path(std::string path) = 0;
};

}

#endif
