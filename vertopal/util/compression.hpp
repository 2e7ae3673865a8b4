#ifndef VERTOPAL_UTIL_COMPRESSION_HPP
#define VERTOPAL_UTIL_COMPRESSION_HPP

#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include <stdexcept>
#include <zlib.h>

namespace vertopal::util {

/**
 * Incremental decoder for gzip and deflate (zlib) content encodings.
 * Compressed input may be fed in arbitrary pieces; decoded output is handed
 * to the sink callback as soon as zlib produces it, so a streamed body never
 * needs to be held in memory.
 */
class inflater {
public:
    using sink = std::function<bool(std::string_view)>;

    enum class format { gzip, deflate };

    explicit inflater(format fmt) {
        // windowBits: 15 + 16 selects gzip framing, 15 the zlib framing used by HTTP deflate
        if (inflateInit2(&strm_, fmt == format::gzip ? 15 + 16 : 15) != Z_OK) {
            throw std::runtime_error("cannot initialize zlib inflater");
        }
    }

    ~inflater() {
        inflateEnd(&strm_);
    }

    inflater(const inflater&) = delete;
    inflater& operator=(const inflater&) = delete;

    // Select the decoder for a Content-Encoding value, if supported
    static std::optional<format> from_encoding(std::string_view encoding) {
        if (encoding == "gzip" || encoding == "x-gzip") return format::gzip;
        if (encoding == "deflate") return format::deflate;
        return std::nullopt;
    }

    /**
     * Feed compressed bytes. Returns false on corrupt input or when the sink
     * asks to stop.
     */
    bool feed(std::string_view data, const sink& out) {
        if (finished_) return data.empty();

        strm_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        strm_.avail_in = static_cast<uInt>(data.size());

        char buffer[16384];
        do {
            strm_.next_out = reinterpret_cast<Bytef*>(buffer);
            strm_.avail_out = sizeof(buffer);

            int ret = inflate(&strm_, Z_NO_FLUSH);
            if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
                return false;
            }

            size_t produced = sizeof(buffer) - strm_.avail_out;
            if (produced > 0 && !out(std::string_view(buffer, produced))) {
                return false;
            }

            if (ret == Z_STREAM_END) {
                finished_ = true;
                return true;
            }
            if (ret == Z_BUF_ERROR) {
                // needs more input
                return true;
            }
        } while (strm_.avail_in > 0 || strm_.avail_out == 0);

        return true;
    }

    // True once the compressed stream trailer has been consumed
    bool finished() const { return finished_; }

private:
    z_stream strm_{};
    bool finished_ = false;
};

} // namespace vertopal::util

#endif // VERTOPAL_UTIL_COMPRESSION_HPP
