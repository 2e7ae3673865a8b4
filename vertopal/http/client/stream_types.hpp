#ifndef VERTOPAL_HTTP_CLIENT_STREAM_TYPES_HPP
#define VERTOPAL_HTTP_CLIENT_STREAM_TYPES_HPP

#include <string>
#include <string_view>
#include <functional>
#include <map>

namespace vertopal::http {

/**
 * Information passed to stream callbacks for each chunk of data.
 * Content-Encoding is already removed: data holds decoded body bytes.
 */
struct stream_info {
    std::string_view data;          // Current chunk data
    size_t downloaded;              // Total decoded bytes delivered so far
    size_t total;                   // Declared Content-Length (0 if unknown, chunked or encoded)
    int status_code;                // HTTP status code
    std::string_view content_type;  // Response Content-Type header value
};

/**
 * Result of a streaming operation.
 */
struct stream_result {
    int status_code = 0;
    std::string error;                              // Empty if no connection error
    std::map<std::string, std::string> headers;     // Response headers
    std::string content_type;                       // Response Content-Type
    size_t bytes_transferred = 0;                   // Decoded body bytes delivered
    bool aborted = false;                           // Stopped by the stream callback

    /**
     * Returns true if the request succeeded (no error and 2xx status).
     */
    bool ok() const {
        return error.empty() && status_code >= 200 && status_code < 300;
    }

    explicit operator bool() const { return ok(); }

    /**
     * Returns true if the request completed (even if status is not 2xx).
     * Use this to distinguish between network errors and HTTP errors.
     */
    bool completed() const { return error.empty() && status_code > 0; }

    /**
     * Returns true if there was a network/connection error.
     */
    bool has_network_error() const { return !error.empty(); }
};

/**
 * Callback for streaming data.
 * Called for each chunk of data received.
 * Return true to continue, false to abort the download.
 */
using stream_callback = std::function<bool(const stream_info&)>;

} // namespace vertopal::http

#endif // VERTOPAL_HTTP_CLIENT_STREAM_TYPES_HPP
