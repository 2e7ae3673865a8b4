#ifndef VERTOPAL_HTTP_CLIENT_HTTP_BACKEND_HPP
#define VERTOPAL_HTTP_CLIENT_HTTP_BACKEND_HPP

#include <chrono>
#include <memory>
#include "stream_types.hpp"
#include "../common/http_request.hpp"

namespace vertopal::http {

/**
 * Performs one physical HTTP exchange. The response body is always handed
 * to the stream callback; callers decide whether to buffer or forward it.
 * Connection failures and deadline expiry are reported in
 * stream_result::error, never thrown. Exceptions raised by the callback
 * abort the exchange and reach the caller.
 */
class http_backend {
public:
    virtual ~http_backend() = default;

    virtual stream_result send_streaming(std::shared_ptr<http_request> request,
                                         stream_callback callback,
                                         std::chrono::milliseconds timeout) = 0;
};

} // namespace vertopal::http

#endif
