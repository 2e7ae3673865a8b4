#ifndef VERTOPAL_HTTP_CLIENT_CONNECTION_HPP
#define VERTOPAL_HTTP_CLIENT_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <boost/noncopyable.hpp>

#include "../common/http_request.hpp"
#include "response_parser.hpp"
#include "stream_types.hpp"
#include "../../asio/sockets/socket.hpp"
#include "../../util/types.hpp"

namespace vertopal::http {

class client_connection : public std::enable_shared_from_this<client_connection>, public boost::noncopyable {

    static constexpr unsigned MAX_BUFFER_SIZE = 8192;
    static constexpr auto CONNECT_TIMEOUT = std::chrono::seconds{10};

public:
    static std::atomic<unsigned long> connections;

    explicit client_connection(std::shared_ptr<asio::socket> socket);
    virtual ~client_connection();

    /**
     * Send the request and stream the decoded response body through the
     * callback. The whole exchange (connect, write, read) must finish within
     * timeout, otherwise the socket is closed and the result carries a
     * timeout error.
     */
    awaitable<stream_result> send_request_streaming(std::shared_ptr<http_request> request,
                                                    stream_callback callback,
                                                    std::chrono::milliseconds timeout);

    // Connection management
    void close();
    bool is_open() const { return socket_ && socket_->is_open(); }
    std::shared_ptr<asio::socket> get_socket() const { return socket_; }

private:
    awaitable<void> ensure_connected(const http_request& request);
    awaitable<void> exchange(http_request& request, stream_result& result, const stream_callback& callback);

    std::shared_ptr<asio::socket> socket_;
    uint8_t buffer_[MAX_BUFFER_SIZE];
    response_parser response_parser_;
};

}

#endif
