#include "client_connection.hpp"
#include "../common/http_response.hpp"
#include "../../util/logger.hpp"
#include "../../util/compression.hpp"
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <optional>

namespace vertopal::http {

std::atomic<unsigned long> client_connection::connections(0);

namespace {

    bool is_end_of_stream(const boost::system::error_code& ec) {
        return ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated;
    }

}

client_connection::client_connection(std::shared_ptr<asio::socket> socket)
    : socket_(std::move(socket)) {
    ++connections;
    LOG_TRACE("created http client connection. total: {}", connections.load());
}

client_connection::~client_connection() {
    --connections;
    LOG_TRACE("releasing http client connection. total: {}", connections.load());
}

awaitable<void> client_connection::ensure_connected(const http_request& request) {
    if (socket_->is_open()) {
        co_return;
    }
    LOG_TRACE("connecting to: {}:{}", request.get_host(), request.get_port());
    co_await socket_->connect(request.get_host(), request.get_port(), CONNECT_TIMEOUT);
    LOG_TRACE("connection established");
}

awaitable<void> client_connection::exchange(http_request& request, stream_result& result,
                                            const stream_callback& callback) {
    co_await ensure_connected(request);

    request.log("CLIENT->");

    response_parser_.reset();

    std::unique_ptr<util::inflater> decoder;
    size_t declared_total = 0;

    // forwards decoded bytes to the user callback
    auto deliver = [&](std::string_view data) -> bool {
        result.bytes_transferred += data.size();
        stream_info info{data, result.bytes_transferred, declared_total, result.status_code, result.content_type};
        if (!callback(info)) {
            result.aborted = true;
            return false;
        }
        return true;
    };

    response_parser_.set_on_headers([&](const http_response& response) -> bool {
        result.status_code = response.get_status_code();
        result.content_type = response.get_content_type();
        for (const auto& [key, value] : response.get_headers()) {
            result.headers[key] = value;
        }
        response.log("<-SERVER");

        const auto& encoding = response.get_header(header::content_encoding);
        if (!encoding.empty()) {
            auto format = util::inflater::from_encoding(encoding);
            if (!format) {
                LOG_ERROR("unsupported content encoding: {}", encoding);
                return false;
            }
            decoder = std::make_unique<util::inflater>(*format);
        } else if (response.has_content_length()) {
            declared_total = response.get_content_length();
        }
        return true;
    });

    response_parser_.set_on_body([&](std::string_view data) -> bool {
        if (decoder) {
            if (!decoder->feed(data, deliver)) {
                if (!result.aborted) result.error = "cannot decode response content";
                return false;
            }
            return true;
        }
        return deliver(data);
    });

    // send request
    std::vector<boost::asio::const_buffer> buffers;
    request.to_buffer(buffers);
    co_await socket_->write(buffers);

    // read response
    bool head_request = request.get_method() == method::HEAD;
    while (true) {
        size_t bytes = 0;
        bool end_of_stream = false;
        try {
            bytes = co_await socket_->read_some(buffer_, MAX_BUFFER_SIZE);
        } catch (const boost::system::system_error& e) {
            if (!is_end_of_stream(e.code())) throw;
            end_of_stream = true;
        }

        if (end_of_stream) {
            if (response_parser_.on_eof()) break;
            throw boost::system::system_error(boost::asio::error::eof, "connection closed before response end");
        }

        boost::tribool parse_result = response_parser_.parse(buffer_, buffer_ + bytes, head_request);
        if (parse_result) break;
        if (!parse_result) {
            if (result.error.empty() && !result.aborted) {
                result.error = "invalid http response";
            }
            socket_->close();
            co_return;
        }
        // else: indeterminate, keep reading
    }

    if (decoder && !decoder->finished()) {
        result.error = "truncated encoded response content";
        socket_->close();
        co_return;
    }

    auto response = response_parser_.consume_response();
    if (!response || !response->keep_alive()) {
        socket_->close();
    }
}

awaitable<stream_result> client_connection::send_request_streaming(
    std::shared_ptr<http_request> request,
    stream_callback callback,
    std::chrono::milliseconds timeout) {

    stream_result result;
    bool reused = socket_->is_open();

    // watchdog: closes the socket when the deadline expires
    auto self = shared_from_this();
    auto timer = std::make_shared<boost::asio::steady_timer>(socket_->get_io_context());
    auto expired = std::make_shared<bool>(false);
    timer->expires_after(timeout);
    co_spawn(socket_->get_io_context(), [self, timer, expired]() -> awaitable<void> {
        boost::system::error_code ec;
        co_await timer->async_wait(redirect_error(use_awaitable, ec));
        if (!ec) {
            *expired = true;
            self->socket_->cancel();
            self->socket_->close();
        }
    }, detached);

    for (int attempt = 0; attempt < 2; ++attempt) {
        std::optional<boost::system::system_error> failure;
        try {
            co_await exchange(*request, result, callback);
        } catch (const boost::system::system_error& e) {
            failure = e;
        } catch (...) {
            // callback failure, the socket is left mid-response
            timer->cancel();
            socket_->close();
            response_parser_.reset();
            throw;
        }

        if (!failure) break;

        socket_->close();
        response_parser_.reset();

        // a kept-alive socket may have been closed by the server while idle
        if (reused && attempt == 0 && !*expired && result.status_code == 0 && result.bytes_transferred == 0) {
            LOG_DEBUG("stale keep-alive connection, reconnecting: {}", failure->what());
            reused = false;
            continue;
        }

        if (*expired) {
            result.error = "request timed out after " + std::to_string(timeout.count()) + " ms";
        } else {
            result.error = failure->what();
        }
        LOG_DEBUG("http exchange failed: {}", result.error);
        break;
    }

    timer->cancel();
    co_return result;
}

void client_connection::close() {
    if (socket_->is_open()) {
        socket_->close();
    }
    response_parser_.reset();
}

}
