#include "tcp_socket.hpp"

namespace vertopal::asio {

tcp_socket::tcp_socket(const std::string& context, boost::asio::io_context& io_context)
    : socket(context, io_context), socket_(io_context), resolver_(io_context) {
}

tcp_socket::~tcp_socket() {
    LOG_TRACE("releasing tcp connection ({})", context_);
    close();
}

void tcp_socket::close() {
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    socket_.close(ec);
}

void tcp_socket::cancel() {
    boost::system::error_code ec;
    if (resolving_) {
        resolve_cancelled_ = true;
        resolver_.cancel();
    }
    socket_.cancel(ec);
}

awaitable<void> tcp_socket::connect(
    const std::string& host,
    const std::string& port,
    std::chrono::seconds timeout)
{
    close();

    // resolve host, cancel() aborts a pending lookup even if it succeeds later
    resolving_ = true;
    resolve_cancelled_ = false;
    boost::system::error_code resolve_ec;
    auto endpoints = co_await resolver_.async_resolve(host, port, redirect_error(use_awaitable, resolve_ec));
    resolving_ = false;
    if (resolve_cancelled_) {
        throw boost::system::system_error(boost::asio::error::operation_aborted);
    }
    if (resolve_ec) {
        throw boost::system::system_error(resolve_ec);
    }

    // the timer is shared with the watchdog coroutine, which may outlive this frame
    auto timer = std::make_shared<boost::asio::steady_timer>(io_context_);
    auto timed_out = std::make_shared<bool>(false);
    timer->expires_after(timeout);

    co_spawn(io_context_, [this, timer, timed_out]() -> awaitable<void> {
        boost::system::error_code ec;
        co_await timer->async_wait(redirect_error(use_awaitable, ec));
        if (!ec) {
            *timed_out = true;
            cancel();
        }
    }, detached);

    boost::system::error_code connect_ec;
    co_await boost::asio::async_connect(socket_, endpoints, redirect_error(use_awaitable, connect_ec));
    timer->cancel();

    if (connect_ec) {
        close();
        throw boost::system::system_error(*timed_out ? boost::asio::error::timed_out : connect_ec);
    }

    LOG_TRACE("connected to {}:{}", get_remote_ip(), get_remote_port());

    // run handshake if required (for ssl sockets)
    if (requires_handshake()) {
        try {
            co_await handshake(host);
        } catch (const boost::system::system_error&) {
            close();
            throw;
        }
    }
}

std::string tcp_socket::get_remote_ip() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return remote_ep.address().to_string();
    }
    return "0.0.0.0";
}

std::string tcp_socket::get_remote_port() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return std::to_string(remote_ep.port());
    }
    return "0";
}

awaitable<size_t> tcp_socket::read_some(uint8_t* buffer, size_t max_size) {
    co_return co_await socket_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        use_awaitable);
}

awaitable<size_t> tcp_socket::write(const std::vector<boost::asio::const_buffer>& buffers) {
    co_return co_await boost::asio::async_write(
        socket_,
        buffers,
        use_awaitable);
}

bool tcp_socket::is_open() const {
    return socket_.is_open();
}

}
