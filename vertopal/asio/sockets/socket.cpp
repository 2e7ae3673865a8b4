#include "socket.hpp"

namespace vertopal::asio {

    socket::socket(const std::string& context, boost::asio::io_context& io_context)
        : context_(context), io_context_(io_context) {
    }

    socket::~socket() = default;

    boost::asio::io_context& socket::get_io_context() const {
        return io_context_;
    }

    bool socket::requires_handshake() const {
        return false;
    }

    awaitable<void> socket::handshake(const std::string&) {
        co_return;
    }

}
