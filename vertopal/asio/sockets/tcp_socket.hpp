#ifndef VERTOPAL_ASIO_TCP_SOCKET_HPP
#define VERTOPAL_ASIO_TCP_SOCKET_HPP

#include <memory>
#include <utility>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../../util/logger.hpp"
#include "socket.hpp"

namespace vertopal::asio {

class tcp_socket : public socket {

public:
    // constructors and destructors
    tcp_socket(const std::string& context, boost::asio::io_context& io_context);
    ~tcp_socket() override;

    // socket control
    awaitable<void> connect(
        const std::string& host,
        const std::string& port,
        std::chrono::seconds timeout) override;
    void close() override;
    void cancel() override;

    // read operations
    awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) override;

    // write operations
    awaitable<size_t> write(const std::vector<boost::asio::const_buffer>& buffers) override;

    // some getters to check the state
    bool is_open() const override;
    std::string get_remote_ip() const override;
    std::string get_remote_port() const override;

protected:
    boost::asio::ip::tcp::socket socket_;
    boost::asio::ip::tcp::resolver resolver_;
    bool resolving_ = false;
    bool resolve_cancelled_ = false;
};

}

#endif
