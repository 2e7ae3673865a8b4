#ifndef VERTOPAL_ASIO_SSL_SOCKET_HPP
#define VERTOPAL_ASIO_SSL_SOCKET_HPP

#include "tcp_socket.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

namespace vertopal::asio {

class ssl_socket : public tcp_socket {
public:
    // constructors and destructors
    ssl_socket(const std::string& context, boost::asio::io_context& io_context,
               const std::shared_ptr<boost::asio::ssl::context>& ssl_context);
    ~ssl_socket() override;

    // socket control
    void close() override;
    bool requires_handshake() const override;
    awaitable<void> handshake(const std::string& host) override;

    // read operations
    awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) override;

    // write operations
    awaitable<size_t> write(const std::vector<boost::asio::const_buffer>& buffers) override;

    // builds a peer verifying client context using the system trust store
    static std::shared_ptr<boost::asio::ssl::context> client_context();

private:
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket&> ssl_stream_;
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
};

}

#endif
