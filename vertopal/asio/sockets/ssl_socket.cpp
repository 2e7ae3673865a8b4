#include "ssl_socket.hpp"

namespace vertopal::asio {

ssl_socket::ssl_socket(const std::string& context, boost::asio::io_context& io_context,
                       const std::shared_ptr<boost::asio::ssl::context>& ssl_context)
    : tcp_socket(context, io_context)
    , ssl_stream_(socket_, *ssl_context)
    , ssl_context_(ssl_context) {
}

ssl_socket::~ssl_socket() {
    LOG_TRACE("releasing ssl connection ({})", context_);
}

std::shared_ptr<boost::asio::ssl::context> ssl_socket::client_context() {
    auto context = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
    context->set_default_verify_paths();
    context->set_verify_mode(boost::asio::ssl::verify_peer);
    return context;
}

void ssl_socket::close() {
    // close underlying TCP socket
    tcp_socket::close();

    // clear ssl session to allow reusing socket (if necessary)
    // From SSL_clear: If a session is still open, it is considered bad and will be removed
    // from the session cache, as required by RFC2246
    SSL_clear(ssl_stream_.native_handle());
}

bool ssl_socket::requires_handshake() const {
    return true;
}

awaitable<void> ssl_socket::handshake(const std::string& host) {
    // add support for SNI
    if (!SSL_set_tlsext_host_name(ssl_stream_.native_handle(), host.c_str())) {
        LOG_ERROR("SSL_set_tlsext_host_name failed. SNI will fail");
    }
    // verify the certificate against the requested host name
    ssl_stream_.set_verify_callback(boost::asio::ssl::host_name_verification(host));
    co_await ssl_stream_.async_handshake(boost::asio::ssl::stream_base::client, use_awaitable);
}

awaitable<size_t> ssl_socket::read_some(uint8_t buffer[], size_t max_size) {
    co_return co_await ssl_stream_.async_read_some(
        boost::asio::buffer(buffer, max_size),
        use_awaitable);
}

awaitable<size_t> ssl_socket::write(const std::vector<boost::asio::const_buffer>& buffers) {
    co_return co_await boost::asio::async_write(
        ssl_stream_,
        buffers,
        use_awaitable);
}

}
