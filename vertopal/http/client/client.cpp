#include "client.hpp"
#include "../../asio/sockets/ssl_socket.hpp"
#include "../../util/logger.hpp"

namespace vertopal::http {

client::~client() {
    clear_connections();
}

void client::clear_connections() {
    if (connection_) {
        connection_->close();
        connection_.reset();
    }
    connection_origin_.clear();
}

void client::apply_default_headers(http_request& request) const {
    if (!request.has_header(header::user_agent)) {
        request.add_header(std::string(header::user_agent), user_agent_);
    }
    if (!request.has_header(header::accept_encoding)) {
        request.add_header(std::string(header::accept_encoding), "gzip, deflate");
    }
}

std::shared_ptr<client_connection> client::get_or_create_connection(const http_request& request) {
    auto origin = request.get_base_path();

    // reuse the kept-alive connection when it targets the same origin
    if (connection_ && connection_origin_ == origin && connection_->is_open()) {
        LOG_DEBUG("reusing connection for {}", origin);
        return connection_;
    }

    clear_connections();
    LOG_DEBUG("creating new connection for {}", origin);

    std::shared_ptr<asio::socket> sock;
    if (request.is_ssl()) {
        sock = std::make_shared<asio::ssl_socket>("http_client", io_context_, asio::ssl_socket::client_context());
    } else {
        sock = std::make_shared<asio::tcp_socket>("http_client", io_context_);
    }

    connection_ = std::make_shared<client_connection>(sock);
    connection_origin_ = std::move(origin);
    return connection_;
}

stream_result client::send_streaming(std::shared_ptr<http_request> request,
                                     stream_callback callback,
                                     std::chrono::milliseconds timeout) {
    if (!request || request->get_host().empty()) {
        stream_result result;
        result.error = "invalid request url";
        return result;
    }

    apply_default_headers(*request);
    auto connection = get_or_create_connection(*request);

    stream_result result;
    try {
        result = exec(connection->send_request_streaming(request, std::move(callback), timeout));
    } catch (const std::exception& e) {
        LOG_ERROR("http exchange with {} aborted: {}", request->get_base_path(), e.what());
        clear_connections();
        throw;
    }

    if (!connection->is_open()) {
        clear_connections();
    }
    return result;
}

} // namespace vertopal::http
