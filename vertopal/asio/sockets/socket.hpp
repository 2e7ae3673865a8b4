#ifndef VERTOPAL_ASIO_SOCKET_HPP
#define VERTOPAL_ASIO_SOCKET_HPP

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>

#include "../../util/types.hpp"

namespace vertopal::asio {

/**
 * Client side stream socket used by the HTTP layer.
 * All asynchronous operations report failures by throwing
 * boost::system::system_error.
 */
class socket : private boost::asio::noncopyable {

public:
    // constructors and destructors
    socket(const std::string& context, boost::asio::io_context& io_context);
    virtual ~socket();

    // socket control
    virtual awaitable<void> connect(
        const std::string& host,
        const std::string& port,
        std::chrono::seconds timeout) = 0;
    virtual void close() = 0;
    virtual void cancel() = 0;
    virtual bool requires_handshake() const;
    virtual awaitable<void> handshake(const std::string& host);

    // read operations
    virtual awaitable<size_t> read_some(uint8_t buffer[], size_t max_size) = 0;

    // write operations
    virtual awaitable<size_t> write(const std::vector<boost::asio::const_buffer>& buffers) = 0;

    // some getters to check the state
    virtual bool is_open() const = 0;
    virtual std::string get_remote_ip() const = 0;
    virtual std::string get_remote_port() const = 0;

    boost::asio::io_context& get_io_context() const;

protected:
    // owner tag used in trace logs
    std::string context_;
    boost::asio::io_context& io_context_;
};

}

#endif
