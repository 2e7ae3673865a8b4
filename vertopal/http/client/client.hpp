#ifndef VERTOPAL_HTTP_CLIENT_STANDALONE_HPP
#define VERTOPAL_HTTP_CLIENT_STANDALONE_HPP

#include "http_backend.hpp"
#include "client_connection.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <string>

namespace vertopal::http {

/**
 * Standalone HTTP client with a synchronous streaming API.
 * Every call runs its own io_context until the exchange completes, so the
 * calling thread blocks for the duration of a request.
 *
 * Usage:
 *   http::client client;
 *
 *   auto request = std::make_shared<http::http_request>();
 *   request->set_method(http::method::GET);
 *   request->set_url("https://api.example.com/v1/format/get");
 *
 *   std::string body;
 *   auto result = client.send_streaming(request, [&body](const http::stream_info& info) {
 *       body.append(info.data);
 *       return true;
 *   }, std::chrono::seconds(30));
 */
class client : public http_backend {
private:
    boost::asio::io_context io_context_;

    std::string user_agent_{"VertopalHTTP/1.0"};

    // last kept-alive connection and its origin
    std::shared_ptr<client_connection> connection_;
    std::string connection_origin_;

    // Runs an awaitable to completion, rethrowing whatever it threw
    template<typename T>
    T exec(awaitable<T> coro) {
        T result;
        std::exception_ptr failure;
        co_spawn(io_context_, [&result, coro = std::move(coro)]() mutable -> awaitable<void> {
            result = co_await std::move(coro);
        }, [&failure](std::exception_ptr e) {
            failure = e;
        });
        io_context_.run();
        io_context_.restart();
        if (failure) std::rethrow_exception(failure);
        return result;
    }

    void apply_default_headers(http_request& request) const;
    std::shared_ptr<client_connection> get_or_create_connection(const http_request& request);

public:
    client() = default;
    ~client() override;

    client& user_agent(const std::string& agent) { user_agent_ = agent; return *this; }
    const std::string& get_user_agent() const { return user_agent_; }

    // Streams the response through callback without loading it into memory.
    // Exceptions thrown by the callback propagate to the caller.
    stream_result send_streaming(std::shared_ptr<http_request> request,
                                 stream_callback callback,
                                 std::chrono::milliseconds timeout) override;

    void clear_connections();
};

} // namespace vertopal::http

#endif
