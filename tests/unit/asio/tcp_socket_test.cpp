#include <catch2/catch_test_macros.hpp>
#include <vertopal/asio/sockets/tcp_socket.hpp>
#include <optional>

using namespace vertopal;

TEST_CASE("TCP socket connect", "[asio][socket][unit]") {
    boost::asio::io_context io_context;
    asio::tcp_socket socket("test", io_context);

    SECTION("connects to a listening endpoint") {
        boost::asio::ip::tcp::acceptor acceptor(io_context,
            boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        auto port = std::to_string(acceptor.local_endpoint().port());

        bool connected = false;
        co_spawn(io_context, [&]() -> awaitable<void> {
            co_await socket.connect("127.0.0.1", port, std::chrono::seconds(5));
            connected = socket.is_open();
        }, detached);
        io_context.run();

        REQUIRE(connected);
        REQUIRE(socket.get_remote_port() == port);
    }

    SECTION("cancel while resolving aborts the connect") {
        std::optional<boost::system::error_code> failure;
        co_spawn(io_context, [&]() -> awaitable<void> {
            try {
                co_await socket.connect("localhost", "80", std::chrono::seconds(5));
            } catch (const boost::system::system_error& e) {
                failure = e.code();
            }
        }, detached);
        // runs once the first coroutine is suspended in the lookup
        co_spawn(io_context, [&]() -> awaitable<void> {
            socket.cancel();
            co_return;
        }, detached);
        io_context.run();

        REQUIRE(failure.has_value());
        REQUIRE(*failure == boost::asio::error::operation_aborted);
        REQUIRE_FALSE(socket.is_open());
    }
}
