#pragma once

#include "network/transport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

namespace booksync::network {

/// Where a WebSocket client connects
struct WebSocketEndpoint {
    std::string host;  // e.g. "ws-subscriptions-clob.polymarket.com"
    std::string port;  // e.g. "443"
    std::string path;  // e.g. "/ws/market"
};

/// Async WebSocket client over SSL
/// Single-use: one open(), then close() or an unexpected close ends it.
class WebSocketClient : public Transport,
                        public std::enable_shared_from_this<WebSocketClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using tcp_stream = boost::beast::tcp_stream;
    using ssl_stream = boost::asio::ssl::stream<tcp_stream>;
    using ws_stream = boost::beast::websocket::stream<ssl_stream>;

    /// Lifecycle of this one connection attempt
    enum class Phase {
        Idle,
        Resolving,
        Connecting,
        SslHandshake,
        WsHandshake,
        Open,
        Closing,
        Closed
    };

    /// Create a new WebSocket client
    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    /// @param endpoint Host, port and path to connect to
    /// @param callbacks Open/message/close notifications
    WebSocketClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        WebSocketEndpoint endpoint,
        TransportCallbacks callbacks
    );

    ~WebSocketClient() override;

    // Non-copyable, non-movable
    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void open() override;
    void send(std::string message) override;
    void close() override;

    [[nodiscard]] Phase phase() const noexcept;

private:
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void do_ssl_handshake();
    void on_ssl_handshake(boost::system::error_code ec);
    void do_ws_handshake();
    void on_ws_handshake(boost::system::error_code ec);
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void on_close(boost::system::error_code ec);
    void fail(boost::system::error_code ec, std::string_view what);
    void abort_socket();

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    WebSocketEndpoint endpoint_;
    TransportCallbacks callbacks_;

    tcp::resolver resolver_;
    std::unique_ptr<ws_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;

    Phase phase_{Phase::Idle};
    bool closed_by_user_{false};
    bool write_in_flight_{false};  // Beast allows one async_write at a time
};

/// Factory producing WebSocket transports for the given endpoint
[[nodiscard]] TransportFactory make_websocket_factory(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    WebSocketEndpoint endpoint
);

}  // namespace booksync::network
