#pragma once

#include "core/status.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace booksync::network {

/// Async HTTPS client for REST API calls
/// One request per instance.
class RestClient : public std::enable_shared_from_this<RestClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using ssl_stream = boost::asio::ssl::stream<boost::beast::tcp_stream>;

    /// Response handler callback
    using ResponseHandler = std::function<void(Result<std::string, std::string>)>;

    /// Create a new REST client
    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    /// @param timeout Upper bound for each network step of the request
    RestClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::chrono::milliseconds timeout = std::chrono::seconds(30)
    );

    ~RestClient();

    // Non-copyable, non-movable
    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    /// Perform an async GET request
    /// @param host Hostname (e.g., "clob.polymarket.com")
    /// @param port Port (e.g., "443")
    /// @param path Path with query (e.g., "/book?token_id=...")
    /// @param handler Callback with response body or error, called at most once
    void get(
        std::string_view host,
        std::string_view port,
        std::string_view path,
        ResponseHandler handler
    );

    /// Abort the request; the handler is not called afterwards
    void cancel();

private:
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void do_ssl_handshake();
    void on_ssl_handshake(boost::system::error_code ec);
    void do_write();
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_shutdown();
    void on_shutdown(boost::system::error_code ec);
    void fail(const std::string& what, boost::system::error_code ec);
    void complete(Result<std::string, std::string> result);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::chrono::milliseconds timeout_;
    tcp::resolver resolver_;
    std::unique_ptr<ssl_stream> stream_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;

    std::string host_;
    std::string port_;
    std::string path_;
    ResponseHandler handler_;
    bool cancelled_{false};
};

}  // namespace booksync::network
