#include "network/rest_client.hpp"
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

// Helper to set SNI hostname without old-style cast warning
namespace {
inline bool set_sni_hostname(SSL* ssl, const char* hostname) {
    // SSL_set_tlsext_host_name is a macro with old-style cast
    // Use SSL_ctrl directly to avoid warning
    return SSL_ctrl(ssl, SSL_CTRL_SET_TLSEXT_HOSTNAME,
                    TLSEXT_NAMETYPE_host_name,
                    const_cast<char*>(hostname)) != 0;
}
}  // namespace

namespace booksync::network {

RestClient::RestClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    std::chrono::milliseconds timeout
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , timeout_(timeout)
    , resolver_(ioc)
{}

RestClient::~RestClient() {
    if (stream_) {
        boost::system::error_code ec;
        boost::beast::get_lowest_layer(*stream_).socket().close(ec);
    }
}

void RestClient::get(
    std::string_view host,
    std::string_view port,
    std::string_view path,
    ResponseHandler handler
) {
    host_ = std::string(host);
    port_ = std::string(port);
    path_ = std::string(path);
    handler_ = std::move(handler);

    spdlog::debug("REST GET https://{}:{}{}", host_, port_, path_);

    resolver_.async_resolve(
        host_,
        port_,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void RestClient::cancel() {
    if (cancelled_) {
        return;
    }
    cancelled_ = true;
    handler_ = nullptr;

    resolver_.cancel();
    if (stream_) {
        boost::beast::get_lowest_layer(*stream_).cancel();
    }
    spdlog::debug("REST GET {} cancelled", path_);
}

void RestClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        return fail("resolve", ec);
    }

    stream_ = std::make_unique<ssl_stream>(ioc_, *ssl_ctx_);

    // Set SNI hostname (using helper to avoid old-style cast)
    if (!set_sni_hostname(stream_->native_handle(), host_.c_str())) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail("ssl_sni", ssl_ec);
    }

    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    boost::beast::get_lowest_layer(*stream_).async_connect(
        results,
        [self = shared_from_this()](auto ec, auto /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void RestClient::on_connect(boost::system::error_code ec) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        return fail("connect", ec);
    }

    do_ssl_handshake();
}

void RestClient::do_ssl_handshake() {
    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    stream_->async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void RestClient::on_ssl_handshake(boost::system::error_code ec) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        return fail("ssl_handshake", ec);
    }

    // Prepare the HTTP request
    req_.method(boost::beast::http::verb::get);
    req_.target(path_);
    req_.version(11);
    req_.set(boost::beast::http::field::host, host_);
    req_.set(boost::beast::http::field::user_agent, "booksync/1.0");
    req_.set(boost::beast::http::field::accept, "application/json");

    do_write();
}

void RestClient::do_write() {
    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    boost::beast::http::async_write(
        *stream_,
        req_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void RestClient::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        return fail("write", ec);
    }

    do_read();
}

void RestClient::do_read() {
    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    boost::beast::http::async_read(
        *stream_,
        buffer_,
        res_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void RestClient::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        return fail("read", ec);
    }

    // Check HTTP status
    auto status = res_.result();
    if (status != boost::beast::http::status::ok) {
        std::string error = "HTTP " + std::to_string(static_cast<int>(status)) +
                           ": " + std::string(res_.reason());
        spdlog::warn("REST request {} failed: {}", path_, error);
        complete(Result<std::string, std::string>::Err(std::move(error)));
        do_shutdown();
        return;
    }

    spdlog::debug("REST response: {} bytes", res_.body().size());
    complete(Result<std::string, std::string>::Ok(std::move(res_.body())));

    do_shutdown();
}

void RestClient::do_shutdown() {
    boost::beast::get_lowest_layer(*stream_).expires_after(std::chrono::seconds(5));
    stream_->async_shutdown(
        [self = shared_from_this()](auto ec) {
            self->on_shutdown(ec);
        }
    );
}

void RestClient::on_shutdown(boost::system::error_code ec) {
    // SSL shutdown errors are common and can be ignored
    if (ec && ec != boost::asio::error::eof &&
        ec != boost::asio::ssl::error::stream_truncated) {
        spdlog::debug("SSL shutdown: {}", ec.message());
    }
}

void RestClient::fail(const std::string& what, boost::system::error_code ec) {
    std::string error = what + ": " + ec.message();
    spdlog::error("REST {} error: {}", what, ec.message());

    complete(Result<std::string, std::string>::Err(std::move(error)));
}

void RestClient::complete(Result<std::string, std::string> result) {
    if (!handler_) {
        return;
    }
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(std::move(result));
}

}  // namespace booksync::network
