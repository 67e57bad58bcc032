#include "network/websocket_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <spdlog/spdlog.h>
#include <iterator>

namespace booksync::network {

WebSocketClient::WebSocketClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    WebSocketEndpoint endpoint,
    TransportCallbacks callbacks
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , endpoint_(std::move(endpoint))
    , callbacks_(std::move(callbacks))
    , resolver_(ioc)
{}

WebSocketClient::~WebSocketClient() {
    abort_socket();
}

void WebSocketClient::open() {
    if (phase_ != Phase::Idle) {
        spdlog::warn("WebSocket open() called twice, ignoring");
        return;
    }

    spdlog::info("WebSocket connecting to {}:{}{}", endpoint_.host, endpoint_.port, endpoint_.path);
    phase_ = Phase::Resolving;

    resolver_.async_resolve(
        endpoint_.host,
        endpoint_.port,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void WebSocketClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (closed_by_user_) {
        return;
    }
    if (ec) {
        return fail(ec, "resolve");
    }

    spdlog::debug("Resolved {} endpoints", results.size());

    ws_ = std::make_unique<ws_stream>(ioc_, *ssl_ctx_);

    // Set SNI hostname for SSL
    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), endpoint_.host.c_str())) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail(ssl_ec, "ssl_sni");
    }

    phase_ = Phase::Connecting;

    // Set TCP connect timeout
    boost::beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(30));

    boost::beast::get_lowest_layer(*ws_).async_connect(
        results,
        [self = shared_from_this()](auto ec, auto /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void WebSocketClient::on_connect(boost::system::error_code ec) {
    if (closed_by_user_) {
        return;
    }
    if (ec) {
        return fail(ec, "connect");
    }

    spdlog::debug("TCP connected to {}:{}", endpoint_.host, endpoint_.port);

    phase_ = Phase::SslHandshake;
    do_ssl_handshake();
}

void WebSocketClient::do_ssl_handshake() {
    boost::beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(30));

    ws_->next_layer().async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void WebSocketClient::on_ssl_handshake(boost::system::error_code ec) {
    if (closed_by_user_) {
        return;
    }
    if (ec) {
        return fail(ec, "ssl_handshake");
    }

    spdlog::debug("SSL handshake complete");

    // The application heartbeat detects dead peers; Beast's own idle
    // timeout stays at the suggested client value
    boost::beast::get_lowest_layer(*ws_).expires_never();

    ws_->set_option(boost::beast::websocket::stream_base::timeout::suggested(
        boost::beast::role_type::client
    ));

    ws_->set_option(boost::beast::websocket::stream_base::decorator(
        [](boost::beast::websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "booksync/1.0");
        }
    ));

    phase_ = Phase::WsHandshake;
    do_ws_handshake();
}

void WebSocketClient::do_ws_handshake() {
    ws_->async_handshake(
        endpoint_.host,
        endpoint_.path,
        [self = shared_from_this()](auto ec) {
            self->on_ws_handshake(ec);
        }
    );
}

void WebSocketClient::on_ws_handshake(boost::system::error_code ec) {
    if (closed_by_user_) {
        return;
    }
    if (ec) {
        return fail(ec, "ws_handshake");
    }

    spdlog::info("WebSocket connected to {}:{}{}", endpoint_.host, endpoint_.port, endpoint_.path);

    // Frames are text (JSON and PING/PONG)
    ws_->text(true);
    phase_ = Phase::Open;

    if (callbacks_.on_open) {
        callbacks_.on_open();
    }

    // on_open may have closed us, or already started the first write
    if (phase_ == Phase::Open) {
        do_read();
        if (!write_in_flight_ && !write_queue_.empty()) {
            do_write();
        }
    }
}

void WebSocketClient::do_read() {
    ws_->async_read(
        buffer_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void WebSocketClient::on_read(boost::system::error_code ec, std::size_t bytes_transferred) {
    if (closed_by_user_) {
        return;
    }
    if (ec) {
        if (ec == boost::beast::websocket::error::closed) {
            spdlog::info("WebSocket closed by server");
            phase_ = Phase::Closed;
            if (callbacks_.on_close) {
                callbacks_.on_close("closed by server");
            }
            return;
        }
        return fail(ec, "read");
    }

    auto data = boost::beast::buffers_to_string(buffer_.data());
    buffer_.consume(bytes_transferred);

    if (callbacks_.on_message) {
        callbacks_.on_message(data);
    }

    // The handler may have closed us
    if (phase_ == Phase::Open && !closed_by_user_) {
        do_read();
    }
}

void WebSocketClient::send(std::string message) {
    if (closed_by_user_ || phase_ == Phase::Closing || phase_ == Phase::Closed) {
        spdlog::warn("Cannot send: WebSocket not open");
        return;
    }

    write_queue_.push_back(std::move(message));

    // Queued frames before the handshake are flushed from on_ws_handshake
    if (phase_ == Phase::Open && !write_in_flight_) {
        do_write();
    }
}

void WebSocketClient::do_write() {
    write_in_flight_ = true;
    ws_->async_write(
        boost::asio::buffer(write_queue_.front()),
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void WebSocketClient::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    write_in_flight_ = false;
    write_queue_.pop_front();

    if (closed_by_user_) {
        write_queue_.clear();
        return;
    }
    if (ec) {
        return fail(ec, "write");
    }
    if (phase_ != Phase::Open) {
        return;
    }

    if (!write_queue_.empty()) {
        do_write();
    }
}

void WebSocketClient::close() {
    if (closed_by_user_) {
        return;
    }
    closed_by_user_ = true;

    // The frame being written must outlive its async_write
    if (write_in_flight_) {
        write_queue_.erase(std::next(write_queue_.begin()), write_queue_.end());
    } else {
        write_queue_.clear();
    }

    if (phase_ == Phase::Open) {
        phase_ = Phase::Closing;
        ws_->async_close(
            boost::beast::websocket::close_code::normal,
            [self = shared_from_this()](auto ec) {
                self->on_close(ec);
            }
        );
        return;
    }

    // Mid-handshake: cancel whatever is outstanding
    resolver_.cancel();
    abort_socket();
    phase_ = Phase::Closed;
}

void WebSocketClient::on_close(boost::system::error_code ec) {
    if (ec) {
        spdlog::debug("WebSocket close error: {}", ec.message());
    }

    spdlog::info("WebSocket connection to {} closed", endpoint_.host);
    phase_ = Phase::Closed;
}

void WebSocketClient::fail(boost::system::error_code ec, std::string_view what) {
    if (phase_ == Phase::Closed) {
        return;  // Already reported
    }
    spdlog::error("WebSocket {} error: {}", what, ec.message());

    phase_ = Phase::Closed;
    abort_socket();

    if (callbacks_.on_close) {
        callbacks_.on_close(std::string(what) + ": " + ec.message());
    }
}

void WebSocketClient::abort_socket() {
    if (!ws_) {
        return;
    }
    auto& socket = boost::beast::get_lowest_layer(*ws_).socket();
    if (socket.is_open()) {
        boost::system::error_code ec;
        socket.close(ec);
    }
}

WebSocketClient::Phase WebSocketClient::phase() const noexcept {
    return phase_;
}

TransportFactory make_websocket_factory(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    WebSocketEndpoint endpoint
) {
    return [&ioc, ssl_ctx = std::move(ssl_ctx), endpoint = std::move(endpoint)](
               TransportCallbacks callbacks) -> std::shared_ptr<Transport> {
        return std::make_shared<WebSocketClient>(ioc, ssl_ctx, endpoint, std::move(callbacks));
    };
}

}  // namespace booksync::network
