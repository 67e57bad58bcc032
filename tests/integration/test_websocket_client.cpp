#include <gtest/gtest.h>

#include "network/ssl_context.hpp"
#include "network/websocket_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace booksync;
using namespace std::chrono_literals;
using booksync::network::WebSocketClient;

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

/// Give a server context a throwaway self-signed certificate
void install_self_signed_certificate(asio::ssl::context& ctx) {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_RSA_gen(2048), EVP_PKEY_free);
    if (!key) {
        throw std::runtime_error("key generation failed");
    }

    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), X509_free);
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("127.0.0.1"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0 ||
        SSL_CTX_use_certificate(ctx.native_handle(), cert.get()) != 1 ||
        SSL_CTX_use_PrivateKey(ctx.native_handle(), key.get()) != 1) {
        throw std::runtime_error("certificate setup failed");
    }
}

/// Single-connection TLS WebSocket server on 127.0.0.1 recording every text frame
class LoopbackServer {
public:
    using ws_stream = beast::websocket::stream<asio::ssl::stream<tcp::socket>>;

    explicit LoopbackServer(asio::io_context& ioc)
        : ssl_ctx_(asio::ssl::context::tls_server)
        , acceptor_(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
        install_self_signed_certificate(ssl_ctx_);
    }

    [[nodiscard]] std::string port() const {
        return std::to_string(acceptor_.local_endpoint().port());
    }

    void start() {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            ws_ = std::make_unique<ws_stream>(std::move(socket), ssl_ctx_);
            ws_->next_layer().async_handshake(asio::ssl::stream_base::server, [this](beast::error_code ec) {
                if (ec) {
                    return;
                }
                ws_->async_accept([this](beast::error_code ec) {
                    if (!ec) {
                        read_next();
                    }
                });
            });
        });
    }

    std::vector<std::string> frames;
    bool peer_closed = false;

private:
    void read_next() {
        ws_->async_read(buffer_, [this](beast::error_code ec, std::size_t) {
            if (ec) {
                peer_closed = true;
                return;
            }
            frames.push_back(beast::buffers_to_string(buffer_.data()));
            buffer_.consume(buffer_.size());
            read_next();
        });
    }

    asio::ssl::context ssl_ctx_;
    tcp::acceptor acceptor_;
    std::unique_ptr<ws_stream> ws_;
    beast::flat_buffer buffer_;
};

}  // namespace

// ============================================================================
// WebSocket Client Tests (loopback TLS server)
// ============================================================================

class WebSocketClientTest : public ::testing::Test {
protected:
    WebSocketClientTest() : server(ioc) {
        server.start();
    }

    void TearDown() override {
        if (client) {
            client->close();
        }
        run_until([] { return false; }, 50ms);
    }

    /// Create the client; on_open_hook runs inside the open callback
    void create(std::function<void()> on_open_hook = {}) {
        network::TransportCallbacks callbacks;
        callbacks.on_open = [this, hook = std::move(on_open_hook)]() {
            ++opened;
            if (hook) {
                hook();
            }
        };
        callbacks.on_close = [this](std::string_view reason) {
            close_reasons.emplace_back(reason);
        };

        client = std::make_shared<WebSocketClient>(
            ioc,
            network::create_ssl_context(false),
            network::WebSocketEndpoint{"127.0.0.1", server.port(), "/"},
            std::move(callbacks));
    }

    bool run_until(const std::function<bool()>& done, std::chrono::milliseconds limit = 5s) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!done() && std::chrono::steady_clock::now() < deadline) {
            if (ioc.stopped()) {
                ioc.restart();
            }
            ioc.run_for(10ms);
        }
        return done();
    }

    boost::asio::io_context ioc;
    LoopbackServer server;
    std::shared_ptr<WebSocketClient> client;
    int opened = 0;
    std::vector<std::string> close_reasons;
};

TEST_F(WebSocketClientTest, FramesSentFromOpenCallbackAreWrittenOnce) {
    create([this] {
        client->send("SUBSCRIBE-A");
        client->send("SUBSCRIBE-B");
    });
    client->open();

    ASSERT_TRUE(run_until([this] { return server.frames.size() >= 2; }));
    client->send("AFTER");
    ASSERT_TRUE(run_until([this] { return server.frames.size() >= 3; }));
    run_until([] { return false; }, 50ms);

    EXPECT_EQ(opened, 1);
    EXPECT_EQ(server.frames, (std::vector<std::string>{"SUBSCRIBE-A", "SUBSCRIBE-B", "AFTER"}));
    EXPECT_EQ(client->phase(), WebSocketClient::Phase::Open);
    EXPECT_TRUE(close_reasons.empty());
}

TEST_F(WebSocketClientTest, FramesQueuedBeforeHandshakeAreFlushedFirst) {
    create([this] { client->send("SUBSCRIBE"); });
    client->open();
    client->send("EARLY");

    ASSERT_TRUE(run_until([this] { return server.frames.size() >= 2; }));
    run_until([] { return false; }, 50ms);

    EXPECT_EQ(server.frames, (std::vector<std::string>{"EARLY", "SUBSCRIBE"}));
}

TEST_F(WebSocketClientTest, CloseWithWriteInFlightFinishesCleanly) {
    create([this] {
        client->send("LAST");
        client->send("DROPPED");
        client->close();
    });
    client->open();

    ASSERT_TRUE(run_until([this] { return client->phase() == WebSocketClient::Phase::Closed; }));
    ASSERT_TRUE(run_until([this] { return server.peer_closed; }));

    EXPECT_EQ(server.frames, (std::vector<std::string>{"LAST"}));
    EXPECT_TRUE(close_reasons.empty());
}
