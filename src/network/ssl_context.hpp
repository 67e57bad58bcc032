#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace booksync::network {

/// Create a shared SSL context configured for TLS client connections
/// Shared between the REST and WebSocket clients
/// @param verify_peer Verify server certificates against the system store
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_ssl_context(bool verify_peer = true);

}  // namespace booksync::network
