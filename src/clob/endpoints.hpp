#pragma once

#include <string>
#include <string_view>

namespace booksync::clob {

/// Polymarket CLOB endpoints
namespace endpoints {

/// Market channel WebSocket host
constexpr std::string_view WS_HOST = "ws-subscriptions-clob.polymarket.com";

/// Market channel path
constexpr std::string_view WS_MARKET_PATH = "/ws/market";

/// REST API host
constexpr std::string_view REST_HOST = "clob.polymarket.com";

/// Default port for HTTPS/WSS
constexpr std::string_view PORT = "443";

/// Heartbeat frames on the market channel
constexpr std::string_view PING_FRAME = "PING";
constexpr std::string_view PONG_FRAME = "PONG";

/// Percent-encode a query parameter value (RFC 3986 unreserved chars pass through)
[[nodiscard]] inline std::string encode_query_value(std::string_view value) {
    constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        if ((byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z') ||
            (byte >= '0' && byte <= '9') || byte == '-' || byte == '_' || byte == '.' || byte == '~') {
            out += c;
        } else {
            out += '%';
            out += hex[byte >> 4];
            out += hex[byte & 0x0F];
        }
    }
    return out;
}

/// Build REST path for one token's book
/// @return Path like "/book?token_id=7132..."
[[nodiscard]] inline std::string rest_book_path(std::string_view token_id) {
    std::string path = "/book?token_id=";
    path += encode_query_value(token_id);
    return path;
}

}  // namespace endpoints

}  // namespace booksync::clob
