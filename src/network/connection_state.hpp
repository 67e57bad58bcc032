#pragma once

#include <string_view>

namespace booksync::network {

/// Process-wide state of the shared streaming connection
enum class ConnectionState {
    Disconnected,   // No connection and none being attempted
    Connecting,     // Transport handshake in progress
    Connected,      // Open and subscribed
    Reconnecting    // Lost, waiting out the backoff delay
};

/// Convert ConnectionState to string for logging
[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Reconnecting: return "Reconnecting";
    }
    return "Unknown";
}

/// Short indicator text for status displays
[[nodiscard]] constexpr std::string_view status_label(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Offline";
        case ConnectionState::Connecting:   return "Connecting...";
        case ConnectionState::Connected:    return "Live";
        case ConnectionState::Reconnecting: return "Reconnecting...";
    }
    return "Unknown";
}

}  // namespace booksync::network
