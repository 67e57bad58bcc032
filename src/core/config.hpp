#pragma once

#include "core/status.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace booksync {

/// Immutable configuration for booksync
struct Config {
    /// Streaming and REST endpoints plus connection policy
    struct Network {
        std::string ws_host = "ws-subscriptions-clob.polymarket.com";
        std::string ws_port = "443";
        std::string ws_path = "/ws/market";
        std::string rest_host = "clob.polymarket.com";
        std::string rest_port = "443";

        // Reconnection settings
        std::chrono::milliseconds reconnect_delay_initial{1000};
        std::chrono::milliseconds reconnect_delay_max{30000};
        double reconnect_backoff_multiplier = 2.0;
        double reconnect_jitter_factor = 0.3;  // +/- 30%
        std::size_t max_reconnect_attempts = 10;
        std::chrono::milliseconds reconnect_reset_window{5 * 60 * 1000};

        // Heartbeat (PING text frame, expects PONG)
        std::chrono::milliseconds heartbeat_interval{30000};
        std::chrono::milliseconds heartbeat_timeout{10000};

        // Keep the connection open this long after the last instrument is released
        std::chrono::milliseconds linger{2000};
    };

    /// Order book store and bootstrap policy
    struct Book {
        std::chrono::milliseconds snapshot_timeout{10000};
        std::size_t snapshot_max_retries = 3;
        std::chrono::milliseconds snapshot_retry_delay{1000};
        std::size_t max_pending_deltas = 100;
        std::chrono::milliseconds stale_threshold{60000};
        std::chrono::milliseconds eviction_grace{5000};
    };

    /// Monitor output configuration
    struct Output {
        std::chrono::milliseconds console_interval{1000};
        std::size_t depth_levels = 5;
        double fill_size = 100.0;  // Shares used for the slippage estimate
        bool json = false;
    };

    struct Logging {
        std::string level = "info";
    };

    Network network;
    Book book;
    Output output;
    Logging logging;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);
};

}  // namespace booksync
