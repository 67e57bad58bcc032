#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace booksync {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer within [min_val, max_val]
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        int result = std::stoi(*value);
        if (result < min_val || result > max_val) {
            spdlog::warn("{} value {} out of range [{}, {}], ignoring",
                         name, result, min_val, max_val);
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer value for {}: {}, ignoring", name, *value);
        return std::nullopt;
    }
}

/// Get environment variable as non-negative size_t
std::optional<std::size_t> get_env_size(const char* name, std::size_t max_val = std::numeric_limits<std::size_t>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        long long result = std::stoll(*value);
        if (result < 0) {
            spdlog::warn("{} must be non-negative, ignoring", name);
            return std::nullopt;
        }
        if (static_cast<unsigned long long>(result) > max_val) {
            spdlog::warn("{} value too large, ignoring", name);
            return std::nullopt;
        }
        return static_cast<std::size_t>(result);
    } catch (const std::exception&) {
        spdlog::warn("Invalid size value for {}: {}, ignoring", name, *value);
        return std::nullopt;
    }
}

std::optional<double> get_env_double(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        return std::stod(*value);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}: {}, ignoring", name, *value);
        return std::nullopt;
    }
}

std::optional<std::chrono::milliseconds> get_env_ms(const char* name, int min_val, int max_val) {
    if (auto v = get_env_int(name, min_val, max_val)) {
        return std::chrono::milliseconds(*v);
    }
    return std::nullopt;
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Network overrides
    if (auto v = get_env("BOOKSYNC_WS_HOST")) {
        config.network.ws_host = *v;
    }
    if (auto v = get_env("BOOKSYNC_WS_PORT")) {
        config.network.ws_port = *v;
    }
    if (auto v = get_env("BOOKSYNC_WS_PATH")) {
        config.network.ws_path = *v;
    }
    if (auto v = get_env("BOOKSYNC_REST_HOST")) {
        config.network.rest_host = *v;
    }
    if (auto v = get_env("BOOKSYNC_REST_PORT")) {
        config.network.rest_port = *v;
    }
    // Reconnect delay: 100ms to 5 minutes
    if (auto v = get_env_ms("BOOKSYNC_RECONNECT_DELAY_INITIAL_MS", 100, 300000)) {
        config.network.reconnect_delay_initial = *v;
    }
    if (auto v = get_env_ms("BOOKSYNC_RECONNECT_DELAY_MAX_MS", 1000, 600000)) {
        config.network.reconnect_delay_max = *v;
    }
    if (auto v = get_env_double("BOOKSYNC_RECONNECT_BACKOFF_MULTIPLIER")) {
        if (*v >= 1.0 && *v <= 10.0) {
            config.network.reconnect_backoff_multiplier = *v;
        }
    }
    if (auto v = get_env_double("BOOKSYNC_RECONNECT_JITTER_FACTOR")) {
        if (*v >= 0.0 && *v <= 1.0) {
            config.network.reconnect_jitter_factor = *v;
        }
    }
    if (auto v = get_env_size("BOOKSYNC_MAX_RECONNECT_ATTEMPTS", 1000)) {
        config.network.max_reconnect_attempts = *v;
    }
    if (auto v = get_env_ms("BOOKSYNC_HEARTBEAT_INTERVAL_MS", 1000, 600000)) {
        config.network.heartbeat_interval = *v;
    }
    if (auto v = get_env_ms("BOOKSYNC_HEARTBEAT_TIMEOUT_MS", 100, 600000)) {
        config.network.heartbeat_timeout = *v;
    }
    if (auto v = get_env_ms("BOOKSYNC_LINGER_MS", 0, 600000)) {
        config.network.linger = *v;
    }

    // Book overrides
    if (auto v = get_env_ms("BOOKSYNC_SNAPSHOT_TIMEOUT_MS", 100, 120000)) {
        config.book.snapshot_timeout = *v;
    }
    if (auto v = get_env_size("BOOKSYNC_SNAPSHOT_MAX_RETRIES", 100)) {
        config.book.snapshot_max_retries = *v;
    }
    if (auto v = get_env_size("BOOKSYNC_MAX_PENDING_DELTAS", 1000000)) {
        config.book.max_pending_deltas = *v;
    }
    if (auto v = get_env_ms("BOOKSYNC_STALE_THRESHOLD_MS", 1000, 3600000)) {
        config.book.stale_threshold = *v;
    }
    if (auto v = get_env_ms("BOOKSYNC_EVICTION_GRACE_MS", 0, 3600000)) {
        config.book.eviction_grace = *v;
    }

    // Output overrides
    if (auto v = get_env_ms("BOOKSYNC_CONSOLE_INTERVAL_MS", 100, 60000)) {
        config.output.console_interval = *v;
    }
    if (auto v = get_env_size("BOOKSYNC_DEPTH_LEVELS", 100)) {
        config.output.depth_levels = *v;
    }
    if (auto v = get_env_double("BOOKSYNC_FILL_SIZE")) {
        if (*v > 0.0) {
            config.output.fill_size = *v;
        }
    }

    if (auto v = get_env("BOOKSYNC_LOG_LEVEL")) {
        config.logging.level = *v;
    }
}

std::chrono::milliseconds ms_field(const json& section, const char* key, std::chrono::milliseconds fallback) {
    if (section.contains(key)) {
        return std::chrono::milliseconds(section[key].get<std::int64_t>());
    }
    return fallback;
}

/// A PONG wait must end before the next PING goes out
void clamp_heartbeat(Config::Network& network) {
    if (network.heartbeat_timeout >= network.heartbeat_interval) {
        const auto clamped = network.heartbeat_interval / 2;
        spdlog::warn("heartbeat timeout {}ms is not below heartbeat interval {}ms, using {}ms",
                     network.heartbeat_timeout.count(), network.heartbeat_interval.count(),
                     clamped.count());
        network.heartbeat_timeout = clamped;
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("network")) {
            const auto& net = j["network"];
            if (net.contains("ws_host")) {
                config.network.ws_host = net["ws_host"].get<std::string>();
            }
            if (net.contains("ws_port")) {
                config.network.ws_port = net["ws_port"].get<std::string>();
            }
            if (net.contains("ws_path")) {
                config.network.ws_path = net["ws_path"].get<std::string>();
            }
            if (net.contains("rest_host")) {
                config.network.rest_host = net["rest_host"].get<std::string>();
            }
            if (net.contains("rest_port")) {
                config.network.rest_port = net["rest_port"].get<std::string>();
            }
            config.network.reconnect_delay_initial =
                ms_field(net, "reconnect_delay_initial_ms", config.network.reconnect_delay_initial);
            config.network.reconnect_delay_max =
                ms_field(net, "reconnect_delay_max_ms", config.network.reconnect_delay_max);
            if (net.contains("reconnect_backoff_multiplier")) {
                config.network.reconnect_backoff_multiplier =
                    net["reconnect_backoff_multiplier"].get<double>();
            }
            if (net.contains("reconnect_jitter_factor")) {
                config.network.reconnect_jitter_factor =
                    net["reconnect_jitter_factor"].get<double>();
            }
            if (net.contains("max_reconnect_attempts")) {
                config.network.max_reconnect_attempts =
                    net["max_reconnect_attempts"].get<std::size_t>();
            }
            config.network.reconnect_reset_window =
                ms_field(net, "reconnect_reset_window_ms", config.network.reconnect_reset_window);
            config.network.heartbeat_interval =
                ms_field(net, "heartbeat_interval_ms", config.network.heartbeat_interval);
            config.network.heartbeat_timeout =
                ms_field(net, "heartbeat_timeout_ms", config.network.heartbeat_timeout);
            config.network.linger = ms_field(net, "linger_ms", config.network.linger);
        }

        if (j.contains("book")) {
            const auto& book = j["book"];
            config.book.snapshot_timeout =
                ms_field(book, "snapshot_timeout_ms", config.book.snapshot_timeout);
            if (book.contains("snapshot_max_retries")) {
                config.book.snapshot_max_retries = book["snapshot_max_retries"].get<std::size_t>();
            }
            config.book.snapshot_retry_delay =
                ms_field(book, "snapshot_retry_delay_ms", config.book.snapshot_retry_delay);
            if (book.contains("max_pending_deltas")) {
                config.book.max_pending_deltas = book["max_pending_deltas"].get<std::size_t>();
            }
            config.book.stale_threshold =
                ms_field(book, "stale_threshold_ms", config.book.stale_threshold);
            config.book.eviction_grace =
                ms_field(book, "eviction_grace_ms", config.book.eviction_grace);
        }

        if (j.contains("output")) {
            const auto& out = j["output"];
            config.output.console_interval =
                ms_field(out, "console_interval_ms", config.output.console_interval);
            if (out.contains("depth_levels")) {
                config.output.depth_levels = out["depth_levels"].get<std::size_t>();
            }
            if (out.contains("fill_size")) {
                config.output.fill_size = out["fill_size"].get<double>();
            }
            if (out.contains("json")) {
                config.output.json = out["json"].get<bool>();
            }
        }

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                config.logging.level = log["level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    clamp_heartbeat(config.network);
    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            spdlog::warn("Failed to load config from '{}': {} (using defaults with env overrides)",
                         *config_path, result.error());
        }
    }

    // Environment variables have the highest priority
    apply_env_overrides(config);
    clamp_heartbeat(config.network);

    return config;
}

}  // namespace booksync
