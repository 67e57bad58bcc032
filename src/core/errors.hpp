#pragma once

#include <string>
#include <string_view>

namespace booksync {

/// Failure categories; none of them crosses the consumer boundary as an exception
enum class ErrorKind {
    Network,             // Snapshot fetch failed or timed out - retried
    Protocol,            // Malformed payload - dropped and logged
    Connection,          // Transport closed or errored - drives reconnection
    InvariantViolation   // Crossed book or similar - logged, rendering continues
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Network:            return "NetworkError";
        case ErrorKind::Protocol:           return "ProtocolError";
        case ErrorKind::Connection:         return "ConnectionError";
        case ErrorKind::InvariantViolation: return "InvariantViolation";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;

    [[nodiscard]] static Error network(std::string msg) {
        return Error{ErrorKind::Network, std::move(msg)};
    }

    [[nodiscard]] static Error protocol(std::string msg) {
        return Error{ErrorKind::Protocol, std::move(msg)};
    }

    [[nodiscard]] std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

}  // namespace booksync
