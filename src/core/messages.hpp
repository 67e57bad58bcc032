#pragma once

#include "core/types.hpp"
#include "orderbook/book_types.hpp"
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace booksync {

/// Full book for one instrument pushed on the stream
struct BookMsg {
    BookSnapshot snapshot;
};

/// Incremental level changes, possibly for several instruments
struct PriceChangeMsg {
    std::vector<Delta> deltas;
    std::string market;
    std::string timestamp;
};

/// Trade print
struct LastTradeMsg {
    InstrumentId instrument_id;
    LastTrade trade;
};

/// Minimum price increment changed
struct TickSizeChangeMsg {
    InstrumentId instrument_id;
    Price old_tick_size;
    Price new_tick_size;
};

/// Heartbeat answer
struct PongMsg {};

/// Unified inbound stream event
using FeedEvent = std::variant<
    BookMsg,
    PriceChangeMsg,
    LastTradeMsg,
    TickSizeChangeMsg,
    PongMsg
>;

/// Helper to get message type name for logging
[[nodiscard]] inline std::string_view message_type_name(const FeedEvent& msg) {
    return std::visit([](const auto& m) -> std::string_view {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BookMsg>) return "Book";
        else if constexpr (std::is_same_v<T, PriceChangeMsg>) return "PriceChange";
        else if constexpr (std::is_same_v<T, LastTradeMsg>) return "LastTradePrice";
        else if constexpr (std::is_same_v<T, TickSizeChangeMsg>) return "TickSizeChange";
        else if constexpr (std::is_same_v<T, PongMsg>) return "Pong";
        else return "Unknown";
    }, msg);
}

}  // namespace booksync
