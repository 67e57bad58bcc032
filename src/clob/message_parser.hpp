#pragma once

#include "core/messages.hpp"
#include "core/status.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace booksync::clob {

/// Parser for Polymarket CLOB market-channel frames and REST book responses
/// Converts raw JSON to typed events
class MessageParser {
public:
    /// Parse one inbound text frame
    /// A frame is "PONG", a single event object, or an array of event objects.
    /// Err only when the frame as a whole is unusable (not JSON, wrong shape);
    /// individual malformed entries are logged and skipped.
    [[nodiscard]] static Result<std::vector<FeedEvent>, std::string>
    parse_market_frame(std::string_view frame, Timestamp received_at);

    /// Parse a GET /book response body
    /// @param instrument_id Token id the request was made for
    [[nodiscard]] static Result<BookSnapshot, std::string>
    parse_book_snapshot(std::string_view body, std::string_view instrument_id, Timestamp fetched_at);

    /// Parse a side string: BUY/bid -> Bid, SELL/ask -> Ask (case-insensitive)
    [[nodiscard]] static std::optional<Side> parse_side(std::string_view side) noexcept;

    /// Check for the heartbeat answer (case-insensitive, surrounding whitespace ignored)
    [[nodiscard]] static bool is_pong(std::string_view frame) noexcept;

    /// Build the subscribe frame for the full set of token ids
    [[nodiscard]] static std::string build_subscribe_frame(const std::vector<InstrumentId>& instrument_ids);
};

}  // namespace booksync::clob
