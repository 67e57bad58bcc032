#pragma once

#include "network/connection_state.hpp"
#include "orderbook/book_metrics.hpp"
#include "orderbook/book_types.hpp"
#include "orderbook/views.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace booksync::output {

/// Console output for book summaries
class ConsoleLogger {
public:
    /// Create a console logger
    /// @param depth_levels Levels per side printed by log_depth
    explicit ConsoleLogger(std::size_t depth_levels);

    /// One summary line per instrument
    void log_book(
        const InstrumentId& instrument_id,
        const BestPrices& best,
        const book_metrics::FillEstimate& buy_fill,
        const std::optional<LastTrade>& last_trade,
        bool stale
    );

    /// Top levels of both ladders (debug level)
    void log_depth(const InstrumentId& instrument_id, const DepthView& depth);

    /// Log connection state change
    void log_connection_state(network::ConnectionState state);

    /// Shorten long token ids for display: first and last 6 characters
    [[nodiscard]] static std::string short_id(const InstrumentId& instrument_id);

private:
    std::size_t depth_levels_;
};

}  // namespace booksync::output
