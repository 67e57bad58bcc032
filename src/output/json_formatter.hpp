#pragma once

#include "network/connection_state.hpp"
#include "orderbook/book_metrics.hpp"
#include "orderbook/book_types.hpp"
#include "orderbook/views.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace booksync::output {

/// Formats book views as JSON lines
/// Prices and sizes are emitted as decimal strings, like the wire format.
class JsonFormatter {
public:
    /// Format best prices, depth and derived values for one instrument
    [[nodiscard]] static nlohmann::json format_book(
        const InstrumentId& instrument_id,
        const BestPrices& best,
        const DepthView& depth,
        const std::optional<LastTrade>& last_trade,
        bool stale
    );

    /// Format a fill estimate
    [[nodiscard]] static nlohmann::json format_fill(const book_metrics::FillEstimate& fill);

    /// Format connection status as JSON
    [[nodiscard]] static nlohmann::json format_status(network::ConnectionState state);

    /// Get current ISO8601 timestamp string
    [[nodiscard]] static std::string iso_timestamp();
};

}  // namespace booksync::output
