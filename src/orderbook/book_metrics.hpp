#pragma once

#include "orderbook/views.hpp"
#include <optional>
#include <vector>

namespace booksync {

/// Derived depth calculations for consumers (trading form, summaries)
namespace book_metrics {

/// Outcome of walking the book for a market order of a given size
struct FillEstimate {
    Size requested;
    Size filled;
    Size unfilled;
    double avg_price{0.0};
    std::optional<Price> best_price;
    std::optional<Price> worst_price;
    double notional{0.0};         // Cost for a buy, proceeds for a sell
    double slippage{0.0};         // Distance from best price, always >= 0
    double slippage_percent{0.0};

    [[nodiscard]] bool can_fill() const noexcept {
        return unfilled.is_zero() && filled.is_positive();
    }
};

/// Walk asks (buy) or bids (sell) from best to worst until size is filled
/// @param depth Depth view, already in ladder order
/// @param taker Side of the incoming order: Bid buys from asks, Ask sells into bids
/// @param size Shares to fill; non-positive sizes yield an empty estimate
[[nodiscard]] FillEstimate simulate_fill(const DepthView& depth, Side taker, Size size);

/// Sum of sizes over the given levels
[[nodiscard]] Size total_size(const PriceLevels& levels);

/// Spread in basis points of the midpoint, if both sides exist
[[nodiscard]] std::optional<BasisPoints> spread_bps(const BestPrices& best);

}  // namespace book_metrics

}  // namespace booksync
