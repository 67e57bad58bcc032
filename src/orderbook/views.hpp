#pragma once

#include "orderbook/price_level.hpp"
#include <optional>

namespace booksync {

/// Best bid/ask for one instrument; each side is absent when that ladder is
/// empty or the book was never seeded
struct BestPrices {
    std::optional<Price> best_bid;
    std::optional<Price> best_ask;
    std::optional<Size> best_bid_size;
    std::optional<Size> best_ask_size;

    [[nodiscard]] bool has_both() const noexcept {
        return best_bid.has_value() && best_ask.has_value();
    }

    [[nodiscard]] std::optional<Price> spread() const {
        if (!has_both()) {
            return std::nullopt;
        }
        return *best_ask - *best_bid;
    }

    [[nodiscard]] std::optional<double> midpoint() const {
        if (!has_both()) {
            return std::nullopt;
        }
        return (best_bid->to_double() + best_ask->to_double()) / 2.0;
    }

    /// best bid >= best ask
    [[nodiscard]] bool is_crossed() const noexcept {
        return has_both() && *best_bid >= *best_ask;
    }
};

/// Read-only copy of both ladders in ladder order
struct DepthView {
    PriceLevels bids;  // descending
    PriceLevels asks;  // ascending

    [[nodiscard]] bool empty() const noexcept {
        return bids.empty() && asks.empty();
    }
};

}  // namespace booksync
