#include "orderbook/book_metrics.hpp"
#include <algorithm>

namespace booksync::book_metrics {

FillEstimate simulate_fill(const DepthView& depth, Side taker, Size size) {
    FillEstimate estimate;
    estimate.requested = size;
    estimate.unfilled = size.is_positive() ? size : Size::zero();
    if (!size.is_positive()) {
        return estimate;
    }

    const PriceLevels& levels = taker == Side::Bid ? depth.asks : depth.bids;
    if (levels.empty()) {
        return estimate;
    }

    estimate.best_price = levels.front().price;
    Size remaining = size;

    for (const auto& level : levels) {
        if (!remaining.is_positive()) {
            break;
        }
        const Size take = std::min(remaining, level.size);
        estimate.notional += take.to_double() * level.price.to_double();
        estimate.filled += take;
        remaining -= take;
        estimate.worst_price = level.price;
    }

    estimate.unfilled = remaining;
    if (estimate.filled.is_positive()) {
        estimate.avg_price = estimate.notional / estimate.filled.to_double();
    }

    const double best = estimate.best_price->to_double();
    estimate.slippage = taker == Side::Bid ? estimate.avg_price - best : best - estimate.avg_price;
    if (best > 0.0) {
        estimate.slippage_percent = estimate.slippage / best * 100.0;
    }
    return estimate;
}

Size total_size(const PriceLevels& levels) {
    Size total;
    for (const auto& level : levels) {
        total += level.size;
    }
    return total;
}

std::optional<BasisPoints> spread_bps(const BestPrices& best) {
    auto spread = best.spread();
    auto mid = best.midpoint();
    if (!spread || !mid || *mid <= 0.0) {
        return std::nullopt;
    }
    return spread->to_double() / *mid * 10000.0;
}

}  // namespace booksync::book_metrics
