#include "output/console_logger.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace booksync::output {

namespace {

std::string price_or_dash(const std::optional<Price>& price) {
    return price ? price->to_string() : "-";
}

std::string size_or_dash(const std::optional<Size>& size) {
    return size ? size->to_string() : "-";
}

}  // namespace

ConsoleLogger::ConsoleLogger(std::size_t depth_levels)
    : depth_levels_(depth_levels)
{}

void ConsoleLogger::log_book(
    const InstrumentId& instrument_id,
    const BestPrices& best,
    const book_metrics::FillEstimate& buy_fill,
    const std::optional<LastTrade>& last_trade,
    bool stale
) {
    auto spread = best.spread();
    auto bps = book_metrics::spread_bps(best);
    auto mid = best.midpoint();

    std::string fill = "-";
    if (buy_fill.filled.is_positive()) {
        fill = fmt::format("{:.4f} ({:+.2f}%){}", buy_fill.avg_price, buy_fill.slippage_percent,
                           buy_fill.can_fill() ? "" : " partial");
    }

    std::string last = "-";
    if (last_trade) {
        last = fmt::format("{} x {} {}", last_trade->price.to_string(), last_trade->size.to_string(),
                           last_trade->aggressor == Side::Bid ? "BUY" : "SELL");
    }

    // Format: ID | BID: price (size) | ASK: price (size) | SPREAD: x (bps) | MID: x | BUY N: avg | LAST: ...
    spdlog::info(
        "{} | BID: {} ({}) | ASK: {} ({}) | SPREAD: {} ({:.1f}bps) | MID: {} | BUY {}: {} | LAST: {}{}",
        short_id(instrument_id),
        price_or_dash(best.best_bid), size_or_dash(best.best_bid_size),
        price_or_dash(best.best_ask), size_or_dash(best.best_ask_size),
        price_or_dash(spread), bps.value_or(0.0),
        mid ? fmt::format("{:.4f}", *mid) : std::string("-"),
        buy_fill.requested.to_string(), fill,
        last,
        stale ? " | STALE" : ""
    );
}

void ConsoleLogger::log_depth(const InstrumentId& instrument_id, const DepthView& depth) {
    if (!spdlog::should_log(spdlog::level::debug)) {
        return;
    }

    const auto rows = std::max(depth.bids.size(), depth.asks.size());
    spdlog::debug("{} depth ({} bids, {} asks)", short_id(instrument_id), depth.bids.size(), depth.asks.size());
    for (std::size_t i = 0; i < rows && i < depth_levels_; ++i) {
        std::string bid = i < depth.bids.size()
            ? fmt::format("{:>10} @ {:<8}", depth.bids[i].size.to_string(), depth.bids[i].price.to_string())
            : std::string(21, ' ');
        std::string ask = i < depth.asks.size()
            ? fmt::format("{:<8} x {:>10}", depth.asks[i].price.to_string(), depth.asks[i].size.to_string())
            : std::string();
        spdlog::debug("  {} | {}", bid, ask);
    }
}

void ConsoleLogger::log_connection_state(network::ConnectionState state) {
    switch (state) {
        case network::ConnectionState::Connected:
        case network::ConnectionState::Connecting:
            spdlog::info("Connection: {}", network::status_label(state));
            break;
        case network::ConnectionState::Reconnecting:
        case network::ConnectionState::Disconnected:
            spdlog::warn("Connection: {}", network::status_label(state));
            break;
    }
}

std::string ConsoleLogger::short_id(const InstrumentId& instrument_id) {
    if (instrument_id.size() <= 15) {
        return instrument_id;
    }
    return instrument_id.substr(0, 6) + "..." + instrument_id.substr(instrument_id.size() - 6);
}

}  // namespace booksync::output
