#include "output/json_formatter.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace booksync::output {

namespace {

template <int Decimals>
nlohmann::json decimal_or_null(const std::optional<FixedPoint<Decimals>>& value) {
    if (!value) {
        return nullptr;
    }
    return value->to_string();
}

nlohmann::json levels_to_json(const PriceLevels& levels) {
    auto arr = nlohmann::json::array();
    for (const auto& level : levels) {
        arr.push_back({{"price", level.price.to_string()}, {"size", level.size.to_string()}});
    }
    return arr;
}

}  // namespace

nlohmann::json JsonFormatter::format_book(
    const InstrumentId& instrument_id,
    const BestPrices& best,
    const DepthView& depth,
    const std::optional<LastTrade>& last_trade,
    bool stale
) {
    auto mid = best.midpoint();
    auto bps = book_metrics::spread_bps(best);

    nlohmann::json out{
        {"type", "book"},
        {"timestamp", iso_timestamp()},
        {"instrument", instrument_id},
        {"bestBid", decimal_or_null(best.best_bid)},
        {"bestBidSize", decimal_or_null(best.best_bid_size)},
        {"bestAsk", decimal_or_null(best.best_ask)},
        {"bestAskSize", decimal_or_null(best.best_ask_size)},
        {"spread", decimal_or_null(best.spread())},
        {"spreadBps", bps ? nlohmann::json(*bps) : nlohmann::json(nullptr)},
        {"midpoint", mid ? nlohmann::json(*mid) : nlohmann::json(nullptr)},
        {"totalBidSize", book_metrics::total_size(depth.bids).to_string()},
        {"totalAskSize", book_metrics::total_size(depth.asks).to_string()},
        {"bids", levels_to_json(depth.bids)},
        {"asks", levels_to_json(depth.asks)},
        {"stale", stale}
    };

    if (last_trade) {
        out["lastTrade"] = {
            {"price", last_trade->price.to_string()},
            {"size", last_trade->size.to_string()},
            {"side", last_trade->aggressor == Side::Bid ? "BUY" : "SELL"},
            {"timestamp", last_trade->timestamp}
        };
    } else {
        out["lastTrade"] = nullptr;
    }

    return out;
}

nlohmann::json JsonFormatter::format_fill(const book_metrics::FillEstimate& fill) {
    return nlohmann::json{
        {"requested", fill.requested.to_string()},
        {"filled", fill.filled.to_string()},
        {"unfilled", fill.unfilled.to_string()},
        {"avgPrice", fill.avg_price},
        {"bestPrice", decimal_or_null(fill.best_price)},
        {"worstPrice", decimal_or_null(fill.worst_price)},
        {"notional", fill.notional},
        {"slippage", fill.slippage},
        {"slippagePercent", fill.slippage_percent},
        {"canFill", fill.can_fill()}
    };
}

nlohmann::json JsonFormatter::format_status(network::ConnectionState state) {
    return nlohmann::json{
        {"type", "status"},
        {"timestamp", iso_timestamp()},
        {"connected", state == network::ConnectionState::Connected},
        {"state", std::string(network::to_string(state))},
        {"label", std::string(network::status_label(state))}
    };
}

std::string JsonFormatter::iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace booksync::output
