#include "orderbook/order_book.hpp"
#include <chrono>
#include <utility>

namespace booksync {

OrderBook::OrderBook(InstrumentId instrument_id, std::size_t max_pending_deltas)
    : instrument_id_(std::move(instrument_id))
    , max_pending_deltas_(max_pending_deltas)
{}

std::size_t OrderBook::seed(const BookSnapshot& snapshot, SeedSource source) {
    bids_.replace(snapshot.bids);
    asks_.replace(snapshot.asks);
    snapshot_received_ = true;

    metadata_.market = snapshot.market;
    metadata_.hash = snapshot.hash;
    metadata_.timestamp = snapshot.timestamp;
    if (snapshot.tick_size) {
        metadata_.tick_size = snapshot.tick_size;
    }
    if (snapshot.min_order_size) {
        metadata_.min_order_size = snapshot.min_order_size;
    }
    metadata_.neg_risk = snapshot.neg_risk;
    metadata_.source = source;

    // Replay everything that arrived while unseeded, oldest first
    const std::size_t replayed = pending_.size();
    for (const auto& delta : pending_) {
        apply_level(delta);
    }
    pending_.clear();

    last_updated_at_ = std::chrono::steady_clock::now();
    return replayed;
}

OrderBook::DeltaOutcome OrderBook::apply(const Delta& delta) {
    if (!snapshot_received_) {
        bool overflow = false;
        if (max_pending_deltas_ > 0 && pending_.size() >= max_pending_deltas_) {
            pending_.pop_front();
            overflow = true;
        }
        pending_.push_back(delta);
        return overflow ? DeltaOutcome::BufferOverflow : DeltaOutcome::Buffered;
    }

    if (!apply_level(delta)) {
        return DeltaOutcome::Unchanged;
    }
    last_updated_at_ = std::chrono::steady_clock::now();
    return DeltaOutcome::Applied;
}

bool OrderBook::apply_level(const Delta& delta) {
    if (delta.side == Side::Bid) {
        return bids_.set(delta.price, delta.size);
    }
    return asks_.set(delta.price, delta.size);
}

void OrderBook::reset() {
    bids_.clear();
    asks_.clear();
    snapshot_received_ = false;
    pending_.clear();
    last_updated_at_ = Timestamp{};
    metadata_ = BookMetadata{};
    last_trade_.reset();
}

void OrderBook::set_tick_size(Price tick_size) {
    metadata_.tick_size = tick_size;
}

void OrderBook::record_trade(LastTrade trade) {
    last_trade_ = std::move(trade);
}

BestPrices OrderBook::best_prices() const {
    BestPrices best;
    if (!snapshot_received_) {
        return best;
    }
    if (auto bid = bids_.best()) {
        best.best_bid = bid->price;
        best.best_bid_size = bid->size;
    }
    if (auto ask = asks_.best()) {
        best.best_ask = ask->price;
        best.best_ask_size = ask->size;
    }
    return best;
}

DepthView OrderBook::depth(std::optional<std::size_t> max_levels) const {
    if (!snapshot_received_) {
        return DepthView{};
    }
    return DepthView{bids_.levels(max_levels), asks_.levels(max_levels)};
}

bool OrderBook::is_crossed() const {
    auto bid = bids_.best();
    auto ask = asks_.best();
    return bid && ask && bid->price >= ask->price;
}

const InstrumentId& OrderBook::instrument_id() const noexcept {
    return instrument_id_;
}

bool OrderBook::snapshot_received() const noexcept {
    return snapshot_received_;
}

std::size_t OrderBook::pending_deltas() const noexcept {
    return pending_.size();
}

Timestamp OrderBook::last_updated_at() const noexcept {
    return last_updated_at_;
}

const BookMetadata& OrderBook::metadata() const noexcept {
    return metadata_;
}

const std::optional<LastTrade>& OrderBook::last_trade() const noexcept {
    return last_trade_;
}

std::size_t OrderBook::bid_levels() const noexcept {
    return bids_.depth();
}

std::size_t OrderBook::ask_levels() const noexcept {
    return asks_.depth();
}

}  // namespace booksync
