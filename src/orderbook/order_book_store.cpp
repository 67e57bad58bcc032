#include "orderbook/order_book_store.hpp"
#include <spdlog/spdlog.h>

namespace booksync {

OrderBookStore::OrderBookStore(const Config::Book& config)
    : config_(config)
{}

bool OrderBookStore::ensure_entry(const InstrumentId& instrument_id) {
    auto [it, inserted] = books_.try_emplace(instrument_id, instrument_id, config_.max_pending_deltas);
    if (inserted) {
        spdlog::debug("Book entry created for {}", instrument_id);
    }
    return inserted;
}

void OrderBookStore::reset(const InstrumentId& instrument_id) {
    if (auto* book = find(instrument_id)) {
        book->reset();
    }
}

bool OrderBookStore::evict(const InstrumentId& instrument_id) {
    if (books_.erase(instrument_id) > 0) {
        spdlog::debug("Book entry evicted for {}", instrument_id);
        return true;
    }
    return false;
}

bool OrderBookStore::seed_from_snapshot(const BookSnapshot& snapshot, SeedSource source) {
    auto* book = find(snapshot.instrument_id);
    if (book == nullptr) {
        spdlog::debug("Ignoring {} snapshot for untracked instrument {}",
                      to_string(source), snapshot.instrument_id);
        return false;
    }

    auto replayed = book->seed(snapshot, source);
    spdlog::info("Seeded {} from {} snapshot: {} bids, {} asks, replayed {} deltas",
                 snapshot.instrument_id, to_string(source),
                 book->bid_levels(), book->ask_levels(), replayed);

    check_crossed(*book);
    return true;
}

void OrderBookStore::apply_delta(const Delta& delta) {
    auto* book = find(delta.instrument_id);
    if (book == nullptr) {
        spdlog::debug("Dropping delta for untracked instrument {}", delta.instrument_id);
        return;
    }

    switch (book->apply(delta)) {
        case OrderBook::DeltaOutcome::Applied:
            check_crossed(*book);
            break;
        case OrderBook::DeltaOutcome::Unchanged:
            break;
        case OrderBook::DeltaOutcome::Buffered:
            spdlog::trace("Buffered {} delta {}@{} for {} ({} pending)",
                          to_string(delta.side), delta.size.to_string(), delta.price.to_string(),
                          delta.instrument_id, book->pending_deltas());
            break;
        case OrderBook::DeltaOutcome::BufferOverflow:
            spdlog::warn("Pending delta buffer full for {} ({}), dropped oldest",
                         delta.instrument_id, config_.max_pending_deltas);
            break;
    }
}

void OrderBookStore::record_trade(const InstrumentId& instrument_id, LastTrade trade) {
    if (auto* book = find(instrument_id)) {
        book->record_trade(std::move(trade));
    }
}

void OrderBookStore::set_tick_size(const InstrumentId& instrument_id, Price tick_size) {
    if (auto* book = find(instrument_id)) {
        spdlog::info("Tick size for {} is now {}", instrument_id, tick_size.to_string());
        book->set_tick_size(tick_size);
    }
}

BestPrices OrderBookStore::best_prices(const InstrumentId& instrument_id) const {
    if (const auto* book = find(instrument_id)) {
        return book->best_prices();
    }
    return BestPrices{};
}

DepthView OrderBookStore::depth(const InstrumentId& instrument_id,
                                std::optional<std::size_t> max_levels) const {
    if (const auto* book = find(instrument_id)) {
        return book->depth(max_levels);
    }
    return DepthView{};
}

std::optional<LastTrade> OrderBookStore::last_trade(const InstrumentId& instrument_id) const {
    if (const auto* book = find(instrument_id)) {
        return book->last_trade();
    }
    return std::nullopt;
}

std::optional<BookMetadata> OrderBookStore::metadata(const InstrumentId& instrument_id) const {
    if (const auto* book = find(instrument_id)) {
        return book->metadata();
    }
    return std::nullopt;
}

bool OrderBookStore::is_stale(const InstrumentId& instrument_id, Timestamp now) const {
    const auto* book = find(instrument_id);
    if (book == nullptr || !book->snapshot_received()) {
        return true;
    }
    return now - book->last_updated_at() > config_.stale_threshold;
}

bool OrderBookStore::contains(const InstrumentId& instrument_id) const {
    return find(instrument_id) != nullptr;
}

bool OrderBookStore::is_seeded(const InstrumentId& instrument_id) const {
    const auto* book = find(instrument_id);
    return book != nullptr && book->snapshot_received();
}

std::size_t OrderBookStore::pending_deltas(const InstrumentId& instrument_id) const {
    const auto* book = find(instrument_id);
    return book != nullptr ? book->pending_deltas() : 0;
}

std::size_t OrderBookStore::size() const noexcept {
    return books_.size();
}

std::size_t OrderBookStore::crossed_book_count() const noexcept {
    return crossed_books_;
}

const OrderBook* OrderBookStore::find(const InstrumentId& instrument_id) const {
    auto it = books_.find(instrument_id);
    return it != books_.end() ? &it->second : nullptr;
}

OrderBook* OrderBookStore::find(const InstrumentId& instrument_id) {
    auto it = books_.find(instrument_id);
    return it != books_.end() ? &it->second : nullptr;
}

void OrderBookStore::check_crossed(const OrderBook& book) {
    if (!book.is_crossed()) {
        return;
    }
    ++crossed_books_;
    auto best = book.best_prices();
    spdlog::warn("InvariantViolation: crossed book for {} (bid {} >= ask {})",
                 book.instrument_id(), best.best_bid->to_string(), best.best_ask->to_string());
}

}  // namespace booksync
