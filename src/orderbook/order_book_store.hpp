#pragma once

#include "core/config.hpp"
#include "orderbook/order_book.hpp"
#include <cstddef>
#include <optional>
#include <unordered_map>

namespace booksync {

/// Per-instrument cache of order books
/// The only component allowed to mutate ladder state. Readers get copies
/// (BestPrices, DepthView), never references into the ladders.
class OrderBookStore {
public:
    explicit OrderBookStore(const Config::Book& config);

    // Non-copyable, non-movable
    OrderBookStore(const OrderBookStore&) = delete;
    OrderBookStore& operator=(const OrderBookStore&) = delete;

    /// Create an unseeded entry if none exists
    /// @return true if a new entry was created
    bool ensure_entry(const InstrumentId& instrument_id);

    /// Return an existing entry to the unseeded state
    void reset(const InstrumentId& instrument_id);

    /// Drop the entry entirely
    /// @return true if an entry was removed
    bool evict(const InstrumentId& instrument_id);

    /// Replace both ladders, mark seeded and replay buffered deltas
    /// @return false if the instrument has no entry (released meanwhile)
    bool seed_from_snapshot(const BookSnapshot& snapshot, SeedSource source = SeedSource::Rest);

    /// Apply a replace-at-price delta, or buffer it until the entry is seeded
    /// Deltas for instruments without an entry are dropped
    void apply_delta(const Delta& delta);

    void record_trade(const InstrumentId& instrument_id, LastTrade trade);
    void set_tick_size(const InstrumentId& instrument_id, Price tick_size);

    /// Best bid/ask; both absent for unknown or unseeded instruments
    [[nodiscard]] BestPrices best_prices(const InstrumentId& instrument_id) const;

    /// Ordered copies of both ladders, optionally truncated
    [[nodiscard]] DepthView depth(const InstrumentId& instrument_id,
                                  std::optional<std::size_t> max_levels = std::nullopt) const;

    [[nodiscard]] std::optional<LastTrade> last_trade(const InstrumentId& instrument_id) const;
    [[nodiscard]] std::optional<BookMetadata> metadata(const InstrumentId& instrument_id) const;

    /// Unknown, unseeded, or not updated within the stale threshold
    [[nodiscard]] bool is_stale(const InstrumentId& instrument_id, Timestamp now) const;

    [[nodiscard]] bool contains(const InstrumentId& instrument_id) const;
    [[nodiscard]] bool is_seeded(const InstrumentId& instrument_id) const;
    [[nodiscard]] std::size_t pending_deltas(const InstrumentId& instrument_id) const;
    [[nodiscard]] std::size_t size() const noexcept;

    /// Crossed-book anomalies observed since construction
    [[nodiscard]] std::size_t crossed_book_count() const noexcept;

private:
    [[nodiscard]] const OrderBook* find(const InstrumentId& instrument_id) const;
    [[nodiscard]] OrderBook* find(const InstrumentId& instrument_id);
    void check_crossed(const OrderBook& book);

    Config::Book config_;
    std::unordered_map<InstrumentId, OrderBook> books_;
    std::size_t crossed_books_{0};
};

}  // namespace booksync
