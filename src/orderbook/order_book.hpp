#pragma once

#include "orderbook/book_types.hpp"
#include "orderbook/ladder.hpp"
#include "orderbook/views.hpp"
#include <cstddef>
#include <deque>
#include <optional>

namespace booksync {

/// Order book entry for one instrument
/// Holds both ladders, the pre-snapshot delta buffer and pass-through metadata
class OrderBook {
public:
    /// Result of feeding one delta to the entry
    enum class DeltaOutcome {
        Applied,        // Ladder changed
        Unchanged,      // Same size already present, or removal of a missing level
        Buffered,       // Not seeded yet, queued for replay
        BufferOverflow  // Queued, oldest buffered delta dropped to stay bounded
    };

    /// Create an unseeded entry
    /// @param instrument_id Token id this entry belongs to
    /// @param max_pending_deltas Bound on the pre-snapshot buffer (0 = unbounded)
    OrderBook(InstrumentId instrument_id, std::size_t max_pending_deltas);

    /// Replace both ladders wholesale, mark seeded and replay buffered deltas in arrival order
    /// @return Number of deltas replayed
    std::size_t seed(const BookSnapshot& snapshot, SeedSource source);

    /// Apply or buffer a delta
    DeltaOutcome apply(const Delta& delta);

    /// Back to the freshly created state (no levels, no buffer, no metadata)
    void reset();

    void set_tick_size(Price tick_size);
    void record_trade(LastTrade trade);

    [[nodiscard]] BestPrices best_prices() const;
    [[nodiscard]] DepthView depth(std::optional<std::size_t> max_levels = std::nullopt) const;

    /// Both ladders non-empty and best bid >= best ask
    [[nodiscard]] bool is_crossed() const;

    [[nodiscard]] const InstrumentId& instrument_id() const noexcept;
    [[nodiscard]] bool snapshot_received() const noexcept;
    [[nodiscard]] std::size_t pending_deltas() const noexcept;
    [[nodiscard]] Timestamp last_updated_at() const noexcept;
    [[nodiscard]] const BookMetadata& metadata() const noexcept;
    [[nodiscard]] const std::optional<LastTrade>& last_trade() const noexcept;
    [[nodiscard]] std::size_t bid_levels() const noexcept;
    [[nodiscard]] std::size_t ask_levels() const noexcept;

private:
    bool apply_level(const Delta& delta);

    InstrumentId instrument_id_;
    std::size_t max_pending_deltas_;

    BidLadder bids_;
    AskLadder asks_;
    bool snapshot_received_{false};
    std::deque<Delta> pending_;
    Timestamp last_updated_at_{};

    BookMetadata metadata_;
    std::optional<LastTrade> last_trade_;
};

}  // namespace booksync
