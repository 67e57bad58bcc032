#pragma once

#include "orderbook/price_level.hpp"
#include <optional>
#include <string>

namespace booksync {

/// Replace-at-price update to one level (not additive); size 0 removes it
struct Delta {
    InstrumentId instrument_id;
    Side side;
    Price price;
    Size size;
    Timestamp received_at{};
};

/// Where the current ladders were last seeded from
enum class SeedSource {
    None,
    Rest,
    Stream
};

[[nodiscard]] constexpr std::string_view to_string(SeedSource source) noexcept {
    switch (source) {
        case SeedSource::None:   return "none";
        case SeedSource::Rest:   return "rest";
        case SeedSource::Stream: return "stream";
    }
    return "unknown";
}

/// Full authoritative book for one instrument (REST /book or stream "book" event)
struct BookSnapshot {
    InstrumentId instrument_id;
    PriceLevels bids;
    PriceLevels asks;
    Timestamp fetched_at{};

    // Passed through unchanged to other collaborators
    std::string market;
    std::string hash;
    std::string timestamp;
    std::optional<Price> tick_size;
    std::optional<Size> min_order_size;
    bool neg_risk{false};
};

/// Pass-through metadata kept with each entry
struct BookMetadata {
    std::string market;
    std::string hash;
    std::string timestamp;
    std::optional<Price> tick_size;
    std::optional<Size> min_order_size;
    bool neg_risk{false};
    SeedSource source{SeedSource::None};
};

/// Most recent trade print for an instrument
struct LastTrade {
    Price price;
    Size size;
    Side aggressor;  // Bid = buy, Ask = sell
    std::string timestamp;
};

}  // namespace booksync
