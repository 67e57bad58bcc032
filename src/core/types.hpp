#pragma once

#include "core/fixed_point.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace booksync {

// CLOB prices are probabilities in [0, 1] quoted to at most 4 decimals and
// sizes are share counts with at most 6; both fit 6 decimal places exactly
constexpr int kPriceDecimals = 6;
constexpr int kSizeDecimals = 6;

// Outcome-share price - fixed-point so equal wire strings are equal keys
using Price = FixedPoint<kPriceDecimals>;

// Resting size in shares
using Size = FixedPoint<kSizeDecimals>;

// Token id of one tradable outcome share
using InstrumentId = std::string;

// High-resolution timestamp for internal tracking
using Timestamp = std::chrono::steady_clock::time_point;

// Wall clock time for external display
using WallTime = std::chrono::system_clock::time_point;

// Basis points (1 bp = 0.01%)
using BasisPoints = double;

/// Book side
enum class Side {
    Bid,
    Ask
};

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    return side == Side::Bid ? "bid" : "ask";
}

namespace convert {

/// Parse price from string, nullopt if malformed
[[nodiscard]] inline std::optional<Price> parse_price(std::string_view s) noexcept {
    return Price::try_parse(s);
}

/// Parse size from string, nullopt if malformed
[[nodiscard]] inline std::optional<Size> parse_size(std::string_view s) noexcept {
    return Size::try_parse(s);
}

/// Convert fixed-point to double (for display/logging)
template <int Decimals>
[[nodiscard]] inline double to_double(FixedPoint<Decimals> fp) noexcept {
    return fp.to_double();
}

}  // namespace convert

}  // namespace booksync
