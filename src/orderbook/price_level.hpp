#pragma once

#include "core/types.hpp"
#include <vector>

namespace booksync {

/// Resting liquidity at one price
struct PriceLevel {
    Price price;
    Size size;

    [[nodiscard]] bool operator==(const PriceLevel& other) const noexcept {
        return price == other.price && size == other.size;
    }

    [[nodiscard]] bool operator!=(const PriceLevel& other) const noexcept {
        return !(*this == other);
    }
};

using PriceLevels = std::vector<PriceLevel>;

}  // namespace booksync
