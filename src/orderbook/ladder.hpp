#pragma once

#include "orderbook/price_level.hpp"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>

namespace booksync {

/// One side of one instrument's book
/// Keyed by exact fixed-point price; the comparator fixes the side's order,
/// so insertion keeps the ladder sorted and begin() is always the best level
/// @tparam Compare std::greater<Price> for bids, std::less<Price> for asks
template <typename Compare>
class Ladder {
public:
    using map_type = std::map<Price, Size, Compare>;

    /// Replace-at-price: size <= 0 removes the level
    /// @return true if the ladder changed
    bool set(Price price, Size size) {
        if (!size.is_positive()) {
            return levels_.erase(price) > 0;
        }
        auto [it, inserted] = levels_.try_emplace(price, size);
        if (inserted) {
            return true;
        }
        if (it->second == size) {
            return false;
        }
        it->second = size;
        return true;
    }

    /// Drop all levels and load the given ones; non-positive sizes are skipped,
    /// the last occurrence of a repeated price wins
    void replace(const PriceLevels& levels) {
        levels_.clear();
        for (const auto& level : levels) {
            set(level.price, level.size);
        }
    }

    /// Best level in O(1) (std::map keeps its leftmost node)
    [[nodiscard]] std::optional<PriceLevel> best() const {
        if (levels_.empty()) {
            return std::nullopt;
        }
        const auto& [price, size] = *levels_.begin();
        return PriceLevel{price, size};
    }

    /// Copy of the first max_levels levels in ladder order
    [[nodiscard]] PriceLevels levels(std::optional<std::size_t> max_levels = std::nullopt) const {
        const std::size_t limit = max_levels.value_or(levels_.size());
        PriceLevels out;
        out.reserve(std::min(limit, levels_.size()));
        for (auto it = levels_.begin(); it != levels_.end() && out.size() < limit; ++it) {
            out.push_back(PriceLevel{it->first, it->second});
        }
        return out;
    }

    [[nodiscard]] std::optional<Size> size_at(Price price) const {
        auto it = levels_.find(price);
        if (it == levels_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] Size total_size() const {
        Size total;
        for (const auto& [price, size] : levels_) {
            total += size;
        }
        return total;
    }

    [[nodiscard]] std::size_t depth() const noexcept {
        return levels_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return levels_.empty();
    }

    void clear() noexcept {
        levels_.clear();
    }

private:
    map_type levels_;
};

/// Bids: prices sorted descending (highest first)
using BidLadder = Ladder<std::greater<Price>>;

/// Asks: prices sorted ascending (lowest first)
using AskLadder = Ladder<std::less<Price>>;

}  // namespace booksync
