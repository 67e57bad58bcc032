#include "engine/reconnect_strategy.hpp"
#include <algorithm>
#include <cstdint>

namespace booksync {

ReconnectStrategy::ReconnectStrategy(
    std::chrono::milliseconds base_delay,
    std::chrono::milliseconds max_delay,
    double multiplier,
    double jitter_factor,
    std::size_t max_attempts,
    std::chrono::milliseconds reset_window
)
    : base_delay_(base_delay)
    , max_delay_(max_delay)
    , current_delay_(base_delay)
    , multiplier_(multiplier)
    , jitter_factor_(jitter_factor)
    , max_attempts_(max_attempts)
    , reset_window_(reset_window)
{}

std::chrono::milliseconds ReconnectStrategy::next_delay(Clock::time_point now) {
    if (window_expired(now)) {
        reset();
    }
    if (attempt_count_ == 0) {
        window_start_ = now;
    }
    ++attempt_count_;

    // Cap at max delay
    auto delay = std::min(current_delay_, max_delay_);

    // Apply random jitter: delay * (1 ± jitter_factor)
    auto jittered = delay;
    if (jitter_factor_ > 0.0) {
        std::uniform_real_distribution<double> dist(
            1.0 - jitter_factor_,
            1.0 + jitter_factor_
        );
        double jitter_multiplier = dist(rng_);
        auto jittered_count = static_cast<std::int64_t>(
            static_cast<double>(delay.count()) * jitter_multiplier
        );
        jittered = std::chrono::milliseconds{jittered_count};
    }

    // Increase delay for next time, stop growing once past the cap
    if (current_delay_ < max_delay_) {
        auto next_count = static_cast<std::int64_t>(
            static_cast<double>(current_delay_.count()) * multiplier_
        );
        current_delay_ = std::min(std::chrono::milliseconds{next_count}, max_delay_);
    }

    return jittered;
}

bool ReconnectStrategy::exhausted(Clock::time_point now) const noexcept {
    if (max_attempts_ == 0 || window_expired(now)) {
        return false;
    }
    return attempt_count_ >= max_attempts_;
}

void ReconnectStrategy::reset() {
    current_delay_ = base_delay_;
    attempt_count_ = 0;
    window_start_ = Clock::time_point{};
}

std::chrono::milliseconds ReconnectStrategy::current_delay() const noexcept {
    return current_delay_;
}

std::size_t ReconnectStrategy::attempt_count() const noexcept {
    return attempt_count_;
}

std::size_t ReconnectStrategy::max_attempts() const noexcept {
    return max_attempts_;
}

bool ReconnectStrategy::window_expired(Clock::time_point now) const noexcept {
    return attempt_count_ > 0 && now - window_start_ > reset_window_;
}

}  // namespace booksync
