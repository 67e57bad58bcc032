#pragma once

#include <chrono>
#include <cstddef>
#include <random>

namespace booksync {

/// Exponential backoff with random jitter and an attempt budget
/// The budget refills once reset_window has passed since the first attempt
/// of the current run of failures.
class ReconnectStrategy {
public:
    using Clock = std::chrono::steady_clock;

    /// Create a reconnect strategy
    /// @param base_delay Initial delay
    /// @param max_delay Maximum delay cap
    /// @param multiplier Backoff multiplier
    /// @param jitter_factor Random jitter factor (e.g., 0.3 for ±30%, 0 for none)
    /// @param max_attempts Attempts allowed per window (0 = unlimited)
    /// @param reset_window Time after the first attempt at which the budget refills
    ReconnectStrategy(
        std::chrono::milliseconds base_delay = std::chrono::milliseconds{1000},
        std::chrono::milliseconds max_delay = std::chrono::milliseconds{30000},
        double multiplier = 2.0,
        double jitter_factor = 0.3,
        std::size_t max_attempts = 0,
        std::chrono::milliseconds reset_window = std::chrono::minutes{5}
    );

    /// Count one attempt and get its delay with jitter applied
    /// Increases internal delay for subsequent calls
    [[nodiscard]] std::chrono::milliseconds next_delay(Clock::time_point now = Clock::now());

    /// True once the attempt budget for the current window is used up
    /// Call before next_delay() to decide whether to try again at all
    [[nodiscard]] bool exhausted(Clock::time_point now = Clock::now()) const noexcept;

    /// Reset delay and attempt budget back to the start
    void reset();

    /// Get current delay (without jitter, without incrementing)
    [[nodiscard]] std::chrono::milliseconds current_delay() const noexcept;

    /// Get attempt count since last reset
    [[nodiscard]] std::size_t attempt_count() const noexcept;

    [[nodiscard]] std::size_t max_attempts() const noexcept;

private:
    [[nodiscard]] bool window_expired(Clock::time_point now) const noexcept;

    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    std::chrono::milliseconds current_delay_;
    double multiplier_;
    double jitter_factor_;
    std::size_t max_attempts_;
    std::chrono::milliseconds reset_window_;
    std::size_t attempt_count_{0};
    Clock::time_point window_start_{};

    std::mt19937 rng_{std::random_device{}()};
};

}  // namespace booksync
