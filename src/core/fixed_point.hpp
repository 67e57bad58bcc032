#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace booksync {

/// Fixed-point decimal for exact price and size handling
/// Wire decimals ("0.52", "120.5") map onto int64_t with a fixed scale, so
/// equal strings always produce equal map keys
/// @tparam Decimals Number of decimal places kept (extra digits are truncated)
template <int Decimals>
class FixedPoint {
public:
    static_assert(Decimals >= 0 && Decimals <= 12,
                  "Decimals must be between 0 and 12");

    using underlying_type = std::int64_t;

    /// Scale factor (10^Decimals)
    static constexpr underlying_type scale = []() {
        underlying_type s = 1;
        for (int i = 0; i < Decimals; ++i) {
            s *= 10;
        }
        return s;
    }();

    constexpr FixedPoint() noexcept : value_(0) {}

    static constexpr FixedPoint from_raw(underlying_type raw) noexcept {
        FixedPoint fp;
        fp.value_ = raw;
        return fp;
    }

    /// Construct from double (with rounding); tests and display code only
    explicit FixedPoint(double d) noexcept
        : value_(static_cast<underlying_type>(
              std::llround(d * static_cast<double>(scale)))) {}

    [[nodiscard]] constexpr underlying_type raw() const noexcept {
        return value_;
    }

    /// Convert to double (for display and derived statistics only)
    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(value_) / static_cast<double>(scale);
    }

    /// Shortest decimal string, trailing zeros removed ("0.5", "120")
    [[nodiscard]] std::string to_string() const {
        if (value_ == 0) {
            return "0";
        }

        const bool negative = value_ < 0;
        const underlying_type abs_val = negative ? -value_ : value_;

        std::string result = negative ? "-" : "";
        result += std::to_string(abs_val / scale);

        underlying_type frac_part = abs_val % scale;
        if (frac_part > 0) {
            std::string frac_str = std::to_string(frac_part);
            frac_str.insert(0, static_cast<std::size_t>(Decimals) - frac_str.size(), '0');
            while (frac_str.back() == '0') {
                frac_str.pop_back();
            }
            result += '.';
            result += frac_str;
        }
        return result;
    }

    /// Parse a plain decimal string ("-0.25", "+3", ".5", "12.")
    /// @return nullopt for empty input, exponents, stray characters or overflow
    [[nodiscard]] static std::optional<FixedPoint> try_parse(std::string_view str) noexcept {
        std::size_t pos = 0;
        bool negative = false;

        if (!str.empty() && (str[0] == '-' || str[0] == '+')) {
            negative = str[0] == '-';
            pos = 1;
        }

        constexpr underlying_type max_integer_part =
            std::numeric_limits<underlying_type>::max() / scale;

        underlying_type integer_part = 0;
        underlying_type frac_part = 0;
        int frac_digits = 0;
        bool in_fraction = false;
        bool has_digits = false;

        for (; pos < str.size(); ++pos) {
            const char c = str[pos];
            if (c == '.') {
                if (in_fraction) {
                    return std::nullopt;
                }
                in_fraction = true;
                continue;
            }
            if (c < '0' || c > '9') {
                return std::nullopt;
            }

            has_digits = true;
            const int digit = c - '0';
            if (in_fraction) {
                if (frac_digits < Decimals) {
                    frac_part = frac_part * 10 + digit;
                    ++frac_digits;
                }
            } else {
                if (integer_part > (max_integer_part - digit) / 10) {
                    return std::nullopt;
                }
                integer_part = integer_part * 10 + digit;
            }
        }

        if (!has_digits) {
            return std::nullopt;
        }

        for (; frac_digits < Decimals; ++frac_digits) {
            frac_part *= 10;
        }

        if (integer_part > (std::numeric_limits<underlying_type>::max() - frac_part) / scale) {
            return std::nullopt;
        }

        underlying_type result = integer_part * scale + frac_part;
        return from_raw(negative ? -result : result);
    }

    [[nodiscard]] constexpr bool operator==(const FixedPoint& other) const noexcept {
        return value_ == other.value_;
    }

    [[nodiscard]] constexpr bool operator!=(const FixedPoint& other) const noexcept {
        return value_ != other.value_;
    }

    [[nodiscard]] constexpr bool operator<(const FixedPoint& other) const noexcept {
        return value_ < other.value_;
    }

    [[nodiscard]] constexpr bool operator<=(const FixedPoint& other) const noexcept {
        return value_ <= other.value_;
    }

    [[nodiscard]] constexpr bool operator>(const FixedPoint& other) const noexcept {
        return value_ > other.value_;
    }

    [[nodiscard]] constexpr bool operator>=(const FixedPoint& other) const noexcept {
        return value_ >= other.value_;
    }

    [[nodiscard]] constexpr FixedPoint operator+(const FixedPoint& other) const noexcept {
        return from_raw(value_ + other.value_);
    }

    [[nodiscard]] constexpr FixedPoint operator-(const FixedPoint& other) const noexcept {
        return from_raw(value_ - other.value_);
    }

    constexpr FixedPoint& operator+=(const FixedPoint& other) noexcept {
        value_ += other.value_;
        return *this;
    }

    constexpr FixedPoint& operator-=(const FixedPoint& other) noexcept {
        value_ -= other.value_;
        return *this;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return value_ == 0;
    }

    [[nodiscard]] constexpr bool is_positive() const noexcept {
        return value_ > 0;
    }

    static constexpr FixedPoint zero() noexcept {
        return FixedPoint{};
    }

private:
    underlying_type value_;
};

}  // namespace booksync

namespace std {
template <int Decimals>
struct hash<booksync::FixedPoint<Decimals>> {
    std::size_t operator()(const booksync::FixedPoint<Decimals>& fp) const noexcept {
        return std::hash<typename booksync::FixedPoint<Decimals>::underlying_type>{}(fp.raw());
    }
};
}  // namespace std
