#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace booksync {

/// Result type for fallible operations that must not throw
/// Inspired by Rust's Result<T, E>
template <typename T, typename E = std::string>
class Result {
public:
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Index-based so that T == E still works
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::logic_error("value() called on error Result");
        }
        return std::get<0>(data_);
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::logic_error("error() called on ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /// Move the value out (for large or move-only payloads)
    [[nodiscard]] T take_value() && {
        if (is_err()) {
            throw std::logic_error("take_value() called on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Transform the error if Err, preserve value if Ok
    template <typename F>
    [[nodiscard]] auto map_error(F&& func) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, NewE>::Err(func(std::get<1>(data_)));
        }
        return Result<T, NewE>::Ok(std::get<0>(data_));
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace booksync
