#pragma once

#include "chunkup/core/error.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace chunkup {

namespace detail {

// Tags keep Result<T, T> unambiguous
template<typename T>
struct Success {
    T payload;
};

template<typename E>
struct Failure {
    E payload;
};

} // namespace detail

/**
 * @brief Value or Error, returned by every fallible operation
 *
 * Built with Ok(value) and Err<T>(error). Reading the side that is not
 * held throws std::bad_variant_access.
 *
 * Usage example:
 * ```cpp
 * auto url = Url::parse(text);
 * if (url.is_error()) {
 *     return Err<HttpResponse>(url.error());
 * }
 * connect(url.value());
 * ```
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(detail::Success<T> ok) : state_(std::in_place_index<0>, std::move(ok.payload)) {}
    Result(detail::Failure<E> err) : state_(std::in_place_index<1>, std::move(err.payload)) {}

    bool is_ok() const { return state_.index() == 0; }
    bool is_error() const { return !is_ok(); }

    T& value() { return std::get<0>(state_); }
    const T& value() const { return std::get<0>(state_); }

    /// Move the value out, leaving a moved-from T behind.
    T take_value() { return std::move(std::get<0>(state_)); }

    E& error() { return std::get<1>(state_); }
    const E& error() const { return std::get<1>(state_); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

private:
    std::variant<T, E> state_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(detail::Failure<E> err) : error_(std::move(err.payload)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(detail::Success<T>{std::move(value)});
}

template<typename E = Error>
Result<void, E> Ok() {
    return Result<void, E>();
}

template<typename T, typename E>
Result<T, E> Err(E error) {
    return Result<T, E>(detail::Failure<E>{std::move(error)});
}

} // namespace chunkup
