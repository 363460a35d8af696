#pragma once

#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

#include "waker.hpp"

namespace lazyseq {
// Result of polling an async cursor: a value, nothing yet, or end of data.
template<typename T>
class stream_awaitable_state {
    constexpr explicit stream_awaitable_state(T result) : result_(std::move(result)) {}

    struct done_tag {};

    constexpr explicit stream_awaitable_state(done_tag) : done_(true) {}

  public:
    using result_type = T;
    stream_awaitable_state() = default;

    static constexpr stream_awaitable_state ready(T result) {
        return stream_awaitable_state(std::move(result));
    }

    static constexpr stream_awaitable_state pending() {
        return stream_awaitable_state();
    }

    static constexpr stream_awaitable_state done() {
        return stream_awaitable_state(done_tag{});
    }

    bool is_ready() const {
        return result_.has_value();
    }

    bool is_done() const {
        return done_;
    }

    T take_result() {
        return std::move(*result_);
    }

  private:
    std::optional<T> result_ = std::nullopt;
    bool done_{false};
};

namespace detail {
template<typename T>
inline constexpr bool is_stream_awaitable_state_v = false;

template<typename T>
inline constexpr bool is_stream_awaitable_state_v<stream_awaitable_state<T>> = true;

template<typename T>
struct stream_awaitable_state_traits;

template<typename T>
struct stream_awaitable_state_traits<stream_awaitable_state<T>> {
    using result_type = T;
};
}  // namespace detail

template<typename T>
concept stream_awaitable = requires(T t, const waker& w) { t.poll_next(w); } &&
    detail::is_stream_awaitable_state_v<
        decltype(std::declval<T&>().poll_next(std::declval<const waker&>()))>;

template<stream_awaitable T>
using stream_awaitable_result_t = typename detail::stream_awaitable_state_traits<
    decltype(std::declval<T&>().poll_next(std::declval<const waker&>()))>::result_type;

}  // namespace lazyseq
