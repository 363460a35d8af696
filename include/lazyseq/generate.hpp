#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "async_cursor.hpp"
#include "detail/invoke.hpp"
#include "next.hpp"
#include "probe.hpp"
#include "stream.hpp"

namespace lazyseq {
namespace detail {
// A step function ends the sequence by returning std::nullopt; one returning
// plain values never ends it.
template<typename T, typename Result>
std::optional<T> step_result(Result&& result) {
    if constexpr (is_optional_v<std::remove_cvref_t<Result>>) {
        return std::optional<T>(std::forward<Result>(result));
    } else {
        return std::optional<T>(T(std::forward<Result>(result)));
    }
}
}  // namespace detail

// Yields the seed, then step(previous) until step returns std::nullopt.
// step is not called before the second value is requested.
template<typename T, typename Step>
class generate_cursor {
    std::optional<T> current_;
    Step step_;
    bool started_{false};

  public:
    generate_cursor(T seed, Step step) : current_(std::move(seed)), step_(std::move(step)) {}

    std::optional<T> next() {
        if (!started_) {
            started_ = true;
            return current_;
        }
        if (current_) {
            current_ = detail::step_result<T>(std::invoke(step_, std::as_const(*current_)));
        }
        return current_;
    }
};

template<typename T, typename Seed, typename Step>
stream<T> generate_stream(Seed seed, Step step) {
    std::optional<T> current(co_await detail::resolve(std::move(seed)));
    while (current) {
        co_yield T(*current);
        current = detail::step_result<T>(
            co_await detail::resolve(std::invoke(step, std::as_const(*current)))
        );
    }
}
}  // namespace lazyseq
