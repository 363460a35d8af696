#pragma once

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

#include "../awaitable.hpp"
#include "../ready.hpp"

namespace lazyseq::detail {
// Callbacks take either (value) or (value, index).
template<typename Func, typename Value>
decltype(auto) invoke_indexed(Func& func, Value&& value, std::size_t index) {
    if constexpr (std::is_invocable_v<Func&, Value&&, std::size_t>) {
        return std::invoke(func, std::forward<Value>(value), index);
    } else {
        return std::invoke(func, std::forward<Value>(value));
    }
}

template<typename Func, typename Value>
using indexed_result_t =
    decltype(invoke_indexed(std::declval<Func&>(), std::declval<Value>(), std::size_t{}));

// Accumulating callbacks take either (acc, value) or (acc, value, index).
template<typename Func, typename Accumulator, typename Value>
decltype(auto)
invoke_accumulate(Func& func, Accumulator&& accumulator, Value&& value, std::size_t index) {
    if constexpr (std::is_invocable_v<Func&, Accumulator&&, Value&&, std::size_t>) {
        return std::invoke(
            func, std::forward<Accumulator>(accumulator), std::forward<Value>(value), index
        );
    } else {
        return std::invoke(
            func, std::forward<Accumulator>(accumulator), std::forward<Value>(value)
        );
    }
}

template<typename Func, typename Accumulator, typename Value>
using accumulate_result_t = decltype(invoke_accumulate(
    std::declval<Func&>(), std::declval<Accumulator>(), std::declval<Value>(), std::size_t{}
));

// Async callbacks may hand back a plain value or an awaitable resolving to it.
template<typename Value>
auto resolve(Value&& value) {
    using value_type = std::remove_cvref_t<Value>;
    if constexpr (awaitable<value_type>) {
        return value_type(std::forward<Value>(value));
    } else {
        return ready_awaitable<value_type>(std::forward<Value>(value));
    }
}

template<typename Value>
struct resolved {
    using type = std::remove_cvref_t<Value>;
};

template<typename Value>
    requires awaitable<std::remove_cvref_t<Value>>
struct resolved<Value> {
    using type = awaitable_result_t<std::remove_cvref_t<Value>>;
};

template<typename Value>
using resolved_t = typename resolved<Value>::type;
}  // namespace lazyseq::detail
