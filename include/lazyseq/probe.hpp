#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include "size_hint.hpp"
#include "stream_awaitable.hpp"

namespace lazyseq {
namespace detail {
template<typename T>
inline constexpr bool is_optional_v = false;

template<typename T>
inline constexpr bool is_optional_v<std::optional<T>> = true;

template<typename Range>
using iterator_t = decltype(std::begin(std::declval<Range&>()));

template<typename Range>
using range_value_t = std::iter_value_t<iterator_t<Range>>;
}  // namespace detail

// Can hand out cursors over its elements: begin/end work on it.
template<typename T>
concept iterable = requires(T& t) {
    std::begin(t);
    std::end(t);
};

// Iterable whose traversals are independent of each other.
template<typename T>
concept multi_pass_iterable = iterable<T> && std::forward_iterator<detail::iterator_t<T>>;

// Is itself a pull cursor: next() hands out std::optional values until empty.
template<typename T>
concept cursor_source = requires(T& t) { t.next(); } &&
    detail::is_optional_v<decltype(std::declval<T&>().next())>;

template<cursor_source T>
using cursor_result_t = typename decltype(std::declval<T&>().next())::value_type;

// Is itself an async pull cursor.
template<typename T>
concept async_cursor_source = stream_awaitable<T>;

// Hands out a fresh async cursor on every call.
template<typename T>
concept async_iterable = std::invocable<T&> && stream_awaitable<std::invoke_result_t<T&>>;

template<typename T>
concept has_length = requires(const T& t) {
    { t.length() } -> std::convertible_to<std::ptrdiff_t>;
};

template<typename T>
concept has_size = requires(const T& t) {
    { t.size() } -> std::convertible_to<std::ptrdiff_t>;
};

// Element count advertised by the source itself: length() first, then size(),
// then the extent of a built-in array.
template<typename T>
constexpr std::ptrdiff_t probe_size(const T& source) {
    if constexpr (has_length<T>) {
        return static_cast<std::ptrdiff_t>(source.length());
    } else if constexpr (has_size<T>) {
        return static_cast<std::ptrdiff_t>(source.size());
    } else if constexpr (std::is_bounded_array_v<T>) {
        return static_cast<std::ptrdiff_t>(std::extent_v<T>);
    } else {
        return unknown_size;
    }
}
}  // namespace lazyseq
