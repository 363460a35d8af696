#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "async_cursor.hpp"
#include "detail/invoke.hpp"
#include "next.hpp"
#include "probe.hpp"
#include "stream.hpp"

namespace lazyseq {
namespace detail {
template<typename Sequence>
using opened_cursor_t = decltype(std::declval<const Sequence&>().open());
}  // namespace detail

// Concatenates the sequences yielded by upstream. Each inner sequence is
// opened only once the previous one is exhausted.
template<cursor_source Cursor>
class flatten_cursor {
    using inner_cursor = detail::opened_cursor_t<cursor_result_t<Cursor>>;
    using result_type = cursor_result_t<inner_cursor>;

    Cursor upstream_;
    std::optional<inner_cursor> inner_;

  public:
    explicit flatten_cursor(Cursor upstream) : upstream_(std::move(upstream)) {}

    std::optional<result_type> next() {
        while (true) {
            if (inner_) {
                if (auto value = inner_->next()) {
                    return value;
                }
                inner_.reset();
            }
            auto inner = upstream_.next();
            if (!inner) {
                return std::nullopt;
            }
            inner_.emplace(inner->open());
        }
    }
};

// flatten(map(func)) without the intermediate stage.
template<cursor_source Cursor, typename Func>
class flat_map_cursor {
    using inner_sequence =
        std::remove_cvref_t<detail::indexed_result_t<Func, cursor_result_t<Cursor>>>;
    using inner_cursor = detail::opened_cursor_t<inner_sequence>;
    using result_type = cursor_result_t<inner_cursor>;

    Cursor upstream_;
    Func func_;
    std::size_t index_{0};
    std::optional<inner_cursor> inner_;

  public:
    flat_map_cursor(Cursor upstream, Func func)
        : upstream_(std::move(upstream)), func_(std::move(func)) {}

    std::optional<result_type> next() {
        while (true) {
            if (inner_) {
                if (auto value = inner_->next()) {
                    return value;
                }
                inner_.reset();
            }
            auto value = upstream_.next();
            if (!value) {
                return std::nullopt;
            }
            inner_sequence inner = detail::invoke_indexed(func_, std::move(*value), index_++);
            inner_.emplace(inner.open());
        }
    }
};

template<typename U, typename Inner>
stream<U> flatten_stream(async_cursor<Inner> upstream) {
    while (auto inner = co_await next(upstream)) {
        co_yield inner->open();
    }
}

template<typename U, typename T, typename Func>
stream<U> flat_map_stream(async_cursor<T> upstream, Func func) {
    std::size_t index = 0;
    while (auto value = co_await next(upstream)) {
        auto inner =
            co_await detail::resolve(detail::invoke_indexed(func, std::move(*value), index++));
        co_yield inner.open();
    }
}
}  // namespace lazyseq
