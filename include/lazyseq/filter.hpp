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
// Keeps the values the predicate holds for. The index passed to the predicate
// counts every upstream value, kept or not.
template<cursor_source Cursor, typename Predicate>
class filter_cursor {
    using result_type = cursor_result_t<Cursor>;

    Cursor upstream_;
    Predicate predicate_;
    std::size_t index_{0};

  public:
    filter_cursor(Cursor upstream, Predicate predicate)
        : upstream_(std::move(upstream)), predicate_(std::move(predicate)) {}

    std::optional<result_type> next() {
        while (auto value = upstream_.next()) {
            if (detail::invoke_indexed(predicate_, std::as_const(*value), index_++)) {
                return value;
            }
        }
        return std::nullopt;
    }
};

template<typename T, typename Predicate>
stream<T> filter_stream(async_cursor<T> upstream, Predicate predicate) {
    std::size_t index = 0;
    while (auto value = co_await next(upstream)) {
        if (co_await detail::resolve(
                detail::invoke_indexed(predicate, std::as_const(*value), index++)
            )) {
            co_yield std::move(*value);
        }
    }
}
}  // namespace lazyseq
