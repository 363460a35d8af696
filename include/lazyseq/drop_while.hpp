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
// Skips values while the predicate holds, then yields the first failing value
// and everything after it without consulting the predicate again.
template<cursor_source Cursor, typename Predicate>
class drop_while_cursor {
    using result_type = cursor_result_t<Cursor>;

    Cursor upstream_;
    Predicate predicate_;
    bool dropping_{true};

  public:
    drop_while_cursor(Cursor upstream, Predicate predicate)
        : upstream_(std::move(upstream)), predicate_(std::move(predicate)) {}

    std::optional<result_type> next() {
        if (!dropping_) {
            return upstream_.next();
        }
        std::size_t index = 0;
        while (auto value = upstream_.next()) {
            if (!detail::invoke_indexed(predicate_, std::as_const(*value), index++)) {
                dropping_ = false;
                return value;
            }
        }
        dropping_ = false;
        return std::nullopt;
    }
};

template<typename T, typename Predicate>
stream<T> drop_while_stream(async_cursor<T> upstream, Predicate predicate) {
    std::size_t index = 0;
    while (auto value = co_await next(upstream)) {
        if (!co_await detail::resolve(
                detail::invoke_indexed(predicate, std::as_const(*value), index++)
            )) {
            co_yield std::move(*value);
            co_yield std::move(upstream);
            co_return;
        }
    }
}
}  // namespace lazyseq
