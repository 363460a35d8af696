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
// Yields values until the predicate first fails. The failing value is
// consumed from upstream but not yielded, and nothing is pulled afterwards.
template<cursor_source Cursor, typename Predicate>
class take_while_cursor {
    using result_type = cursor_result_t<Cursor>;

    Cursor upstream_;
    Predicate predicate_;
    std::size_t index_{0};
    bool done_{false};

  public:
    take_while_cursor(Cursor upstream, Predicate predicate)
        : upstream_(std::move(upstream)), predicate_(std::move(predicate)) {}

    std::optional<result_type> next() {
        if (done_) {
            return std::nullopt;
        }
        auto value = upstream_.next();
        if (!value || !detail::invoke_indexed(predicate_, std::as_const(*value), index_++)) {
            done_ = true;
            return std::nullopt;
        }
        return value;
    }
};

template<typename T, typename Predicate>
stream<T> take_while_stream(async_cursor<T> upstream, Predicate predicate) {
    std::size_t index = 0;
    while (auto value = co_await next(upstream)) {
        if (!co_await detail::resolve(
                detail::invoke_indexed(predicate, std::as_const(*value), index++)
            )) {
            co_return;
        }
        co_yield std::move(*value);
    }
}
}  // namespace lazyseq
