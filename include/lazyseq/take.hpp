#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "async_cursor.hpp"
#include "next.hpp"
#include "probe.hpp"
#include "stream.hpp"

namespace lazyseq {
// Yields at most count values. Upstream is not pulled once count values
// have been handed out.
template<cursor_source Cursor>
class take_cursor {
    using result_type = cursor_result_t<Cursor>;

    Cursor upstream_;
    std::size_t remaining_;

  public:
    take_cursor(Cursor upstream, std::size_t count)
        : upstream_(std::move(upstream)), remaining_(count) {}

    std::optional<result_type> next() {
        if (remaining_ == 0) {
            return std::nullopt;
        }
        auto value = upstream_.next();
        if (!value) {
            remaining_ = 0;
            return std::nullopt;
        }
        --remaining_;
        return value;
    }
};

template<typename T>
stream<T> take_stream(async_cursor<T> upstream, std::size_t count) {
    while (count > 0) {
        auto value = co_await next(upstream);
        if (!value) {
            co_return;
        }
        --count;
        co_yield std::move(*value);
    }
}
}  // namespace lazyseq
