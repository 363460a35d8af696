#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "async_cursor.hpp"
#include "next.hpp"
#include "probe.hpp"
#include "stream.hpp"

namespace lazyseq {
template<cursor_source Cursor>
class drop_cursor {
    using result_type = cursor_result_t<Cursor>;

    Cursor upstream_;
    std::size_t to_drop_;

  public:
    drop_cursor(Cursor upstream, std::size_t count)
        : upstream_(std::move(upstream)), to_drop_(count) {}

    std::optional<result_type> next() {
        while (to_drop_ > 0) {
            --to_drop_;
            if (!upstream_.next()) {
                to_drop_ = 0;
                return std::nullopt;
            }
        }
        return upstream_.next();
    }
};

template<typename T>
stream<T> drop_stream(async_cursor<T> upstream, std::size_t count) {
    for (; count > 0; --count) {
        auto skipped = co_await next(upstream);
        if (!skipped) {
            co_return;
        }
    }
    co_yield std::move(upstream);
}
}  // namespace lazyseq
