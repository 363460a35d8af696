#pragma once

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>

#include "async_cursor.hpp"
#include "detail/invoke.hpp"
#include "next.hpp"
#include "probe.hpp"
#include "stream.hpp"

namespace lazyseq {
template<cursor_source Cursor, typename Func>
class map_cursor {
    using input_type = cursor_result_t<Cursor>;
    using result_type = std::remove_cvref_t<detail::indexed_result_t<Func, input_type>>;

    Cursor upstream_;
    Func func_;
    std::size_t index_{0};

  public:
    map_cursor(Cursor upstream, Func func)
        : upstream_(std::move(upstream)), func_(std::move(func)) {}

    std::optional<result_type> next() {
        auto value = upstream_.next();
        if (!value) {
            return std::nullopt;
        }
        return detail::invoke_indexed(func_, std::move(*value), index_++);
    }
};

template<typename U, typename T, typename Func>
stream<U> map_stream(async_cursor<T> upstream, Func func) {
    std::size_t index = 0;
    while (auto value = co_await next(upstream)) {
        co_yield co_await detail::resolve(detail::invoke_indexed(func, std::move(*value), index++));
    }
}
}  // namespace lazyseq
