#pragma once

#include <iterator>
#include <memory>
#include <optional>
#include <utility>

#include "async_cursor.hpp"
#include "detail/invoke.hpp"
#include "next.hpp"
#include "stream.hpp"

namespace lazyseq {
// Cursor over an iterator range. When the range is owned by the pipeline the
// cursor shares ownership of it so the traversal never outlives its storage.
template<typename Iterator, typename Sentinel = Iterator>
class iter_cursor {
    using value_type = std::iter_value_t<Iterator>;

    std::shared_ptr<const void> storage_;
    Iterator current_;
    Sentinel end_;

  public:
    iter_cursor(Iterator begin, Sentinel end, std::shared_ptr<const void> storage = nullptr)
        : storage_(std::move(storage)), current_(std::move(begin)), end_(std::move(end)) {}

    std::optional<value_type> next() {
        if (current_ == end_) {
            return std::nullopt;
        }
        value_type value = *current_;
        ++current_;
        return value;
    }
};

// Async traversal of an iterator range whose elements are either values or
// copyable awaitables; each element is resolved before the next one is read.
template<typename T, typename Iterator, typename Sentinel>
stream<T> iter_stream(Iterator current, Sentinel end, std::shared_ptr<const void> storage) {
    for (; current != end; ++current) {
        std::iter_value_t<Iterator> element = *current;
        co_yield co_await detail::resolve(std::move(element));
    }
}

// Async traversal of a synchronous cursor.
template<typename T, typename Cursor>
stream<T> cursor_stream(Cursor source) {
    while (auto value = source.next()) {
        co_yield std::move(*value);
    }
}
}  // namespace lazyseq
