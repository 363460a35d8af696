#pragma once

#include <optional>
#include <utility>

#include "async_cursor.hpp"
#include "probe.hpp"
#include "stream.hpp"

namespace lazyseq {
// Yields all of upstream, then all of the second sequence. The second side is
// opened only after upstream is exhausted.
template<cursor_source Cursor, typename Source>
class concat_cursor {
    using result_type = cursor_result_t<Cursor>;

    Cursor first_;
    Source second_source_;
    std::optional<Cursor> second_;

  public:
    concat_cursor(Cursor first, Source second)
        : first_(std::move(first)), second_source_(std::move(second)) {}

    std::optional<result_type> next() {
        if (!second_) {
            if (auto value = first_.next()) {
                return value;
            }
            second_.emplace(second_source_->open());
        }
        return second_->next();
    }
};

template<typename T, typename Source>
stream<T> concat_stream(async_cursor<T> first, Source second) {
    co_yield std::move(first);
    co_yield second->open();
}
}  // namespace lazyseq
