#pragma once

#include <optional>

#include "awaitable.hpp"
#include "stream_awaitable.hpp"
#include "waker.hpp"

namespace lazyseq {
// Awaitable pulling one value from an async cursor; std::nullopt at the end.
template<stream_awaitable StreamAwaitable>
class next_awaitable {
    StreamAwaitable& stream_;

    using result_type = std::optional<stream_awaitable_result_t<StreamAwaitable>>;
    using state_type = awaitable_state<result_type>;

  public:
    next_awaitable(StreamAwaitable& stream) : stream_(stream) {}

    state_type poll(const waker& w) {
        auto state = stream_.poll_next(w);
        if (state.is_done()) {
            return state_type::ready(std::nullopt);
        }
        if (state.is_ready()) {
            return state_type::ready(std::make_optional(state.take_result()));
        }
        return state_type::pending();
    }
};

template<stream_awaitable StreamAwaitable>
next_awaitable(StreamAwaitable&) -> next_awaitable<StreamAwaitable>;

template<stream_awaitable StreamAwaitable>
constexpr auto next(StreamAwaitable& stream) {
    return next_awaitable<StreamAwaitable>(stream);
}
}  // namespace lazyseq
