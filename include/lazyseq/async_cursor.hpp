#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "stream_awaitable.hpp"
#include "waker.hpp"

namespace lazyseq {
// Type-erased async pull cursor. One cursor is one traversal.
template<typename T>
class async_cursor {
    stream_awaitable_state<T> (*poll_next_)(void* impl, const waker& w) = nullptr;
    std::unique_ptr<void, void (*)(void*)> impl_ = {nullptr, nullptr};

  public:
    using value_type = T;

    template<typename StreamAwaitable>
        requires(!std::is_same_v<std::remove_cvref_t<StreamAwaitable>, async_cursor> &&
                 stream_awaitable<std::remove_cvref_t<StreamAwaitable>>)
    async_cursor(StreamAwaitable&& stream) {
        using stream_type = std::remove_cvref_t<StreamAwaitable>;
        static_assert(
            std::is_same_v<stream_awaitable_result_t<stream_type>, T>,
            "async cursor value type mismatch"
        );
        impl_ = {
            static_cast<void*>(new stream_type(std::forward<StreamAwaitable>(stream))),
            [](void* stream_ptr) {
                delete static_cast<stream_type*>(stream_ptr);
            },
        };
        poll_next_ = [](void* stream_ptr, const waker& w) {
            return static_cast<stream_type*>(stream_ptr)->poll_next(w);
        };
    }

    async_cursor(async_cursor&&) noexcept = default;
    async_cursor& operator=(async_cursor&&) noexcept = default;

    stream_awaitable_state<T> poll_next(const waker& w) {
        return poll_next_(impl_.get(), w);
    }
};
}  // namespace lazyseq
