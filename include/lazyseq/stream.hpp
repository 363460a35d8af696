#pragma once

#include <coroutine>
#include <exception>
#include <utility>

#include "detail/promise.hpp"
#include "stream_awaitable.hpp"
#include "waker.hpp"

namespace lazyseq {
// Coroutine async cursor: values come from co_yield, upstream values are
// pulled with co_await next(...), and co_yield of another async cursor
// forwards all of its values. Every async pipeline stage is one of these.
template<typename T>
class stream {
    void destroy() {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

  public:
    using promise_type = detail::promise_type<stream, detail::stream_storage<T>>;

    explicit stream(std::coroutine_handle<promise_type> h) : handle_(h) {}

    stream(stream&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    stream& operator=(stream&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    stream(const stream&) = delete;
    stream& operator=(const stream&) = delete;

    ~stream() {
        destroy();
    }

    stream_awaitable_state<T> poll_next(const waker& w) {
        auto& promise = handle_.promise();
        bool resumed = false;
        if (!is_ready()) {
            try {
                resumed = promise.poll_ready(w);
            } catch (...) {
                promise.exception = std::current_exception();
                resumed = true;
            }
            if (resumed) {
                handle_.resume();
            }
        }

        if (promise.has_value()) {
            return stream_awaitable_state<T>::ready(promise.take_result());
        }

        if (is_ready()) {
            promise.rethrow_if_exception();
            return stream_awaitable_state<T>::done();
        }

        if (resumed) {
            w.wake();
        }

        return stream_awaitable_state<T>::pending();
    }

  private:
    std::coroutine_handle<promise_type> handle_;

    bool is_ready() const {
        return handle_.done();
    }
};

}  // namespace lazyseq
