#pragma once

#include <coroutine>
#include <exception>
#include <type_traits>
#include <utility>

#include "awaitable.hpp"
#include "detail/promise.hpp"
#include "waker.hpp"

namespace lazyseq {
// Lazily started coroutine producing a single result. Every terminal operation
// of an async_sequence returns one; drive it with co_await or block_on.
template<typename T = void>
class task {
    void destroy() {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

  public:
    using promise_type = detail::promise_type<task, detail::task_storage<T>>;

    explicit task(std::coroutine_handle<promise_type> h) : handle_(h) {}

    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    ~task() {
        destroy();
    }

    awaitable_state<T> poll(const waker& w) {
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

        if (is_ready()) {
            promise.rethrow_if_exception();
            if constexpr (std::is_void_v<T>) {
                return awaitable_state<T>::ready();
            } else {
                return awaitable_state<T>::ready(promise.take_result());
            }
        }

        if (resumed) {
            w.wake();
        }

        return awaitable_state<T>::pending();
    }

  private:
    std::coroutine_handle<promise_type> handle_;

    bool is_ready() const {
        return handle_.done();
    }
};

}  // namespace lazyseq
