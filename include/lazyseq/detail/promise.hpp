#pragma once

#include <coroutine>
#include <cstdio>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include "../awaitable.hpp"
#include "../stream_awaitable.hpp"
#include "../waker.hpp"

namespace lazyseq::detail {
struct promise_base {
    std::exception_ptr exception{nullptr};

    // The awaitable the coroutine is currently suspended on, polled through
    // current_awaitable_poll until it reports completion.
    void* current_awaitable = nullptr;
    bool (*current_awaitable_poll)(void*, const waker&) = nullptr;

    // Rethrows and clears an exception captured while the coroutine ran.
    void rethrow_if_exception() {
        if (exception) {
            std::rethrow_exception(std::exchange(exception, nullptr));
        }
    }
};

template<typename T>
class task_storage : public promise_base {
    std::optional<T> result;

  public:
    void return_value(T value) {
        result = std::move(value);
    }

    T take_result() {
        auto value = std::move(*result);
        result = std::nullopt;
        return value;
    }
};

template<>
class task_storage<void> : public promise_base {
  public:
    void return_void() {}
};

template<typename T>
class stream_storage : public promise_base {
    std::optional<T> result;

  public:
    void return_void() {}

    // co_yield of another async cursor forwards all of its values.
    template<typename StreamAwaitable>
        requires stream_awaitable<std::remove_cvref_t<StreamAwaitable>>
    auto yield_value(StreamAwaitable&& inner) {
        struct yield_from_awaiter {
            stream_storage& promise;
            std::remove_cvref_t<StreamAwaitable> inner;

            yield_from_awaiter(stream_storage& promise, StreamAwaitable&& inner)
                : promise(promise), inner(std::forward<StreamAwaitable>(inner)) {}

            constexpr bool await_ready() {
                return false;
            }

            void await_suspend(std::coroutine_handle<>) {
                promise.exception = nullptr;
                promise.current_awaitable = this;
                promise.current_awaitable_poll = [](void* awaitable, const waker& w) {
                    auto self = static_cast<yield_from_awaiter*>(awaitable);
                    auto state = self->inner.poll_next(w);
                    if (state.is_done()) {
                        return true;
                    }
                    if (state.is_ready()) {
                        self->promise.yield_value(state.take_result());
                    }

                    return false;
                };
            }

            void await_resume() {
                promise.current_awaitable = nullptr;
                promise.current_awaitable_poll = nullptr;
                promise.rethrow_if_exception();
            }
        };

        return yield_from_awaiter(*this, std::forward<StreamAwaitable>(inner));
    }

    std::suspend_always yield_value(T value) {
        result = std::move(value);
        return {};
    }

    T take_result() {
        auto value = std::move(*result);
        result = std::nullopt;
        return value;
    }

    bool has_value() const {
        return result.has_value();
    }
};

template<typename Promise, typename Awaitable>
auto transform_awaitable(Promise& promise, Awaitable&& inner) {
    using awaitable_type = std::remove_cvref_t<Awaitable>;
    using result_type = awaitable_result_t<awaitable_type>;

    struct transformed_awaiter : task_storage<result_type> {
        Promise& promise;
        awaitable_type inner;

        transformed_awaiter(Promise& promise, Awaitable&& inner)
            : promise(promise), inner(std::forward<Awaitable>(inner)) {}

        constexpr bool await_ready() {
            return false;
        }

        void await_suspend(std::coroutine_handle<>) {
            promise.exception = nullptr;
            promise.current_awaitable = this;
            promise.current_awaitable_poll = [](void* awaitable, const waker& w) {
                auto self = static_cast<transformed_awaiter*>(awaitable);
                auto state = self->inner.poll(w);
                if (!state.is_ready()) {
                    return false;
                }
                if constexpr (!std::is_void_v<result_type>) {
                    self->return_value(state.take_result());
                }
                return true;
            };
        }

        result_type await_resume() {
            promise.current_awaitable = nullptr;
            promise.current_awaitable_poll = nullptr;
            promise.rethrow_if_exception();
            if constexpr (!std::is_void_v<result_type>) {
                return this->take_result();
            }
        }
    };

    return transformed_awaiter(promise, std::forward<Awaitable>(inner));
}

template<typename Coroutine, typename Storage>
struct promise_type : public Storage {
    promise_type() = default;
    promise_type(const promise_type&) = delete;
    promise_type& operator=(const promise_type&) = delete;

    ~promise_type() {
#ifndef NDEBUG
        if (this->exception) {
            std::fprintf(stderr, "lazyseq: coroutine destroyed with an unobserved exception\n");
        }
#endif
    }

    // Polls the awaitable the coroutine is suspended on. True means the
    // coroutine can be resumed.
    bool poll_ready(const waker& w) {
        if (this->current_awaitable_poll) {
            return this->current_awaitable_poll(this->current_awaitable, w);
        }
        return true;
    }

    Coroutine get_return_object() {
        return Coroutine(std::coroutine_handle<promise_type>::from_promise(*this));
    }

    std::suspend_always initial_suspend() {
        return {};
    }

    std::suspend_always final_suspend() noexcept {
        return {};
    }

    void unhandled_exception() {
        this->exception = std::current_exception();
    }

    template<typename Awaitable>
        requires awaitable<std::remove_cvref_t<Awaitable>>
    auto await_transform(Awaitable&& inner) {
        return transform_awaitable<promise_type, Awaitable>(*this, std::forward<Awaitable>(inner));
    }
};

}  // namespace lazyseq::detail
