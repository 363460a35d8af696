#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>

#include "awaitable.hpp"
#include "waker.hpp"

// Interop with standalone asio. Lets async_sequence callbacks await asio
// operations, and lets asio coroutines await lazyseq tasks such as the
// terminal operations of an async_sequence.
namespace lazyseq {
namespace detail {
template<typename T>
struct completion_signature {
    using type = void(std::exception_ptr, T);
};

template<>
struct completion_signature<void> {
    using type = void(std::exception_ptr);
};

// Completion of an operation spawned on an asio executor, observed by polling.
template<typename T>
class asio_completion {
    using storage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::mutex mutex_;
    bool done_ = false;
    waker waker_;
    std::variant<std::monostate, storage, std::exception_ptr> result_;

    void finish() {
        done_ = true;
        waker_.wake();
    }

  public:
    void set_value(storage value) {
        std::lock_guard lock(mutex_);
        result_.template emplace<storage>(std::move(value));
        finish();
    }

    void set_exception(std::exception_ptr ex) {
        std::lock_guard lock(mutex_);
        result_.template emplace<std::exception_ptr>(std::move(ex));
        finish();
    }

    awaitable_state<T> poll(const waker& w) {
        std::lock_guard lock(mutex_);
        if (!done_) {
            waker_ = w;
            return awaitable_state<T>::pending();
        }
        if (auto ex = std::get_if<std::exception_ptr>(&result_)) {
            std::rethrow_exception(*ex);
        }
        if constexpr (std::is_void_v<T>) {
            return awaitable_state<T>::ready();
        } else {
            return awaitable_state<T>::ready(std::move(std::get<storage>(result_)));
        }
    }
};
}  // namespace detail

// Awaitable running an asio coroutine on an executor. The operation is spawned
// on the first poll and runs on the executor's threads.
template<typename T>
class asio_awaitable {
    using completion_type = detail::asio_completion<T>;

    std::shared_ptr<completion_type> completion_;
    asio::any_io_executor executor_;
    std::function<asio::awaitable<T>()> factory_;
    bool started_ = false;

    void start() {
        auto completion = completion_;
        if constexpr (std::is_void_v<T>) {
            asio::co_spawn(executor_, std::move(factory_), [completion](std::exception_ptr ex) {
                if (ex) {
                    completion->set_exception(ex);
                } else {
                    completion->set_value({});
                }
            });
        } else {
            asio::co_spawn(
                executor_,
                std::move(factory_),
                [completion](std::exception_ptr ex, T value) {
                    if (ex) {
                        completion->set_exception(ex);
                    } else {
                        completion->set_value(std::move(value));
                    }
                }
            );
        }
    }

  public:
    asio_awaitable(asio::any_io_executor executor, std::function<asio::awaitable<T>()> factory)
        : completion_(std::make_shared<completion_type>()),
          executor_(std::move(executor)),
          factory_(std::move(factory)) {}

    asio_awaitable(asio_awaitable&&) = default;
    asio_awaitable& operator=(asio_awaitable&&) = default;

    awaitable_state<T> poll(const waker& w) {
        if (!started_) {
            started_ = true;
            start();
        }
        return completion_->poll(w);
    }
};

template<typename T>
auto from_asio(asio::any_io_executor executor, std::function<asio::awaitable<T>()> factory) {
    return asio_awaitable<T>(std::move(executor), std::move(factory));
}

template<typename T>
auto from_asio(asio::io_context& ctx, std::function<asio::awaitable<T>()> factory) {
    return asio_awaitable<T>(ctx.get_executor(), std::move(factory));
}

// Drives a lazyseq awaitable from asio: it is polled on the executor every
// time it wakes, and the completion token receives its result.
//
//   auto words = co_await lazyseq::to_asio(executor, seq.to_vector(), asio::use_awaitable);
template<awaitable Awaitable, typename CompletionToken>
auto to_asio(asio::any_io_executor executor, Awaitable&& inner, CompletionToken&& token) {
    using awaitable_type = std::decay_t<Awaitable>;
    using result_type = awaitable_result_t<awaitable_type>;
    using signature = typename detail::completion_signature<result_type>::type;

    return asio::async_initiate<CompletionToken, signature>(
        [executor](auto handler, awaitable_type pending) mutable {
            using handler_type = decltype(handler);

            // Owns itself until the handler has been invoked.
            struct operation {
                awaitable_type pending;
                asio::any_io_executor executor;
                handler_type handler;
                std::atomic<bool> wake_pending{true};
                bool polling{false};

                operation(
                    awaitable_type pending, asio::any_io_executor executor, handler_type handler
                )
                    : pending(std::move(pending)),
                      executor(std::move(executor)),
                      handler(std::move(handler)) {}

                void poll() {
                    while (wake_pending.exchange(false, std::memory_order_acq_rel)) {
                        polling = true;
                        try {
                            auto state = pending.poll(waker(this));
                            polling = false;
                            if (state.is_ready()) {
                                complete(std::move(state));
                                return;
                            }
                        } catch (...) {
                            polling = false;
                            fail(std::current_exception());
                            return;
                        }
                    }
                }

                void wake() {
                    wake_pending.store(true, std::memory_order_release);
                    if (polling) {
                        return;
                    }
                    asio::post(executor, [this] {
                        poll();
                    });
                }

                void complete(awaitable_state<result_type> state) {
                    if constexpr (std::is_void_v<result_type>) {
                        std::invoke(std::move(handler), std::exception_ptr{});
                    } else {
                        std::invoke(std::move(handler), std::exception_ptr{}, state.take_result());
                    }
                    delete this;
                }

                void fail(std::exception_ptr ex) {
                    if constexpr (std::is_void_v<result_type>) {
                        std::invoke(std::move(handler), ex);
                    } else {
                        std::invoke(std::move(handler), ex, result_type{});
                    }
                    delete this;
                }
            };

            auto* op = new operation(std::move(pending), executor, std::move(handler));
            op->poll();
        },
        std::forward<CompletionToken>(token),
        std::forward<Awaitable>(inner)
    );
}
}  // namespace lazyseq
