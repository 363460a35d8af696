/*
 * Asynchronous sequences
 *
 * Callbacks may return awaitables. The pipeline waits for each result
 * before passing the value on, so ordering matches the synchronous
 * variant even when later values resolve first.
 */

#include <chrono>
#include <iostream>
#include <lazyseq/async_sequence.hpp>
#include <lazyseq/block_on.hpp>
#include <lazyseq/yield.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Completes on a worker thread after a delay.
class delayed_lookup {
    struct shared {
        std::mutex mutex;
        std::optional<std::string> value;
        lazyseq::waker waker;
    };

    std::shared_ptr<shared> state_ = std::make_shared<shared>();
    int id_;
    bool started_ = false;

  public:
    explicit delayed_lookup(int id) : id_(id) {}

    lazyseq::awaitable_state<std::string> poll(const lazyseq::waker& w) {
        if (!started_) {
            started_ = true;
            std::thread([state = state_, id = id_] {
                std::this_thread::sleep_for(std::chrono::milliseconds(50 - id * 10));
                std::lock_guard lock(state->mutex);
                state->value = "user-" + std::to_string(id);
                state->waker.wake();
            }).detach();
        }
        std::lock_guard lock(state_->mutex);
        if (state_->value) {
            return lazyseq::awaitable_state<std::string>::ready(std::move(*state_->value));
        }
        state_->waker = w;
        return lazyseq::awaitable_state<std::string>::pending();
    }
};

lazyseq::stream<int> ids() {
    for (int id = 1; id <= 4; ++id) {
        co_await lazyseq::yield();
        co_yield id;
    }
}

lazyseq::task<bool> is_allowed(std::string name) {
    co_await lazyseq::yield(3);
    co_return name != "user-3";
}

int main() {
    auto users = lazyseq::async_sequence<int>::from([] { return ids(); })
                     .map([](int id) { return delayed_lookup(id); })
                     .filter([](const std::string& name) { return is_allowed(name); });

    std::cout << users << std::endl;
    std::cout << lazyseq::block_on(users.join()) << std::endl;

    auto total = lazyseq::block_on(
        lazyseq::async_sequence<int>::of(1, 2, 3).fold(0, [](int acc, int x) -> lazyseq::task<int> {
            co_await lazyseq::yield();
            co_return acc + x;
        })
    );
    std::cout << "total: " << total << std::endl;

    auto once = lazyseq::async_sequence<int>::from(ids());
    std::cout << "count: " << lazyseq::block_on(once.count()) << std::endl;
    try {
        lazyseq::block_on(once.count());
    } catch (const lazyseq::illegal_state_error& e) {
        std::cout << "second traversal: " << e.what() << std::endl;
    }
    return 0;
}
