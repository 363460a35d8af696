#include <lazyseq/lazyseq.hpp>

#include <catch2/catch.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static_assert(LAZYSEQ_VERSION == 502);

namespace {
lazyseq::task<int> add(int a, int b) {
    co_await lazyseq::yield();
    co_return a + b;
}

lazyseq::task<int> add_all() {
    int first = co_await add(1, 2);
    int second = co_await lazyseq::ready(4);
    co_return first + second;
}

lazyseq::task<> fail() {
    co_await lazyseq::yield(2);
    throw std::runtime_error("task failed");
}

lazyseq::stream<int> range(int from, int to) {
    for (int i = from; i < to; ++i) {
        co_await lazyseq::yield();
        co_yield i;
    }
}

lazyseq::stream<int> joined() {
    co_yield 0;
    co_yield range(1, 3);
    co_yield range(3, 5);
    co_yield 5;
}

lazyseq::stream<int> failing_after(int count) {
    for (int i = 0; i < count; ++i) {
        co_yield i;
    }
    throw std::runtime_error("stream failed");
}

lazyseq::task<std::vector<int>> collect(lazyseq::stream<int> values) {
    std::vector<int> result;
    while (auto value = co_await lazyseq::next(values)) {
        result.push_back(*value);
    }
    co_return result;
}

// Completed from another thread; wakes whoever polled it last.
class thread_result {
    struct shared {
        std::mutex mutex;
        std::optional<int> value;
        lazyseq::waker waker;
    };

    std::shared_ptr<shared> state_ = std::make_shared<shared>();

  public:
    void set(int value) {
        std::lock_guard lock(state_->mutex);
        state_->value = value;
        state_->waker.wake();
    }

    lazyseq::awaitable_state<int> poll(const lazyseq::waker& w) {
        std::lock_guard lock(state_->mutex);
        if (state_->value) {
            return lazyseq::awaitable_state<int>::ready(*state_->value);
        }
        state_->waker = w;
        return lazyseq::awaitable_state<int>::pending();
    }
};
}  // namespace

TEST_CASE("task", "[task]") {
    REQUIRE(lazyseq::block_on(add(2, 3)) == 5);
    REQUIRE(lazyseq::block_on(add_all()) == 7);
    REQUIRE(lazyseq::block_on(lazyseq::ready(std::string("x"))) == "x");
}

TEST_CASE("task does not start before it is polled", "[task]") {
    bool started = false;
    auto make = [&started]() -> lazyseq::task<> {
        started = true;
        co_return;
    };
    auto pending = make();
    REQUIRE_FALSE(started);
    lazyseq::block_on(std::move(pending));
    REQUIRE(started);
}

TEST_CASE("task exceptions surface from block_on", "[task]") {
    REQUIRE_THROWS_WITH(lazyseq::block_on(fail()), "task failed");
}

TEST_CASE("stream", "[task][stream]") {
    REQUIRE(lazyseq::block_on(collect(range(0, 4))) == (std::vector<int>{0, 1, 2, 3}));
    REQUIRE(lazyseq::block_on(collect(range(4, 4))).empty());

    SECTION("yielding a stream forwards its values") {
        REQUIRE(lazyseq::block_on(collect(joined())) == (std::vector<int>{0, 1, 2, 3, 4, 5}));
    }

    SECTION("values come before the exception that ends the stream") {
        auto values = failing_after(2);
        REQUIRE(lazyseq::block_on(lazyseq::next(values)) == 0);
        REQUIRE(lazyseq::block_on(lazyseq::next(values)) == 1);
        REQUIRE_THROWS_WITH(lazyseq::block_on(lazyseq::next(values)), "stream failed");
    }

    SECTION("next reports the end with nullopt") {
        auto values = range(0, 1);
        REQUIRE(lazyseq::block_on(lazyseq::next(values)) == 0);
        REQUIRE_FALSE(lazyseq::block_on(lazyseq::next(values)).has_value());
    }
}

TEST_CASE("yield counts pending polls", "[task]") {
    auto awaitable = lazyseq::yield(2);
    int wakes = 0;
    auto count_wake = [](void* data) {
        ++*static_cast<int*>(data);
    };
    lazyseq::waker w(&wakes, count_wake);

    REQUIRE_FALSE(awaitable.poll(w).is_ready());
    REQUIRE_FALSE(awaitable.poll(w).is_ready());
    REQUIRE(awaitable.poll(w).is_ready());
    REQUIRE(wakes == 2);
}

TEST_CASE("block_on sleeps until woken from another thread", "[task]") {
    thread_result result;
    std::thread producer([result]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        result.set(42);
    });

    auto doubled = [](thread_result pending) -> lazyseq::task<int> {
        int value = co_await pending;
        co_return value * 2;
    };
    REQUIRE(lazyseq::block_on(doubled(result)) == 84);
    producer.join();
}

TEST_CASE("waker identity", "[task]") {
    int a = 0;
    int b = 0;
    auto noop = [](void*) {};
    lazyseq::waker first(&a, noop);
    lazyseq::waker same(&a, noop);
    lazyseq::waker other(&b, noop);

    REQUIRE(first.will_wake(same));
    REQUIRE_FALSE(first.will_wake(other));
    REQUIRE(lazyseq::waker().will_wake(lazyseq::waker()));
}

TEST_CASE("node kinds have names", "[task]") {
    REQUIRE(lazyseq::to_string(lazyseq::node_kind::constrained) == "constrained");
    REQUIRE(lazyseq::to_string(lazyseq::of(1).map([](int v) { return v; }).kind()) == "map");
    REQUIRE(lazyseq::to_string(lazyseq::of(1).concat(lazyseq::of(2)).kind()) == "concat");
}
