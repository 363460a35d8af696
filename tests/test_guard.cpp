#include <lazyseq/async_sequence.hpp>
#include <lazyseq/block_on.hpp>
#include <lazyseq/guard.hpp>
#include <lazyseq/sequence.hpp>

#include <atomic>
#include <catch2/catch.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace {
struct counter {
    int current = 0;
    int limit = 3;

    std::optional<int> next() {
        if (current >= limit) {
            return std::nullopt;
        }
        return current++;
    }
};
}  // namespace

TEST_CASE("traversal_guard", "[guard]") {
    lazyseq::traversal_guard guard;
    REQUIRE_FALSE(guard.consumed());

    guard.acquire();
    REQUIRE(guard.consumed());

    REQUIRE_THROWS_AS(guard.acquire(), lazyseq::illegal_state_error);
    REQUIRE_THROWS_AS(guard.acquire(), std::logic_error);
    REQUIRE(guard.consumed());
}

TEST_CASE("traversal_guard admits exactly one of many racing threads", "[guard]") {
    lazyseq::traversal_guard guard;
    std::atomic<int> winners{0};
    std::atomic<int> losers{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            try {
                guard.acquire();
                ++winners;
            } catch (const lazyseq::illegal_state_error&) {
                ++losers;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(winners == 1);
    REQUIRE(losers == 7);
}

TEST_CASE("constrained_source", "[guard]") {
    lazyseq::constrained_source<counter> source(counter{});
    REQUIRE_FALSE(source.consumed());

    auto cursor = source.open();
    REQUIRE(source.consumed());
    REQUIRE(cursor.next() == 0);
    REQUIRE(cursor.next() == 1);

    REQUIRE_THROWS_WITH(source.open(), Catch::Contains("more than once"));
}

TEST_CASE("constrained sequences", "[guard][sequence]") {
    SECTION("derived pipelines share the guard") {
        auto once = lazyseq::from(counter{}).map([](int value) { return value * 2; });
        auto evens = once.filter([](int value) { return value % 4 == 0; });
        REQUIRE(evens.to_vector() == (std::vector<int>{0, 4}));
        REQUIRE_THROWS_AS(once.count(), lazyseq::illegal_state_error);
    }

    SECTION("building a pipeline does not consume it") {
        auto once = lazyseq::of(1, 2, 3).constrain_once();
        auto doubled = once.map([](int value) { return value * 2; });
        auto tail = doubled.drop(1);
        REQUIRE(tail.to_vector() == (std::vector<int>{4, 6}));
        REQUIRE_THROWS_AS(doubled.first(), lazyseq::illegal_state_error);
    }

    SECTION("iteration counts as a traversal") {
        auto once = lazyseq::of(1, 2).constrain_once();
        int sum = 0;
        for (int value : once) {
            sum += value;
        }
        REQUIRE(sum == 3);
        REQUIRE_THROWS_AS(once.begin(), lazyseq::illegal_state_error);
    }

    SECTION("size and to_string never traverse") {
        auto once = lazyseq::of(1, 2).constrain_once();
        REQUIRE(once.size() == 2);
        REQUIRE(once.to_string() == "Sequence (2)");
        REQUIRE(once.count() == 2u);
    }
}

TEST_CASE("constrained async sequences", "[guard][async_sequence]") {
    auto once = lazyseq::async_sequence<int>::from(lazyseq::from(counter{}));
    REQUIRE(lazyseq::block_on(once.to_vector()) == (std::vector<int>{0, 1, 2}));
    REQUIRE_THROWS_AS(lazyseq::block_on(once.count()), lazyseq::illegal_state_error);

    auto async_once = lazyseq::async_sequence<int>::of(5, 6).constrain_once();
    REQUIRE(async_once.kind() == lazyseq::node_kind::constrained);
    REQUIRE(lazyseq::block_on(async_once.map([](int value) { return value + 1; }).to_vector()) ==
            (std::vector<int>{6, 7}));
    REQUIRE_THROWS_AS(lazyseq::block_on(async_once.is_empty()), lazyseq::illegal_state_error);
}
