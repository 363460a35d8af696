#include <lazyseq/probe.hpp>
#include <lazyseq/stream.hpp>

#include <catch2/catch.hpp>
#include <cstddef>
#include <forward_list>
#include <iterator>
#include <list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {
struct countdown {
    int remaining = 3;

    std::optional<int> next() {
        if (remaining == 0) {
            return std::nullopt;
        }
        return remaining--;
    }
};

struct not_a_cursor {
    int next() {
        return 0;
    }
};

struct words {
    std::istringstream* in;

    std::istream_iterator<std::string> begin() const {
        return std::istream_iterator<std::string>(*in);
    }

    std::istream_iterator<std::string> end() const {
        return {};
    }
};

struct measured {
    std::ptrdiff_t length() const {
        return 7;
    }

    std::size_t size() const {
        return 3;
    }
};

struct unmeasured {};

lazyseq::stream<int> numbers() {
    co_yield 1;
}
}  // namespace

static_assert(lazyseq::iterable<std::vector<int>>);
static_assert(lazyseq::iterable<int[3]>);
static_assert(lazyseq::iterable<words>);
static_assert(!lazyseq::iterable<countdown>);

static_assert(lazyseq::multi_pass_iterable<std::vector<int>>);
static_assert(lazyseq::multi_pass_iterable<std::forward_list<int>>);
static_assert(!lazyseq::multi_pass_iterable<words>);

static_assert(lazyseq::cursor_source<countdown>);
static_assert(!lazyseq::cursor_source<not_a_cursor>);
static_assert(!lazyseq::cursor_source<std::vector<int>>);
static_assert(std::is_same_v<lazyseq::cursor_result_t<countdown>, int>);

static_assert(lazyseq::async_cursor_source<lazyseq::stream<int>>);
static_assert(!lazyseq::async_cursor_source<countdown>);

static_assert(lazyseq::async_iterable<decltype(&numbers)>);
static_assert(!lazyseq::async_iterable<lazyseq::stream<int>>);

TEST_CASE("probe_size", "[probe]") {
    SECTION("length() wins over size()") {
        REQUIRE(lazyseq::probe_size(measured{}) == 7);
    }

    SECTION("size()") {
        REQUIRE(lazyseq::probe_size(std::vector<int>{1, 2, 3, 4}) == 4);
        REQUIRE(lazyseq::probe_size(std::list<int>{1}) == 1);
        REQUIRE(lazyseq::probe_size(std::string("abc")) == 3);
    }

    SECTION("built-in arrays") {
        static constexpr int values[5] = {1, 2, 3, 4, 5};
        static_assert(lazyseq::probe_size(values) == 5);
        REQUIRE(lazyseq::probe_size(values) == 5);
    }

    SECTION("unknown") {
        std::istringstream in("a b");
        REQUIRE(lazyseq::probe_size(unmeasured{}) == lazyseq::unknown_size);
        REQUIRE(lazyseq::probe_size(std::forward_list<int>{1, 2}) == lazyseq::unknown_size);
        REQUIRE(lazyseq::probe_size(words{&in}) < 0);
    }
}
