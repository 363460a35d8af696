#include <iostream>
#include <lazyseq/async_sequence.hpp>
#include <lazyseq/block_on.hpp>
#include <lazyseq/sequence.hpp>
#include <lazyseq/yield.hpp>
#include <optional>
#include <utility>

auto fibonacci() {
    return lazyseq::generate(std::pair{0, 1}, [](std::pair<int, int> p) {
               return std::pair{p.second, p.first + p.second};
           })
        .map([](std::pair<int, int> p) { return p.first; });
}

// Ends when the step returns nullopt.
auto collatz(int start) {
    return lazyseq::generate(start, [](int n) -> std::optional<int> {
        if (n == 1) {
            return std::nullopt;
        }
        return n % 2 == 0 ? n / 2 : 3 * n + 1;
    });
}

// Steps may suspend.
auto slow_powers(int base) {
    return lazyseq::async_sequence<int>::generate(1, [base](int x) -> lazyseq::task<std::optional<int>> {
        co_await lazyseq::yield();
        if (x > 1000) {
            co_return std::nullopt;
        }
        co_return x * base;
    });
}

int main() {
    std::cout << "fibonacci over 100: "
              << fibonacci().drop_while([](int x) { return x <= 100; }).take(10).join(" ")
              << std::endl;

    std::cout << "collatz(27) steps: " << collatz(27).count() << std::endl;
    std::cout << "collatz(27) peak: "
              << collatz(27).reduce([](int a, int b) { return a > b ? a : b; }).value_or(0)
              << std::endl;

    std::cout << "powers of 3: " << lazyseq::block_on(slow_powers(3).join(" ")) << std::endl;
    return 0;
}
