#include <iostream>
#include <lazyseq/async_sequence.hpp>
#include <lazyseq/block_on.hpp>
#include <lazyseq/sequence.hpp>
#include <stdexcept>

lazyseq::task<int> async_divide(int a, int b) {
    if (b == 0) {
        throw std::runtime_error("division by zero");
    }
    co_return a / b;
}

lazyseq::task<int> sum_of_quotients() {
    auto quotients = lazyseq::async_sequence<int>::of(5, 2, 0, 1).map([](int divisor) {
        return async_divide(10, divisor);
    });
    try {
        co_return co_await quotients.fold(0, [](int acc, int q) { return acc + q; });
    } catch (const std::runtime_error& e) {
        std::cout << "Caught exception at sum_of_quotients: " << e.what() << std::endl;
        throw;
    }
}

int main() {
    auto parsed = lazyseq::of("1", "2", "x").map([](const char* text) { return std::stoi(text); });
    try {
        std::cout << "Parsed: " << parsed.join() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cout << "Caught exception while parsing: " << e.what() << std::endl;
    }

    auto once = lazyseq::of(1, 2, 3).constrain_once();
    std::cout << "Count: " << once.count() << std::endl;
    try {
        once.count();
    } catch (const lazyseq::illegal_state_error& e) {
        std::cout << "Caught exception at second traversal: " << e.what() << std::endl;
    }

    try {
        auto result = lazyseq::block_on(sum_of_quotients());
        std::cout << "Result: " << result << std::endl;
    } catch (const std::runtime_error& e) {
        std::cout << "Caught exception at main: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
