/*
 * ASIO interop
 *
 * - from_asio: an asio coroutine becomes an awaitable that async_sequence
 *   callbacks can return.
 * - to_asio: a lazyseq task, such as a terminal operation, becomes an asio
 *   async operation usable with any completion token.
 */

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <chrono>
#include <iostream>
#include <lazyseq/asio.hpp>
#include <lazyseq/async_sequence.hpp>
#include <lazyseq/block_on.hpp>
#include <string>
#include <thread>
#include <vector>

int main() {
    asio::io_context ctx;
    auto work = asio::make_work_guard(ctx);
    std::thread io_thread([&ctx] {
        ctx.run();
    });

    // Each value waits on an asio timer before being passed on.
    auto slow_squares = lazyseq::async_sequence<int>::of(1, 2, 3, 4).map([&ctx](int x) {
        return lazyseq::from_asio<int>(ctx, [x]() -> asio::awaitable<int> {
            asio::steady_timer timer(co_await asio::this_coro::executor, std::chrono::milliseconds(10 * x));
            co_await timer.async_wait(asio::use_awaitable);
            co_return x * x;
        });
    });
    std::cout << "squares: " << lazyseq::block_on(slow_squares.join()) << std::endl;

    // The other direction: drive a terminal operation from asio.
    auto words = lazyseq::async_sequence<std::string>::of("poll", "based", "sequences");
    auto lengths = asio::co_spawn(
        ctx,
        [words]() -> asio::awaitable<std::vector<std::size_t>> {
            auto executor = co_await asio::this_coro::executor;
            auto sizes = words.map([](const std::string& w) { return w.size(); });
            co_return co_await lazyseq::to_asio(executor, sizes.to_vector(), asio::use_awaitable);
        },
        asio::use_future
    );
    for (auto length : lengths.get()) {
        std::cout << length << " ";
    }
    std::cout << std::endl;

    auto total = lazyseq::to_asio(
        ctx.get_executor(),
        slow_squares.fold(0, [](int acc, int x) { return acc + x; }),
        asio::use_future
    );
    std::cout << "total: " << total.get() << std::endl;

    work.reset();
    io_thread.join();
    return 0;
}
