#pragma once

#include <cstdint>

#include "awaitable.hpp"
#include "waker.hpp"

namespace lazyseq {
// Reports pending `count` times before completing, waking the poller each time.
class yield_awaitable {
    std::uint32_t remaining_{0};

  public:
    yield_awaitable() : yield_awaitable(1) {}

    explicit yield_awaitable(std::uint32_t count) : remaining_(count) {}

    awaitable_state<> poll(const waker& w) {
        if (remaining_ == 0) {
            return awaitable_state<>::ready();
        }
        remaining_--;
        w.wake();
        return awaitable_state<>::pending();
    }
};

inline auto yield(std::uint32_t count = 1) {
    return yield_awaitable(count);
}
}  // namespace lazyseq
