#pragma once

#include <condition_variable>
#include <mutex>
#include <type_traits>

#include "awaitable.hpp"
#include "waker.hpp"

namespace lazyseq {
// Drives an awaitable to completion on the calling thread, parking between
// polls until something wakes it. Exceptions raised while polling propagate.
template<typename Awaitable>
    requires awaitable<std::remove_cvref_t<Awaitable>>
auto block_on(Awaitable&& awaitable) -> awaitable_result_t<std::remove_cvref_t<Awaitable>> {
    struct waker_data_t {
        std::mutex mutex;
        std::condition_variable cv;
        bool notified = false;

        void wake() noexcept {
            {
                std::lock_guard lock(mutex);
                notified = true;
            }
            cv.notify_all();
        }
    };

    waker_data_t wd;
    while (true) {
        std::unique_lock lock(wd.mutex);
        wd.notified = false;
        lock.unlock();

        auto result = awaitable.poll(waker(&wd));
        if (result.is_ready()) {
            return result.take_result();
        }

        lock.lock();
        wd.cv.wait(lock, [&] {
            return wd.notified;
        });
    }
}

}  // namespace lazyseq
