#pragma once

#include "config.hpp"

namespace lazyseq {
class waker;

namespace detail {
template<typename WakerType>
inline void waker_wake_function(void* data) noexcept {
    static_cast<WakerType*>(data)->wake();
}
}  // namespace detail

// Handle given to every poll call. An async stage that returns pending must
// arrange for wake() to be called once polling it again can make progress.
class waker {
    void (*wake_function_)(void*) = nullptr;
    void* data_ = nullptr;

  public:
    waker() = default;

    waker(void* data, void (*wake_function)(void*)) noexcept
        : wake_function_(wake_function), data_(data) {}

    template<typename WakerType>
    waker(WakerType* waker_ptr) noexcept
        : wake_function_(&detail::waker_wake_function<WakerType>),
          data_(static_cast<void*>(waker_ptr)) {}

    void wake() const noexcept {
        if (wake_function_) {
            wake_function_(data_);
        }
    }

    bool will_wake(const waker& other) const noexcept {
        return data_ == other.data_ && wake_function_ == other.wake_function_;
    }
};
}  // namespace lazyseq
