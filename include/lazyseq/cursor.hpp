#pragma once

#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "probe.hpp"

namespace lazyseq {
// Type-erased synchronous pull cursor. One cursor is one traversal.
template<typename T>
class cursor {
    std::optional<T> (*next_)(void* impl) = nullptr;
    std::unique_ptr<void, void (*)(void*)> impl_ = {nullptr, nullptr};

  public:
    using value_type = T;

    template<typename Impl>
        requires(!std::is_same_v<std::remove_cvref_t<Impl>, cursor> &&
                 cursor_source<std::remove_cvref_t<Impl>>)
    cursor(Impl&& impl) {
        using impl_type = std::remove_cvref_t<Impl>;
        impl_ = {
            static_cast<void*>(new impl_type(std::forward<Impl>(impl))),
            [](void* impl_ptr) {
                delete static_cast<impl_type*>(impl_ptr);
            },
        };
        next_ = [](void* impl_ptr) -> std::optional<T> {
            return static_cast<impl_type*>(impl_ptr)->next();
        };
    }

    cursor(cursor&&) noexcept = default;
    cursor& operator=(cursor&&) noexcept = default;

    std::optional<T> next() {
        return next_(impl_.get());
    }
};
}  // namespace lazyseq
