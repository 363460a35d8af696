#pragma once

#include <atomic>
#include <optional>
#include <utility>

#include "error.hpp"

namespace lazyseq {
// Write-once flag enforcing a single traversal. The first acquire() wins;
// every later one throws illegal_state_error.
class traversal_guard {
    std::atomic<bool> consumed_{false};

  public:
    traversal_guard() = default;
    traversal_guard(const traversal_guard&) = delete;
    traversal_guard& operator=(const traversal_guard&) = delete;

    void acquire() {
        if (consumed_.exchange(true, std::memory_order_acq_rel)) {
            throw illegal_state_error("attempted to traverse a constrained sequence more than once");
        }
    }

    bool consumed() const noexcept {
        return consumed_.load(std::memory_order_acquire);
    }
};

// A single cursor handed out at most once, used by both the sync and the
// async pipelines for one-shot sources and constrain_once().
template<typename Cursor>
class constrained_source {
    traversal_guard guard_;
    std::optional<Cursor> cursor_;

  public:
    explicit constrained_source(Cursor cursor) : cursor_(std::move(cursor)) {}

    Cursor open() {
        guard_.acquire();
        Cursor cursor = std::move(*cursor_);
        cursor_.reset();
        return cursor;
    }

    bool consumed() const noexcept {
        return guard_.consumed();
    }
};
}  // namespace lazyseq
