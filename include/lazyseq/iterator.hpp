#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>

#include "cursor.hpp"

namespace lazyseq {
// Input iterator over one cursor, so a sequence can drive a range-for loop.
// Copies share the traversal; a default-constructed iterator is the end.
template<typename T>
class cursor_iterator {
    struct traversal {
        cursor<T> source;
        std::optional<T> current;
    };

    std::shared_ptr<traversal> traversal_;

    bool at_end() const {
        return !traversal_ || !traversal_->current.has_value();
    }

  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T*;
    using reference = const T&;

    cursor_iterator() = default;

    explicit cursor_iterator(cursor<T> source)
        : traversal_(std::make_shared<traversal>(traversal{std::move(source), std::nullopt})) {
        traversal_->current = traversal_->source.next();
    }

    reference operator*() const {
        return *traversal_->current;
    }

    pointer operator->() const {
        return &*traversal_->current;
    }

    cursor_iterator& operator++() {
        traversal_->current = traversal_->source.next();
        return *this;
    }

    cursor_iterator operator++(int) {
        cursor_iterator tmp = *this;
        ++(*this);
        return tmp;
    }

    bool operator==(const cursor_iterator& other) const {
        return at_end() == other.at_end();
    }
};
}  // namespace lazyseq
