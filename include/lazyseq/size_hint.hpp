#pragma once

#include <cstddef>

namespace lazyseq {
// Size hints are exact element counts when non-negative. Anything negative
// means the count is unknown until the sequence is traversed.
inline constexpr std::ptrdiff_t unknown_size = -1;

namespace detail {
constexpr bool is_known_size(std::ptrdiff_t size) noexcept {
    return size >= 0;
}

constexpr std::ptrdiff_t drop_size(std::ptrdiff_t source, std::size_t n) noexcept {
    if (!is_known_size(source)) {
        return unknown_size;
    }
    if (n >= static_cast<std::size_t>(source)) {
        return 0;
    }
    return source - static_cast<std::ptrdiff_t>(n);
}

constexpr std::ptrdiff_t take_size(std::ptrdiff_t source, std::size_t n) noexcept {
    if (!is_known_size(source)) {
        return unknown_size;
    }
    if (n >= static_cast<std::size_t>(source)) {
        return source;
    }
    return static_cast<std::ptrdiff_t>(n);
}

constexpr std::ptrdiff_t concat_size(std::ptrdiff_t first, std::ptrdiff_t second) noexcept {
    if (!is_known_size(first) || !is_known_size(second)) {
        return unknown_size;
    }
    return first + second;
}
}  // namespace detail
}  // namespace lazyseq
