#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

namespace lazyseq {
// Operation that produced a pipeline stage.
enum class node_kind {
    source,
    constrained,
    generate,
    map,
    filter,
    take,
    drop,
    take_while,
    drop_while,
    flatten,
    flat_map,
    concat,
};

constexpr std::string_view to_string(node_kind kind) noexcept {
    switch (kind) {
        case node_kind::source:
            return "source";
        case node_kind::constrained:
            return "constrained";
        case node_kind::generate:
            return "generate";
        case node_kind::map:
            return "map";
        case node_kind::filter:
            return "filter";
        case node_kind::take:
            return "take";
        case node_kind::drop:
            return "drop";
        case node_kind::take_while:
            return "take_while";
        case node_kind::drop_while:
            return "drop_while";
        case node_kind::flatten:
            return "flatten";
        case node_kind::flat_map:
            return "flat_map";
        case node_kind::concat:
            return "concat";
    }
    return "unknown";
}

namespace detail {
// One pipeline stage: what produced it, how many values it will yield, and
// how to open a fresh cursor over them. Immutable once built; stages share
// their upstream through shared_ptr.
template<typename Cursor>
class node {
  public:
    using cursor_type = Cursor;
    using opener_type = std::function<Cursor()>;

    node(node_kind kind, std::ptrdiff_t size_hint, opener_type opener)
        : kind_(kind), size_hint_(size_hint), opener_(std::move(opener)) {}

    node_kind kind() const noexcept {
        return kind_;
    }

    std::ptrdiff_t size_hint() const noexcept {
        return size_hint_;
    }

    Cursor open() const {
        return opener_();
    }

  private:
    node_kind kind_;
    std::ptrdiff_t size_hint_;
    opener_type opener_;
};

template<typename Cursor>
using node_ptr = std::shared_ptr<const node<Cursor>>;

template<typename Cursor, typename Opener>
node_ptr<Cursor> make_node(node_kind kind, std::ptrdiff_t size_hint, Opener&& opener) {
    return std::make_shared<node<Cursor>>(kind, size_hint, std::forward<Opener>(opener));
}
}  // namespace detail
}  // namespace lazyseq
