#pragma once

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "concat.hpp"
#include "cursor.hpp"
#include "detail/invoke.hpp"
#include "detail/node.hpp"
#include "drop.hpp"
#include "drop_while.hpp"
#include "filter.hpp"
#include "flatten.hpp"
#include "generate.hpp"
#include "guard.hpp"
#include "iter.hpp"
#include "iterator.hpp"
#include "join.hpp"
#include "map.hpp"
#include "probe.hpp"
#include "size_hint.hpp"
#include "take.hpp"
#include "take_while.hpp"

namespace lazyseq {
template<typename T>
class sequence;

namespace detail {
template<typename T>
inline constexpr bool is_sequence_v = false;

template<typename T>
inline constexpr bool is_sequence_v<sequence<T>> = true;

template<typename>
inline constexpr bool always_false_v = false;

// Display form shared by both sequence variants. Never traverses.
inline std::string describe(std::string_view tag, std::ptrdiff_t size_hint) {
    std::string result(tag);
    if (size_hint == 0) {
        result += " (empty)";
    } else if (is_known_size(size_hint)) {
        result += " (" + std::to_string(size_hint) + ")";
    } else {
        result += " (unknown)";
    }
    return result;
}
}  // namespace detail

// Lazy, re-traversable pipeline of synchronous values. Intermediate operations
// return a new sequence sharing this one as upstream; nothing is pulled from
// the source until a terminal operation runs, and each terminal operation is
// a fresh traversal unless the pipeline is constrained to a single one.
template<typename T>
class sequence {
    template<typename>
    friend class sequence;

    using cursor_type = cursor<T>;
    using node_ptr = detail::node_ptr<cursor_type>;

    node_ptr node_;

    explicit sequence(node_ptr node) : node_(std::move(node)) {}

    template<typename Opener>
    static sequence make(node_kind kind, std::ptrdiff_t size_hint, Opener&& opener) {
        return sequence(
            detail::make_node<cursor_type>(kind, size_hint, std::forward<Opener>(opener))
        );
    }

    template<typename Container>
    static sequence owning(Container&& container) {
        using container_type = std::remove_cvref_t<Container>;
        auto storage = std::make_shared<container_type>(std::forward<Container>(container));
        auto size_hint = probe_size(*storage);
        return make(node_kind::source, size_hint, [storage] {
            return cursor_type(iter_cursor(std::begin(*storage), std::end(*storage), storage));
        });
    }

    static sequence constrained(cursor_type source) {
        auto guarded = std::make_shared<constrained_source<cursor_type>>(std::move(source));
        return make(node_kind::constrained, unknown_size, [guarded] {
            return guarded->open();
        });
    }

    template<typename Iterator>
    bool contains_all_of(Iterator first, Iterator last) const {
        std::vector<T> missing(first, last);
        if (missing.empty()) {
            return true;
        }
        auto source = open();
        while (auto value = source.next()) {
            std::erase(missing, *value);
            if (missing.empty()) {
                return true;
            }
        }
        return false;
    }

  public:
    using value_type = T;
    using iterator = cursor_iterator<T>;

    static constexpr std::string_view tag() noexcept {
        return "Sequence";
    }

    template<typename... Args>
    static sequence of(Args&&... values) {
        std::vector<T> storage;
        storage.reserve(sizeof...(Args));
        (storage.emplace_back(std::forward<Args>(values)), ...);
        return owning(std::move(storage));
    }

    static sequence empty() {
        return owning(std::vector<T>{});
    }

    static sequence from(std::initializer_list<T> values) {
        return owning(std::vector<T>(values));
    }

    // Wraps a cursor, a container or any other iterable. A bare cursor or a
    // single-pass range can be traversed only once. Lvalue containers are
    // referenced and must outlive the pipeline; rvalues are moved into it.
    template<typename Source>
    static sequence from(Source&& source) {
        using source_type = std::remove_cvref_t<Source>;
        using range_type = std::remove_reference_t<Source>;

        if constexpr (detail::is_sequence_v<source_type>) {
            static_assert(
                std::is_same_v<source_type, sequence>, "sequence value type mismatch"
            );
            return source;
        } else if constexpr (cursor_source<source_type>) {
            return constrained(cursor_type(source_type(std::forward<Source>(source))));
        } else if constexpr (iterable<range_type>) {
            if constexpr (!multi_pass_iterable<range_type>) {
                std::shared_ptr<range_type> storage;
                if constexpr (std::is_lvalue_reference_v<Source>) {
                    storage = std::shared_ptr<range_type>(std::shared_ptr<void>(), &source);
                } else {
                    storage = std::make_shared<range_type>(std::move(source));
                }
                auto guard = std::make_shared<traversal_guard>();
                return make(node_kind::constrained, unknown_size, [guard, storage] {
                    guard->acquire();
                    return cursor_type(
                        iter_cursor(std::begin(*storage), std::end(*storage), storage)
                    );
                });
            } else if constexpr (std::is_lvalue_reference_v<Source>) {
                auto range = &source;
                return make(node_kind::source, probe_size(source), [range] {
                    return cursor_type(iter_cursor(std::begin(*range), std::end(*range)));
                });
            } else {
                return owning(std::move(source));
            }
        } else {
            static_assert(
                detail::always_false_v<Source>, "source is neither a cursor nor iterable"
            );
        }
    }

    template<std::input_iterator Iterator, std::sentinel_for<Iterator> Sentinel>
    static sequence from(Iterator first, Sentinel last) {
        if constexpr (!std::forward_iterator<Iterator>) {
            return constrained(cursor_type(iter_cursor(std::move(first), std::move(last))));
        } else {
            std::ptrdiff_t size_hint = unknown_size;
            if constexpr (std::sized_sentinel_for<Sentinel, Iterator>) {
                size_hint = static_cast<std::ptrdiff_t>(std::distance(first, last));
            }
            return make(node_kind::source, size_hint, [first, last] {
                return cursor_type(iter_cursor(first, last));
            });
        }
    }

    // seed, step(seed), step(step(seed)), ... until step returns std::nullopt.
    template<typename Step>
    static sequence generate(T seed, Step step) {
        return make(
            node_kind::generate,
            unknown_size,
            [seed = std::move(seed), step = std::move(step)] {
                return cursor_type(generate_cursor<T, Step>(seed, step));
            }
        );
    }

    // Intermediate operations.

    template<typename Func>
    auto map(Func func) const {
        using result_type = std::remove_cvref_t<detail::indexed_result_t<Func, T>>;
        using result_cursor = cursor<result_type>;
        return sequence<result_type>(detail::make_node<result_cursor>(
            node_kind::map,
            size(),
            [upstream = node_, func = std::move(func)] {
                return result_cursor(map_cursor<cursor_type, Func>(upstream->open(), func));
            }
        ));
    }

    template<typename Predicate>
    sequence filter(Predicate predicate) const {
        return make(
            node_kind::filter,
            unknown_size,
            [upstream = node_, predicate = std::move(predicate)] {
                return cursor_type(
                    filter_cursor<cursor_type, Predicate>(upstream->open(), predicate)
                );
            }
        );
    }

    sequence drop(std::size_t count) const {
        return make(node_kind::drop, detail::drop_size(size(), count), [upstream = node_, count] {
            return cursor_type(drop_cursor<cursor_type>(upstream->open(), count));
        });
    }

    sequence take(std::size_t count) const {
        return make(node_kind::take, detail::take_size(size(), count), [upstream = node_, count] {
            return cursor_type(take_cursor<cursor_type>(upstream->open(), count));
        });
    }

    template<typename Predicate>
    sequence drop_while(Predicate predicate) const {
        return make(
            node_kind::drop_while,
            unknown_size,
            [upstream = node_, predicate = std::move(predicate)] {
                return cursor_type(
                    drop_while_cursor<cursor_type, Predicate>(upstream->open(), predicate)
                );
            }
        );
    }

    template<typename Predicate>
    sequence take_while(Predicate predicate) const {
        return make(
            node_kind::take_while,
            unknown_size,
            [upstream = node_, predicate = std::move(predicate)] {
                return cursor_type(
                    take_while_cursor<cursor_type, Predicate>(upstream->open(), predicate)
                );
            }
        );
    }

    // Only available when the elements are sequences themselves.
    auto flatten() const
        requires detail::is_sequence_v<T>
    {
        using result_type = typename T::value_type;
        using result_cursor = cursor<result_type>;
        return sequence<result_type>(detail::make_node<result_cursor>(
            node_kind::flatten,
            unknown_size,
            [upstream = node_] {
                return result_cursor(flatten_cursor<cursor_type>(upstream->open()));
            }
        ));
    }

    template<typename Func>
    auto flat_map(Func func) const {
        using inner_sequence = std::remove_cvref_t<detail::indexed_result_t<Func, T>>;
        static_assert(detail::is_sequence_v<inner_sequence>, "flat_map must return a sequence");
        using result_type = typename inner_sequence::value_type;
        using result_cursor = cursor<result_type>;
        return sequence<result_type>(detail::make_node<result_cursor>(
            node_kind::flat_map,
            unknown_size,
            [upstream = node_, func = std::move(func)] {
                return result_cursor(flat_map_cursor<cursor_type, Func>(upstream->open(), func));
            }
        ));
    }

    sequence concat(const sequence& other) const {
        return make(
            node_kind::concat,
            detail::concat_size(size(), other.size()),
            [upstream = node_, second = other.node_] {
                return cursor_type(concat_cursor<cursor_type, node_ptr>(upstream->open(), second));
            }
        );
    }

    // Takes this pipeline's cursor now and allows exactly one traversal of it.
    sequence constrain_once() const {
        auto guarded = std::make_shared<constrained_source<cursor_type>>(open());
        return make(node_kind::constrained, size(), [guarded] {
            return guarded->open();
        });
    }

    // Terminal operations.

    std::size_t count() const {
        std::size_t result = 0;
        auto source = open();
        while (source.next()) {
            ++result;
        }
        return result;
    }

    template<typename Predicate>
    std::size_t count(Predicate predicate) const {
        std::size_t result = 0;
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            if (detail::invoke_indexed(predicate, std::as_const(*value), index++)) {
                ++result;
            }
        }
        return result;
    }

    bool contains(const T& needle) const {
        auto source = open();
        while (auto value = source.next()) {
            if (*value == needle) {
                return true;
            }
        }
        return false;
    }

    bool contains_all(std::initializer_list<T> needles) const {
        return contains_all_of(needles.begin(), needles.end());
    }

    template<typename Range>
        requires iterable<const Range>
    bool contains_all(const Range& needles) const {
        return contains_all_of(std::begin(needles), std::end(needles));
    }

    std::optional<T> element_at(std::ptrdiff_t index) const {
        if (index < 0) {
            return std::nullopt;
        }
        auto source = open();
        while (auto value = source.next()) {
            if (index-- == 0) {
                return value;
            }
        }
        return std::nullopt;
    }

    template<typename Predicate>
    bool every(Predicate predicate) const {
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            if (!detail::invoke_indexed(predicate, std::as_const(*value), index++)) {
                return false;
            }
        }
        return true;
    }

    bool some() const {
        return open().next().has_value();
    }

    template<typename Predicate>
    bool some(Predicate predicate) const {
        return find_index(std::move(predicate)) >= 0;
    }

    template<typename Predicate>
    std::optional<T> find(Predicate predicate) const {
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            if (detail::invoke_indexed(predicate, std::as_const(*value), index++)) {
                return value;
            }
        }
        return std::nullopt;
    }

    template<typename Predicate>
    std::ptrdiff_t find_index(Predicate predicate) const {
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            if (detail::invoke_indexed(predicate, std::as_const(*value), index)) {
                return static_cast<std::ptrdiff_t>(index);
            }
            ++index;
        }
        return -1;
    }

    template<typename Predicate>
    std::optional<T> find_last(Predicate predicate) const {
        std::optional<T> result;
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            if (detail::invoke_indexed(predicate, std::as_const(*value), index++)) {
                result = std::move(value);
            }
        }
        return result;
    }

    template<typename Predicate>
    std::ptrdiff_t find_last_index(Predicate predicate) const {
        std::ptrdiff_t result = -1;
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            if (detail::invoke_indexed(predicate, std::as_const(*value), index)) {
                result = static_cast<std::ptrdiff_t>(index);
            }
            ++index;
        }
        return result;
    }

    std::optional<T> first() const {
        return open().next();
    }

    std::optional<T> last() const {
        std::optional<T> result;
        auto source = open();
        while (auto value = source.next()) {
            result = std::move(value);
        }
        return result;
    }

    bool is_empty() const {
        return !some();
    }

    template<typename R, typename Operation>
    R fold(R initial, Operation operation) const {
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            initial = detail::invoke_accumulate(
                operation, std::move(initial), std::as_const(*value), index++
            );
        }
        return initial;
    }

    // Left fold seeded with the first value; std::nullopt when empty. The
    // index passed to operation is the position of the folded-in value, so
    // the second element gets 1, not the 0 that a fold over drop(1) would
    // pass.
    template<typename Operation>
    std::optional<T> reduce(Operation operation) const {
        auto source = open();
        auto result = source.next();
        if (!result) {
            return std::nullopt;
        }
        std::size_t index = 1;
        while (auto value = source.next()) {
            *result = detail::invoke_accumulate(
                operation, std::move(*result), std::as_const(*value), index++
            );
        }
        return result;
    }

    template<typename Action>
    void for_each(Action action) const {
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            detail::invoke_indexed(action, std::as_const(*value), index++);
        }
    }

    std::ptrdiff_t index_of(const T& needle) const {
        return find_index([&needle](const T& value) {
            return value == needle;
        });
    }

    std::ptrdiff_t last_index_of(const T& needle) const {
        return find_last_index([&needle](const T& value) {
            return value == needle;
        });
    }

    template<typename KeySelector>
    auto group_by(KeySelector key_selector) const {
        using key_type = std::remove_cvref_t<detail::indexed_result_t<KeySelector, const T&>>;
        std::map<key_type, std::vector<T>> groups;
        std::size_t index = 0;
        auto source = open();
        while (auto value = source.next()) {
            auto key = detail::invoke_indexed(key_selector, std::as_const(*value), index++);
            groups[std::move(key)].push_back(std::move(*value));
        }
        return groups;
    }

    std::string join(const join_options<T>& options = {}) const {
        detail::joiner joiner(options);
        auto source = open();
        while (auto value = source.next()) {
            if (!joiner.accept()) {
                break;
            }
            if (detail::has_transform(options.transform)) {
                joiner.append(options.transform(*value));
            } else {
                joiner.append(detail::display_string(*value));
            }
        }
        return joiner.finish();
    }

    std::string join(std::string separator) const {
        join_options<T> options;
        options.separator = std::move(separator);
        return join(options);
    }

    std::vector<T> to_vector() const {
        std::vector<T> result;
        if (detail::is_known_size(size())) {
            result.reserve(static_cast<std::size_t>(size()));
        }
        auto source = open();
        while (auto value = source.next()) {
            result.push_back(std::move(*value));
        }
        return result;
    }

    // Introspection. None of these traverse.

    std::ptrdiff_t size() const noexcept {
        return node_->size_hint();
    }

    node_kind kind() const noexcept {
        return node_->kind();
    }

    std::string to_string() const {
        return detail::describe(tag(), size());
    }

    // Identity of the pipeline stage; copies of a sequence share it.
    const void* identity() const noexcept {
        return node_.get();
    }

    // A fresh cursor over the values, i.e. one traversal.
    cursor_type open() const {
        return node_->open();
    }

    iterator begin() const {
        return iterator(open());
    }

    iterator end() const {
        return iterator();
    }

    friend std::ostream& operator<<(std::ostream& out, const sequence& seq) {
        return out << seq.to_string();
    }
};

namespace detail {
template<typename Source>
struct source_value {
    using type = range_value_t<std::remove_reference_t<Source>>;
};

template<typename Source>
    requires cursor_source<std::remove_cvref_t<Source>>
struct source_value<Source> {
    using type = cursor_result_t<std::remove_cvref_t<Source>>;
};

template<typename Source>
    requires is_sequence_v<std::remove_cvref_t<Source>>
struct source_value<Source> {
    using type = typename std::remove_cvref_t<Source>::value_type;
};

template<typename Source>
using source_value_t = typename source_value<Source>::type;
}  // namespace detail

template<typename First, typename... Rest>
auto of(First&& first, Rest&&... rest) {
    return sequence<std::decay_t<First>>::of(
        std::forward<First>(first), std::forward<Rest>(rest)...
    );
}

template<typename Source>
auto from(Source&& source) {
    return sequence<detail::source_value_t<Source>>::from(std::forward<Source>(source));
}

template<std::input_iterator Iterator, std::sentinel_for<Iterator> Sentinel>
auto from(Iterator first, Sentinel last) {
    return sequence<std::iter_value_t<Iterator>>::from(std::move(first), std::move(last));
}

template<typename T, typename Step>
auto generate(T seed, Step step) {
    return sequence<T>::generate(std::move(seed), std::move(step));
}
}  // namespace lazyseq
