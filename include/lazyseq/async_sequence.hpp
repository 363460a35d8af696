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

#include "async_cursor.hpp"
#include "concat.hpp"
#include "detail/invoke.hpp"
#include "detail/node.hpp"
#include "drop.hpp"
#include "drop_while.hpp"
#include "filter.hpp"
#include "flatten.hpp"
#include "generate.hpp"
#include "guard.hpp"
#include "iter.hpp"
#include "join.hpp"
#include "map.hpp"
#include "next.hpp"
#include "probe.hpp"
#include "sequence.hpp"
#include "size_hint.hpp"
#include "stream.hpp"
#include "take.hpp"
#include "take_while.hpp"
#include "task.hpp"

namespace lazyseq {
template<typename T>
class async_sequence;

namespace detail {
template<typename T>
inline constexpr bool is_async_sequence_v = false;

template<typename T>
inline constexpr bool is_async_sequence_v<async_sequence<T>> = true;

// Runs a callback whose result may be void, a value or an awaitable, and
// waits for it.
template<typename Func, typename Value>
task<> invoke_and_wait(Func& func, const Value& value, std::size_t index) {
    if constexpr (std::is_void_v<indexed_result_t<Func, const Value&>>) {
        invoke_indexed(func, value, index);
    } else {
        co_await resolve(invoke_indexed(func, value, index));
    }
    co_return;
}
}  // namespace detail

// Lazy pipeline whose values are produced asynchronously. Same operations as
// sequence<T>; every callback may hand back an awaitable instead of a value,
// and every terminal operation is a task that traverses on its first poll.
template<typename T>
class async_sequence {
    template<typename>
    friend class async_sequence;

    using cursor_type = async_cursor<T>;
    using node_ptr = detail::node_ptr<cursor_type>;

    node_ptr node_;

    explicit async_sequence(node_ptr node) : node_(std::move(node)) {}

    template<typename Opener>
    static async_sequence make(node_kind kind, std::ptrdiff_t size_hint, Opener&& opener) {
        return async_sequence(
            detail::make_node<cursor_type>(kind, size_hint, std::forward<Opener>(opener))
        );
    }

    template<typename Range>
    static cursor_type open_range(Range& range, std::shared_ptr<const void> storage) {
        return cursor_type(iter_stream<T>(std::begin(range), std::end(range), std::move(storage)));
    }

    template<typename Container>
    static async_sequence owning(Container&& container) {
        using container_type = std::remove_cvref_t<Container>;
        auto storage = std::make_shared<container_type>(std::forward<Container>(container));
        auto size_hint = probe_size(*storage);
        return make(node_kind::source, size_hint, [storage] {
            return open_range(*storage, storage);
        });
    }

    // Terminal operations run as free-standing coroutines that own the node,
    // so a task stays valid after the handle that created it is gone.

    static task<std::size_t> count_all(node_ptr node) {
        std::size_t result = 0;
        auto source = node->open();
        while (co_await next(source)) {
            ++result;
        }
        co_return result;
    }

    template<typename Predicate>
    static task<std::size_t> count_matching(node_ptr node, Predicate predicate) {
        std::size_t result = 0;
        std::size_t index = 0;
        auto source = node->open();
        while (auto value = co_await next(source)) {
            if (co_await detail::resolve(
                    detail::invoke_indexed(predicate, std::as_const(*value), index++)
                )) {
                ++result;
            }
        }
        co_return result;
    }

    static task<bool> contains_value(node_ptr node, T needle) {
        auto source = node->open();
        while (auto value = co_await next(source)) {
            if (*value == needle) {
                co_return true;
            }
        }
        co_return false;
    }

    static task<bool> contains_values(node_ptr node, std::vector<T> missing) {
        if (missing.empty()) {
            co_return true;
        }
        auto source = node->open();
        while (auto value = co_await next(source)) {
            std::erase(missing, *value);
            if (missing.empty()) {
                co_return true;
            }
        }
        co_return false;
    }

    static task<std::optional<T>> value_at(node_ptr node, std::ptrdiff_t index) {
        if (index < 0) {
            co_return std::nullopt;
        }
        auto source = node->open();
        while (auto value = co_await next(source)) {
            if (index-- == 0) {
                co_return value;
            }
        }
        co_return std::nullopt;
    }

    template<typename Predicate>
    static task<bool> every_matching(node_ptr node, Predicate predicate) {
        std::size_t index = 0;
        auto source = node->open();
        while (auto value = co_await next(source)) {
            if (!co_await detail::resolve(
                    detail::invoke_indexed(predicate, std::as_const(*value), index++)
                )) {
                co_return false;
            }
        }
        co_return true;
    }

    // Position of the first (or, with find_last, the last) match and the
    // matching value; -1 when nothing matches.
    template<typename Predicate>
    static task<std::pair<std::ptrdiff_t, std::optional<T>>>
    search(node_ptr node, Predicate predicate, bool find_last) {
        std::pair<std::ptrdiff_t, std::optional<T>> result{-1, std::nullopt};
        std::size_t index = 0;
        auto source = node->open();
        while (auto value = co_await next(source)) {
            if (co_await detail::resolve(
                    detail::invoke_indexed(predicate, std::as_const(*value), index)
                )) {
                result = {static_cast<std::ptrdiff_t>(index), std::move(value)};
                if (!find_last) {
                    co_return result;
                }
            }
            ++index;
        }
        co_return result;
    }

    template<typename Predicate>
    static task<bool> any_matching(node_ptr node, Predicate predicate) {
        auto index = co_await search_index(std::move(node), std::move(predicate), false);
        co_return index >= 0;
    }

    template<typename Predicate>
    static task<std::optional<T>> search_value(node_ptr node, Predicate predicate, bool find_last) {
        auto result = co_await search(std::move(node), std::move(predicate), find_last);
        co_return std::move(result.second);
    }

    template<typename Predicate>
    static task<std::ptrdiff_t> search_index(node_ptr node, Predicate predicate, bool find_last) {
        auto result = co_await search(std::move(node), std::move(predicate), find_last);
        co_return result.first;
    }

    static task<std::optional<T>> first_value(node_ptr node) {
        auto source = node->open();
        co_return co_await next(source);
    }

    static task<std::optional<T>> last_value(node_ptr node) {
        std::optional<T> result;
        auto source = node->open();
        while (auto value = co_await next(source)) {
            result = std::move(value);
        }
        co_return result;
    }

    static task<bool> has_any(node_ptr node) {
        auto source = node->open();
        auto value = co_await next(source);
        co_return value.has_value();
    }

    static task<bool> has_none(node_ptr node) {
        co_return !co_await has_any(std::move(node));
    }

    template<typename R, typename Operation>
    static task<R> fold_values(node_ptr node, R accumulator, Operation operation) {
        std::size_t index = 0;
        auto source = node->open();
        while (auto value = co_await next(source)) {
            accumulator = co_await detail::resolve(detail::invoke_accumulate(
                operation, std::move(accumulator), std::as_const(*value), index++
            ));
        }
        co_return accumulator;
    }

    template<typename Operation>
    static task<std::optional<T>> reduce_values(node_ptr node, Operation operation) {
        auto source = node->open();
        auto result = co_await next(source);
        if (!result) {
            co_return std::nullopt;
        }
        std::size_t index = 1;
        while (auto value = co_await next(source)) {
            *result = co_await detail::resolve(detail::invoke_accumulate(
                operation, std::move(*result), std::as_const(*value), index++
            ));
        }
        co_return result;
    }

    template<typename Action>
    static task<> visit(node_ptr node, Action action) {
        std::size_t index = 0;
        auto source = node->open();
        while (auto value = co_await next(source)) {
            co_await detail::invoke_and_wait(action, *value, index++);
        }
    }

    template<typename Key, typename KeySelector>
    static task<std::map<Key, std::vector<T>>>
    group_values(node_ptr node, KeySelector key_selector) {
        std::map<Key, std::vector<T>> groups;
        std::size_t index = 0;
        auto source = node->open();
        while (auto value = co_await next(source)) {
            Key key = co_await detail::resolve(
                detail::invoke_indexed(key_selector, std::as_const(*value), index++)
            );
            groups[std::move(key)].push_back(std::move(*value));
        }
        co_return groups;
    }

    template<typename Transform>
    static task<std::string> join_values(node_ptr node, join_options<T, Transform> options) {
        detail::joiner joiner(options);
        auto source = node->open();
        while (auto value = co_await next(source)) {
            if (!joiner.accept()) {
                break;
            }
            if (detail::has_transform(options.transform)) {
                std::string text = co_await detail::resolve(options.transform(*value));
                joiner.append(text);
            } else {
                joiner.append(detail::display_string(*value));
            }
        }
        co_return joiner.finish();
    }

    static task<std::vector<T>> collect(node_ptr node) {
        std::vector<T> result;
        if (detail::is_known_size(node->size_hint())) {
            result.reserve(static_cast<std::size_t>(node->size_hint()));
        }
        auto source = node->open();
        while (auto value = co_await next(source)) {
            result.push_back(std::move(*value));
        }
        co_return result;
    }

  public:
    using value_type = T;

    static constexpr std::string_view tag() noexcept {
        return "AsyncSequence";
    }

    template<typename... Args>
    static async_sequence of(Args&&... values) {
        std::vector<T> storage;
        storage.reserve(sizeof...(Args));
        (storage.emplace_back(std::forward<Args>(values)), ...);
        return owning(std::move(storage));
    }

    static async_sequence empty() {
        return owning(std::vector<T>{});
    }

    static async_sequence from(std::initializer_list<T> values) {
        return owning(std::vector<T>(values));
    }

    // Accepts an async_sequence, a synchronous sequence, a stream factory, a
    // bare async cursor (single traversal) or a range of values or copyable
    // awaitables. Lvalue ranges are referenced and must outlive the pipeline.
    template<typename Source>
    static async_sequence from(Source&& source) {
        using source_type = std::remove_cvref_t<Source>;
        using range_type = std::remove_reference_t<Source>;

        if constexpr (detail::is_async_sequence_v<source_type>) {
            static_assert(
                std::is_same_v<source_type, async_sequence>, "sequence value type mismatch"
            );
            return source;
        } else if constexpr (detail::is_sequence_v<source_type>) {
            return make(node_kind::source, source.size(), [seq = source] {
                return cursor_type(cursor_stream<T>(seq.open()));
            });
        } else if constexpr (async_cursor_source<source_type>) {
            static_assert(!std::is_lvalue_reference_v<Source>, "async cursors must be moved in");
            auto guarded = std::make_shared<constrained_source<cursor_type>>(
                cursor_type(std::move(source))
            );
            return make(node_kind::constrained, unknown_size, [guarded] {
                return guarded->open();
            });
        } else if constexpr (async_iterable<source_type>) {
            return make(
                node_kind::source,
                unknown_size,
                [factory = source_type(std::forward<Source>(source))]() mutable {
                    return cursor_type(factory());
                }
            );
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
                    return open_range(*storage, storage);
                });
            } else if constexpr (std::is_lvalue_reference_v<Source>) {
                auto range = &source;
                return make(node_kind::source, probe_size(source), [range] {
                    return open_range(*range, nullptr);
                });
            } else {
                return owning(std::move(source));
            }
        } else {
            static_assert(
                detail::always_false_v<Source>, "source is neither an async source nor iterable"
            );
        }
    }

    // seed may be an awaitable; step may return T, std::optional<T> or an
    // awaitable of either. std::nullopt ends the sequence.
    template<typename Seed, typename Step>
    static async_sequence generate(Seed seed, Step step) {
        return make(
            node_kind::generate,
            unknown_size,
            [seed = std::move(seed), step = std::move(step)] {
                return cursor_type(generate_stream<T>(seed, step));
            }
        );
    }

    // Intermediate operations.

    template<typename Func>
    auto map(Func func) const {
        using result_type =
            std::remove_cvref_t<detail::resolved_t<detail::indexed_result_t<Func, T>>>;
        using result_cursor = async_cursor<result_type>;
        return async_sequence<result_type>(detail::make_node<result_cursor>(
            node_kind::map,
            size(),
            [upstream = node_, func = std::move(func)] {
                return result_cursor(map_stream<result_type>(upstream->open(), func));
            }
        ));
    }

    template<typename Predicate>
    async_sequence filter(Predicate predicate) const {
        return make(
            node_kind::filter,
            unknown_size,
            [upstream = node_, predicate = std::move(predicate)] {
                return cursor_type(filter_stream(upstream->open(), predicate));
            }
        );
    }

    async_sequence drop(std::size_t count) const {
        return make(node_kind::drop, detail::drop_size(size(), count), [upstream = node_, count] {
            return cursor_type(drop_stream(upstream->open(), count));
        });
    }

    async_sequence take(std::size_t count) const {
        return make(node_kind::take, detail::take_size(size(), count), [upstream = node_, count] {
            return cursor_type(take_stream(upstream->open(), count));
        });
    }

    template<typename Predicate>
    async_sequence drop_while(Predicate predicate) const {
        return make(
            node_kind::drop_while,
            unknown_size,
            [upstream = node_, predicate = std::move(predicate)] {
                return cursor_type(drop_while_stream(upstream->open(), predicate));
            }
        );
    }

    template<typename Predicate>
    async_sequence take_while(Predicate predicate) const {
        return make(
            node_kind::take_while,
            unknown_size,
            [upstream = node_, predicate = std::move(predicate)] {
                return cursor_type(take_while_stream(upstream->open(), predicate));
            }
        );
    }

    auto flatten() const
        requires detail::is_async_sequence_v<T>
    {
        using result_type = typename T::value_type;
        using result_cursor = async_cursor<result_type>;
        return async_sequence<result_type>(detail::make_node<result_cursor>(
            node_kind::flatten,
            unknown_size,
            [upstream = node_] {
                return result_cursor(flatten_stream<result_type>(upstream->open()));
            }
        ));
    }

    template<typename Func>
    auto flat_map(Func func) const {
        using inner_sequence =
            std::remove_cvref_t<detail::resolved_t<detail::indexed_result_t<Func, T>>>;
        static_assert(
            detail::is_async_sequence_v<inner_sequence>, "flat_map must return an async_sequence"
        );
        using result_type = typename inner_sequence::value_type;
        using result_cursor = async_cursor<result_type>;
        return async_sequence<result_type>(detail::make_node<result_cursor>(
            node_kind::flat_map,
            unknown_size,
            [upstream = node_, func = std::move(func)] {
                return result_cursor(flat_map_stream<result_type>(upstream->open(), func));
            }
        ));
    }

    async_sequence concat(const async_sequence& other) const {
        return make(
            node_kind::concat,
            detail::concat_size(size(), other.size()),
            [upstream = node_, second = other.node_] {
                return cursor_type(concat_stream(upstream->open(), second));
            }
        );
    }

    // Takes this pipeline's cursor now and allows exactly one traversal of it.
    async_sequence constrain_once() const {
        auto guarded = std::make_shared<constrained_source<cursor_type>>(open());
        return make(node_kind::constrained, size(), [guarded] {
            return guarded->open();
        });
    }

    // Terminal operations.

    task<std::size_t> count() const {
        return count_all(node_);
    }

    template<typename Predicate>
    task<std::size_t> count(Predicate predicate) const {
        return count_matching(node_, std::move(predicate));
    }

    task<bool> contains(T needle) const {
        return contains_value(node_, std::move(needle));
    }

    task<bool> contains_all(std::initializer_list<T> needles) const {
        return contains_values(node_, std::vector<T>(needles));
    }

    template<typename Range>
        requires iterable<const Range>
    task<bool> contains_all(const Range& needles) const {
        return contains_values(node_, std::vector<T>(std::begin(needles), std::end(needles)));
    }

    task<std::optional<T>> element_at(std::ptrdiff_t index) const {
        return value_at(node_, index);
    }

    template<typename Predicate>
    task<bool> every(Predicate predicate) const {
        return every_matching(node_, std::move(predicate));
    }

    task<bool> some() const {
        return has_any(node_);
    }

    template<typename Predicate>
    task<bool> some(Predicate predicate) const {
        return any_matching(node_, std::move(predicate));
    }

    template<typename Predicate>
    task<std::optional<T>> find(Predicate predicate) const {
        return search_value(node_, std::move(predicate), false);
    }

    template<typename Predicate>
    task<std::ptrdiff_t> find_index(Predicate predicate) const {
        return search_index(node_, std::move(predicate), false);
    }

    template<typename Predicate>
    task<std::optional<T>> find_last(Predicate predicate) const {
        return search_value(node_, std::move(predicate), true);
    }

    template<typename Predicate>
    task<std::ptrdiff_t> find_last_index(Predicate predicate) const {
        return search_index(node_, std::move(predicate), true);
    }

    task<std::optional<T>> first() const {
        return first_value(node_);
    }

    task<std::optional<T>> last() const {
        return last_value(node_);
    }

    task<bool> is_empty() const {
        return has_none(node_);
    }

    template<typename R, typename Operation>
    task<R> fold(R initial, Operation operation) const {
        return fold_values(node_, std::move(initial), std::move(operation));
    }

    template<typename Operation>
    task<std::optional<T>> reduce(Operation operation) const {
        return reduce_values(node_, std::move(operation));
    }

    template<typename Action>
    task<> for_each(Action action) const {
        return visit(node_, std::move(action));
    }

    task<std::ptrdiff_t> index_of(T needle) const {
        return search_index(
            node_,
            [needle = std::move(needle)](const T& value) {
                return value == needle;
            },
            false
        );
    }

    task<std::ptrdiff_t> last_index_of(T needle) const {
        return search_index(
            node_,
            [needle = std::move(needle)](const T& value) {
                return value == needle;
            },
            true
        );
    }

    template<typename KeySelector>
    auto group_by(KeySelector key_selector) const {
        using key_type = std::remove_cvref_t<
            detail::resolved_t<detail::indexed_result_t<KeySelector, const T&>>>;
        return group_values<key_type>(node_, std::move(key_selector));
    }

    task<std::string> join(join_options<T> options = {}) const {
        return join_values(node_, std::move(options));
    }

    // For transforms returning an awaitable string.
    template<typename Transform>
    task<std::string> join(join_options<T, Transform> options) const {
        return join_values(node_, std::move(options));
    }

    task<std::string> join(std::string separator) const {
        join_options<T> options;
        options.separator = std::move(separator);
        return join_values(node_, std::move(options));
    }

    task<std::vector<T>> to_vector() const {
        return collect(node_);
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

    const void* identity() const noexcept {
        return node_.get();
    }

    cursor_type open() const {
        return node_->open();
    }

    friend std::ostream& operator<<(std::ostream& out, const async_sequence& seq) {
        return out << seq.to_string();
    }
};
}  // namespace lazyseq
