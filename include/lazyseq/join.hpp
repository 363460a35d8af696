#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace lazyseq {
// Options for join(). A negative limit means no limit; when the limit cuts the
// sequence short the truncation marker follows one more separator.
template<typename T, typename Transform = std::function<std::string(const T&)>>
struct join_options {
    std::string separator = ", ";
    std::string prefix;
    std::string postfix;
    std::ptrdiff_t limit = -1;
    std::string truncated = "...";
    Transform transform{};
};

namespace detail {
template<typename T>
concept printable = requires(std::ostream& out, const T& value) { out << value; };

template<typename T>
std::string display_string(const T& value) {
    if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return std::string(std::string_view(value));
    } else if constexpr (printable<T>) {
        std::ostringstream out;
        out << value;
        return out.str();
    } else {
        throw std::logic_error("join of a non-printable element type needs a transform");
    }
}

template<typename Transform>
bool has_transform(const Transform& transform) {
    if constexpr (std::is_constructible_v<bool, const Transform&>) {
        return static_cast<bool>(transform);
    } else {
        return true;
    }
}

// Accumulates the joined string one element at a time. accept() is called
// before rendering each element and returns false once the limit is hit.
template<typename Options>
class joiner {
    const Options& options_;
    std::string result_;
    std::size_t count_{0};
    bool truncated_{false};

  public:
    explicit joiner(const Options& options) : options_(options), result_(options.prefix) {}

    bool accept() {
        if (options_.limit >= 0 && count_ == static_cast<std::size_t>(options_.limit)) {
            truncated_ = true;
            return false;
        }
        if (count_++ > 0) {
            result_ += options_.separator;
        }
        return true;
    }

    void append(std::string_view text) {
        result_ += text;
    }

    std::string finish() {
        if (truncated_) {
            if (count_ > 0) {
                result_ += options_.separator;
            }
            result_ += options_.truncated;
        }
        result_ += options_.postfix;
        return std::move(result_);
    }
};
}  // namespace detail
}  // namespace lazyseq
