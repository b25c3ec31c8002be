#pragma once

#include <range/v3/action/insert.hpp>
#include <range/v3/core.hpp>

#include <cassert>
#include <cstddef>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

// compile with -DVHEAP_TRACE_ENABLED=1 to show verbose trace output
#ifndef VHEAP_TRACE_ENABLED
#define VHEAP_TRACE_ENABLED 0
#endif

#define VHEAP_TRACE                                                            \
    if (!(VHEAP_TRACE_ENABLED)) {                                              \
    } else                                                                     \
        std::cerr << "TRACE "

namespace vheap::detail {

// Convenience alias for ranges::views
namespace rv = ranges::views;

/**
 * A poor man's boost::numeric_cast that uses assert to check for loss of range.
 *
 * Inspired by: https://codereview.stackexchange.com/q/5515/11013
 */
template <typename TargetT, typename SourceT>
constexpr TargetT num_cast(SourceT input) {
    static_assert(std::is_arithmetic<SourceT>::value);
    static_assert(std::is_arithmetic<TargetT>::value);

    auto output = static_cast<TargetT>(input);

    // We can cast back to SourceT without losing information
    assert(static_cast<SourceT>(output) == input);

    // Output is positive iff input is positive
    assert((SourceT(0) < input) == (TargetT(0) < output));

    return output;
}

template <class C>
constexpr auto ssize(const C &c) {
    using R = std::common_type_t<std::ptrdiff_t,
                                 std::make_signed_t<decltype(c.size())>>;
    return num_cast<R>(c.size());
}

/** Calculates ⌊log2 n⌋ for n > 0 */
inline constexpr int log2_floor(unsigned long n) {
    assert(n > 0);
    return std::numeric_limits<unsigned long>::digits - 1 - __builtin_clzl(n);
}

/**
 * Provides information on the supremum and infimum of a given numeric type.
 */
template <typename T>
struct NumberRange {
    using limits = std::numeric_limits<T>;

    static constexpr T inf() noexcept {
        return limits::has_infinity ? -limits::infinity() : limits::lowest();
    }

    static constexpr T sup() noexcept {
        return limits::has_infinity ? limits::infinity() : limits::max();
    }
};

template <class Rng1, class Rng2>
void append(Rng1 &&r1, Rng2 &&r2) {
    ranges::insert(std::forward<Rng1>(r1), r1.end(), std::forward<Rng2>(r2));
}

template <class T, class = void>
struct IsStreamable : std::false_type {};

template <class T>
struct IsStreamable<T, std::void_t<decltype(std::declval<std::ostream &>()
                                            << std::declval<const T &>())>>
    : std::true_type {};

/**
 * Renders v with its operator<< and cuts the result down to at most
 * max_len bytes followed by an ellipsis, never splitting a UTF-8 sequence.
 */
template <class T>
std::string repr(const T &v, std::size_t max_len) {
    std::string s;
    if constexpr (IsStreamable<T>::value) {
        std::ostringstream os;
        os << std::boolalpha << v;
        s = os.str();
    } else {
        s = "<unprintable>";
    }

    if (s.size() > max_len) {
        // back off to the start of a UTF-8 sequence
        std::size_t cut = max_len;
        auto continuation = [&s](std::size_t i) {
            return (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80;
        };
        while (cut > 0 && continuation(cut)) --cut;
        s.resize(cut);
        s += "…";
    }
    return s;
}

} // namespace vheap::detail
