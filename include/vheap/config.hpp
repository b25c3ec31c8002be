#pragma once

#include "util.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace vheap {

class Observer;

enum class Mode { Min, Max };

// How a NaN key is treated before it is compared
enum class NanPolicy { Raise, CoerceToMin, CoerceToMax };

constexpr Mode flipped(Mode m) noexcept {
    return m == Mode::Min ? Mode::Max : Mode::Min;
}

constexpr const char *toString(Mode m) noexcept {
    return m == Mode::Min ? "min" : "max";
}

constexpr const char *toString(NanPolicy p) noexcept {
    switch (p) {
    case NanPolicy::Raise: return "raise";
    case NanPolicy::CoerceToMin: return "min";
    case NanPolicy::CoerceToMax: return "max";
    }
    return "?";
}

inline std::ostream &operator<<(std::ostream &os, Mode m) {
    return os << toString(m);
}

inline std::ostream &operator<<(std::ostream &os, NanPolicy p) {
    return os << toString(p);
}

struct DefaultCfg {
    // should be a signed integer to avoid unsigned arithmetic pitfalls
    using Index = std::ptrdiff_t;

    using Item = double;

    // Rendered values longer than this are cut in notifications
    static constexpr std::size_t kMaxReprLength = 200;
};

/**
 * Runtime settings of a heap. The observer is not owned and must outlive
 * the heap or be detached before it dies.
 */
struct Options {
    Mode mode = Mode::Min;
    NanPolicy nanPolicy = NanPolicy::Raise;
    std::size_t verifySampleRate = 0;
    Observer *observer = nullptr;
};

namespace detail {

template <class Item, class Enable = void>
struct HasKeyMember : std::false_type {};

template <class Item>
struct HasKeyMember<Item, std::void_t<decltype(std::declval<Item>().key)>>
    : std::true_type {};

// Default GetKey functor for arithmetic Item, Item::key or Item itself
struct GetKey {
    template <class Item>
    constexpr decltype(auto) operator()(const Item &item) const {
        if constexpr (std::is_arithmetic_v<Item> || !HasKeyMember<Item>::value) {
            return item;
        } else {
            // W/out the parens here, decltype(auto) resolves to Key
            return (item.key);
        }
    }

    constexpr bool operator==(const GetKey &) const noexcept { return true; }
};

// Use user-provided GetKey functor
template <class Cfg, class Enable = void>
struct KeyFn {
    using type = GetKey;
};

template <class Cfg>
struct KeyFn<Cfg, std::void_t<typename Cfg::GetKey>> {
    using type = typename Cfg::GetKey;
};

template <class F, class Enable = void>
struct IsEqualityComparable : std::false_type {};

template <class F>
struct IsEqualityComparable<
    F, std::void_t<decltype(std::declval<const F &>() ==
                            std::declval<const F &>())>> : std::true_type {};

/**
 * Two key functors project alike if they compare equal. Functors without
 * operator== are stateless by contract and always match.
 */
template <class F>
bool sameKeyFn(const F &a, const F &b) {
    if constexpr (IsEqualityComparable<F>::value) {
        return static_cast<bool>(a == b);
    } else {
        return true;
    }
}

/**
 * Extends user-config Base with derived values.
 *
 * Base should be derived from DefaultCfg to provide defaults.
 */
template <class Base = DefaultCfg>
struct ExtendedCfg : Base {
    using typename Base::Index;
    using typename Base::Item;

    using GetKey = typename KeyFn<Base>::type;
    using Key = std::decay_t<
        std::invoke_result_t<const GetKey &, const Item &>>;
    using KeyRange = NumberRange<Key>;

    using Base::kMaxReprLength;

    static_assert(std::is_signed_v<Index>);
    static_assert(kMaxReprLength > 0);
};

} // namespace detail

} // namespace vheap
