#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cmath>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

namespace vheap::detail {

/**
 * The preference predicate of a heap: projects items to keys, normalizes
 * NaN keys according to the policy and orders them according to the mode.
 */
template <class Cfg>
class Comparator {
    using Item = typename Cfg::Item;
    using Key = typename Cfg::Key;
    using KeyRange = typename Cfg::KeyRange;
    using GetKey = typename Cfg::GetKey;

public:
    explicit Comparator(Mode mode, NanPolicy nan_policy, GetKey get_key = {})
        : mode_(mode), nan_policy_(nan_policy), get_key_(std::move(get_key)) {}

    Mode mode() const { return mode_; }
    void setMode(Mode mode) { mode_ = mode; }

    NanPolicy nanPolicy() const { return nan_policy_; }

    const GetKey &getKey() const { return get_key_; }

    bool compatibleWith(const Comparator &other) const {
        return mode_ == other.mode_ && nan_policy_ == other.nan_policy_ &&
               sameKeyFn(get_key_, other.get_key_);
    }

    Key normalize(Key k) const {
        if constexpr (std::is_floating_point_v<Key>) {
            if (std::isnan(k)) {
                switch (nan_policy_) {
                case NanPolicy::Raise:
                    throw InvalidKey(
                        "NaN key is not allowed (nan_policy=raise)");
                case NanPolicy::CoerceToMin: return KeyRange::inf();
                case NanPolicy::CoerceToMax: return KeyRange::sup();
                }
            }
        }
        return k;
    }

    Key computeKey(const Item &a) const { return normalize(project(a)); }

    // true iff a belongs above b
    bool prefer(const Item &a, const Item &b) const {
        const Key ka = computeKey(a);
        const Key kb = computeKey(b);
        return mode_ == Mode::Min ? ka < kb : kb < ka;
    }

private:
    Key project(const Item &a) const {
        try {
            return get_key_(a);
        } catch (const InvalidKey &) {
            throw;
        } catch (const std::exception &e) {
            std::throw_with_nested(
                InvalidKey("key() failed for " +
                           repr(a, Cfg::kMaxReprLength) + ": " + e.what()));
        } catch (...) {
            std::throw_with_nested(
                InvalidKey("key() failed for " +
                           repr(a, Cfg::kMaxReprLength) +
                           ": unknown exception"));
        }
    }

    Mode mode_;
    NanPolicy nan_policy_;
    GetKey get_key_;
};

} // namespace vheap::detail
