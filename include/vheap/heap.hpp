#pragma once

#include "comparator.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "guard.hpp"
#include "observer.hpp"
#include "util.hpp"

#include <range/v3/algorithm/sort.hpp>
#include <range/v3/core.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/indices.hpp>
#include <range/v3/view/move.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace vheap {

struct Stats {
    std::size_t size = 0;
    int depth = 0;
    Mode mode = Mode::Min;
    bool valid = true;
    bool perfect = true;
    std::uint64_t operations = 0;
};

inline std::ostream &operator<<(std::ostream &os, const Stats &s) {
    return os << std::boolalpha << "size=" << s.size << " depth=" << s.depth
              << " mode=" << s.mode << " valid=" << s.valid
              << " perfect=" << s.perfect << " operations=" << s.operations;
}

namespace detail {

/**
 * Array-backed binary heap that reports every structural step to an
 * observer, checks itself every verifySampleRate operations and rolls
 * back any mutation that fails half-way.
 */
template <class Cfg>
class Heap {
    using Index = typename Cfg::Index;
    using GetKey = typename Cfg::GetKey;
    using Comparator = ::vheap::detail::Comparator<Cfg>;
    using Notifier = ::vheap::detail::Notifier<Cfg>;

public:
    using Item = typename Cfg::Item;
    using Key = typename Cfg::Key;
    using Buffer = std::vector<Item>;

    explicit Heap(Options opts = {}, GetKey get_key = {})
        : cmp_(opts.mode, opts.nanPolicy, std::move(get_key)),
          notify_(opts.observer),
          verify_sample_rate_(opts.verifySampleRate) {}

    template <class Rng, std::enable_if_t<ranges::range<Rng>, int> = 0>
    explicit Heap(Rng &&items, Options opts = {}, GetKey get_key = {})
        : Heap(opts, std::move(get_key)) {
        storage_ = std::forward<Rng>(items) | ranges::to<Buffer>();
        mutate("heapify", [this] { rebuild(); });
    }

    Heap(std::initializer_list<Item> items, Options opts = {},
         GetKey get_key = {})
        : Heap(ranges::make_subrange(items.begin(), items.end()), opts,
               std::move(get_key)) {}

    // A copy shares configuration and contents but neither the observer
    // nor the operation count
    Heap(const Heap &other)
        : cmp_(other.cmp_),
          verify_sample_rate_(other.verify_sample_rate_),
          storage_(other.storage_) {}

    Heap(Heap &&) = default;
    Heap &operator=(Heap &&) = default;
    Heap &operator=(const Heap &) = delete;

    std::size_t size() const { return storage_.size(); }
    bool empty() const { return storage_.empty(); }

    Mode mode() const { return cmp_.mode(); }
    NanPolicy nanPolicy() const { return cmp_.nanPolicy(); }
    const GetKey &getKey() const { return cmp_.getKey(); }

    std::uint64_t operations() const { return ops_; }

    std::size_t verifySampleRate() const { return verify_sample_rate_; }
    void setVerifySampleRate(std::size_t rate) { verify_sample_rate_ = rate; }

    Observer *observer() const { return notify_.observer(); }
    void setObserver(Observer *observer) { notify_.setObserver(observer); }

    //! Swaps the running operation could still undo, zero between operations.
    std::size_t journalSize() const { return journal_.size(); }

    std::optional<Item> peek() const {
        if (storage_.empty()) return std::nullopt;
        return storage_.front();
    }

    Item peek(Item fallback) const {
        return storage_.empty() ? std::move(fallback) : storage_.front();
    }

    // Copy of the storage in tree order
    Buffer toVector() const { return storage_; }

    void push(Item value) {
        mutate("push", [&] {
            try {
                cmp_.computeKey(value);
            } catch (...) {
                notify_("insert_error", arg("value", value),
                        arg("error", describe(std::current_exception())));
                throw;
            }
            notify_("insert_start", arg("value", value));

            const Index idx = ssize(storage_);
            storage_.push_back(std::move(value));
            try {
                notify_("insert", arg("index", idx), arg("value", at(idx)));
                siftUp(idx);
            } catch (...) {
                undoSwaps();
                Item rejected = std::move(storage_.back());
                storage_.pop_back();
                VHEAP_TRACE << "event=rollback op=push size=" << size() << "\n";
                notify_("insert_error", arg("value", rejected),
                        arg("error", describe(std::current_exception())));
                throw;
            }
            notify_("push_done", arg("size", size()));
        });
    }

    std::optional<Item> pop() {
        return mutate("pop", [&]() -> std::optional<Item> {
            if (storage_.empty()) {
                notify_("pop_empty", arg("size", 0));
                return std::nullopt;
            }

            // the root is parked in the last slot until the sift succeeds
            const Index last = ssize(storage_) - 1;
            try {
                notify_("pop_start", arg("size", size()));
                notify_("pop_root", arg("value", at(root())),
                        arg("size", size()));
                if (last > 0) {
                    exchange(root(), last);
                    notify_("move", arg("src", last), arg("dst", root()),
                            arg("value", at(root())));
                    siftDown(root(), last);
                }
            } catch (...) {
                undoSwaps();
                VHEAP_TRACE << "event=rollback op=pop size=" << size() << "\n";
                notify_("pop_error",
                        arg("error", describe(std::current_exception())));
                throw;
            }

            Item item = std::move(storage_.back());
            storage_.pop_back();
            notify_("pop_done", arg("value", item), arg("size", size()));
            return item;
        });
    }

    Item pop(Item fallback) { return pop().value_or(std::move(fallback)); }

    void clear() {
        mutate("clear", [&] {
            const auto count = size();
            storage_.clear();
            notify_("clear", arg("count", count));
        });
    }

    template <class Rng>
    void extend(Rng &&items) {
        auto batch = std::forward<Rng>(items) | ranges::to<Buffer>();
        if (batch.empty()) return;
        if (batch.size() == 1) return push(std::move(batch.front()));

        mutate("extend", [&] {
            withSnapshot("extend", [&] {
                const auto added = batch.size();
                append(storage_, rv::move(batch));
                rebuild();
                notify_("extend", arg("added", added));
            });
        });
    }

    void extend(std::initializer_list<Item> items) {
        extend(ranges::make_subrange(items.begin(), items.end()));
    }

    void heapify() {
        mutate("heapify", [&] { withSnapshot("heapify", [&] { rebuild(); }); });
    }

    void toggleMode() {
        mutate("toggle_mode", [&] {
            withSnapshot("toggle_mode", [&] {
                cmp_.setMode(flipped(cmp_.mode()));
                notify_("toggle_mode", arg("mode", cmp_.mode()));
                rebuild();
            });
        });
    }

    void setMode(Mode mode) {
        mutate("set_mode", [&] {
            if (mode == cmp_.mode()) return;
            withSnapshot("set_mode", [&] {
                cmp_.setMode(mode);
                notify_("set_mode", arg("mode", mode));
                rebuild();
            });
        });
    }

    /**
     * Removes the first element equal to value, or every such element if
     * all is set.
     * @return the number of removed elements
     */
    std::size_t remove(const Item &value, bool all = false) {
        return mutate("remove", [&] {
            return withSnapshot("remove", [&] {
                std::size_t removed = 0;
                Index i = 0;
                while (i < ssize(storage_)) {
                    if (!(at(i) == value)) {
                        ++i;
                        continue;
                    }
                    const Index landed = removeAt(i);
                    ++removed;
                    if (!all) break;
                    // slot i holds a new element now, and the replacement
                    // may have climbed above i
                    i = std::min(i, landed);
                }
                if (removed > 0) {
                    notify_("remove_value", arg("value", value),
                            arg("count", removed));
                }
                return removed;
            });
        });
    }

    /**
     * Same result as push(value) followed by pop(), without growing the
     * storage.
     */
    Item pushPop(Item value) {
        return mutate("pushpop", [&]() -> Item {
            cmp_.computeKey(value);
            // value would come straight back out
            if (storage_.empty() || !cmp_.prefer(at(root()), value)) {
                return value;
            }
            return swapRoot(std::move(value));
        });
    }

    //! Pops the root and pushes value in one step.
    Item replace(Item value) {
        return mutate("replace", [&]() -> Item {
            if (storage_.empty()) {
                throw EmptyHeap("replace() on an empty heap, use push()");
            }
            cmp_.computeKey(value);
            return swapRoot(std::move(value));
        });
    }

    //! Adds copies of all elements of other, which is left untouched.
    void merge(const Heap &other) {
        mutate("merge", [&] {
            if (!cmp_.compatibleWith(other.cmp_)) {
                std::ostringstream os;
                os << "cannot merge a " << mode() << "-heap (nan_policy="
                   << nanPolicy() << ") with a " << other.mode()
                   << "-heap (nan_policy=" << other.nanPolicy() << ")";
                if (!sameKeyFn(getKey(), other.getKey())) {
                    os << ", key functions differ";
                }
                throw IncompatibleHeaps(os.str());
            }
            if (other.empty()) return;

            // copy first, other may be *this
            Buffer incoming = other.storage_;
            withSnapshot("merge", [&] {
                const auto added = incoming.size();
                append(storage_, rv::move(incoming));
                rebuild();
                notify_("merge", arg("added", added));
            });
        });
    }

    //! Pops until empty and returns the items in pop order.
    Buffer drain() {
        Buffer out;
        out.reserve(size());
        while (auto item = pop()) {
            out.push_back(std::move(*item));
        }
        return out;
    }

    //! Up to n items, most preferred first. The heap is not modified.
    Buffer nLargest(std::size_t n) const {
        Buffer sorted = storage_;
        ranges::sort(sorted, [this](const Item &a, const Item &b) {
            return cmp_.prefer(a, b);
        });
        sorted.erase(sorted.begin() + num_cast<Index>(std::min(n, size())),
                     sorted.end());
        return sorted;
    }

    bool isValidHeap() const { return !findViolation(); }

    void assertValid() const {
        const auto violation = findViolation();
        if (!violation) return;

        const auto [p, c] = *violation;
        std::ostringstream os;
        os << "heap broken at parent " << p << ", "
           << (c == left_child(p) ? "left " : "right ") << c << ": "
           << repr(at(p), Cfg::kMaxReprLength) << " vs "
           << repr(at(c), Cfg::kMaxReprLength);
        throw InvariantViolation(os.str());
    }

    int depth() const { return empty() ? 0 : log2_floor(size()) + 1; }

    bool isPerfect() const {
        const auto n = size();
        return (n & (n + 1)) == 0;
    }

    Stats stats() const {
        return {size(), depth(), mode(), isValidHeap(), isPerfect(), ops_};
    }

private:
    static constexpr Index root() { return 0; }
    static Index parent(Index i) { return (i - 1) / 2; }
    static Index left_child(Index i) { return (i << 1) + 1; }

    Item &at(Index i) { return storage_.begin()[i]; }
    const Item &at(Index i) const { return storage_.begin()[i]; }

    /**
     * Runs body as one mutating operation: rejects re-entrant calls,
     * counts the operation and runs the sampled self-check when it ends,
     * whether body succeeded or threw.
     */
    template <class Body>
    decltype(auto) mutate(const char *op, Body &&body) {
        MutationGuard guard{busy_, ops_, op};
        journal_.clear();
        if constexpr (std::is_void_v<std::invoke_result_t<Body &>>) {
            runOrVerify(guard, op, body);
            finish(guard, op);
        } else {
            auto result = runOrVerify(guard, op, body);
            finish(guard, op);
            return result;
        }
    }

    // A failed check replaces the exception of the failed operation
    template <class Body>
    decltype(auto) runOrVerify(MutationGuard &guard, const char *op,
                               Body &body) {
        try {
            return body();
        } catch (...) {
            VHEAP_TRACE << "event=failed op=" << op << " ops=" << ops_ + 1
                        << "\n";
            finish(guard, op);
            throw;
        }
    }

    void finish(MutationGuard &guard, const char *op) {
        journal_.clear();
        guard.release();
        maybeVerify(op);
    }

    void maybeVerify(const char *op) const {
        if (verify_sample_rate_ == 0 || ops_ % verify_sample_rate_ != 0) {
            return;
        }
        VHEAP_TRACE << "event=verify op=" << op << " ops=" << ops_
                    << " size=" << size() << "\n";
        assertValid();
    }

    // Restores storage and mode verbatim if body throws
    template <class Body>
    decltype(auto) withSnapshot(const char *op, Body &&body) {
        Buffer saved = storage_;
        const Mode saved_mode = cmp_.mode();
        try {
            return body();
        } catch (...) {
            storage_ = std::move(saved);
            cmp_.setMode(saved_mode);
            VHEAP_TRACE << "event=rollback op=" << op << " size=" << size()
                        << "\n";
            throw;
        }
    }

    void exchange(Index i, Index j) {
        journal_.emplace_back(i, j);
        using std::swap;
        swap(at(i), at(j));
    }

    // Reverts the swaps of the current operation, newest first
    void undoSwaps() {
        using std::swap;
        for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
            swap(at(it->first), at(it->second));
        }
        journal_.clear();
    }

    void notifyPair(const char *event, Index i, Index j) {
        notify_(event, arg("i", i), arg("j", j), arg("ai", at(i)),
                arg("aj", at(j)));
    }

    //! Moves the element at i up until its parent is preferred-or-equal.
    Index siftUp(Index i) {
        while (i > root()) {
            const Index p = parent(i);
            notifyPair("compare", i, p);
            if (!cmp_.prefer(at(i), at(p))) break;
            notifyPair("swap", i, p);
            exchange(i, p);
            i = p;
        }
        return i;
    }

    //! Moves the element at i down within [0, end).
    Index siftDown(Index i, Index end) {
        while (true) {
            const Index left = left_child(i);
            const Index right = left + 1;
            Index best = i;

            if (left < end) {
                notifyPair("compare", left, best);
                if (cmp_.prefer(at(left), at(best))) best = left;
            }
            if (right < end) {
                notifyPair("compare", right, best);
                if (cmp_.prefer(at(right), at(best))) best = right;
            }
            if (best == i) return i;

            notifyPair("swap", i, best);
            exchange(i, best);
            i = best;
        }
    }

    Index siftDown(Index i) { return siftDown(i, ssize(storage_)); }

    // Linear-time rebuild, sifting down every internal node bottom-up
    void rebuild() {
        const Index n = ssize(storage_);
        for (Index i = n / 2 - 1; i >= root(); --i) {
            siftDown(i, n);
        }
        notify_("heapify_done", arg("size", size()));
    }

    /**
     * Removes the element at index by moving the last element into its
     * slot. The replacement is unrelated to its new neighbourhood, so it
     * may have to travel either way.
     * @return the final index of the replacement
     */
    Index removeAt(Index index) {
        const Index last = ssize(storage_) - 1;
        if (index < root() || index > last) return index;

        notify_("remove_at", arg("index", index), arg("value", at(index)));
        if (index < last) {
            at(index) = std::move(at(last));
            storage_.pop_back();
            notify_("move", arg("src", last), arg("dst", index),
                    arg("value", at(index)));
            const Index up = siftUp(index);
            return up != index ? up : siftDown(index);
        }
        storage_.pop_back();
        return index;
    }

    Item swapRoot(Item value) {
        using std::swap;
        swap(at(root()), value);
        try {
            notify_("replace_root", arg("old", value),
                    arg("value", at(root())));
            siftDown(root());
        } catch (...) {
            undoSwaps();
            swap(at(root()), value);
            VHEAP_TRACE << "event=rollback op=replace_root size=" << size()
                        << "\n";
            throw;
        }
        return value;
    }

    std::optional<std::pair<Index, Index>> findViolation() const {
        const Index n = ssize(storage_);
        for (Index i : rv::indices(n / 2)) {
            const Index left = left_child(i);
            if (cmp_.prefer(at(left), at(i))) return std::pair{i, left};
            if (left + 1 < n && cmp_.prefer(at(left + 1), at(i))) {
                return std::pair{i, left + 1};
            }
        }
        return std::nullopt;
    }

    Comparator cmp_;
    Notifier notify_;
    std::size_t verify_sample_rate_ = 0;
    std::uint64_t ops_ = 0;
    bool busy_ = false;

    Buffer storage_;

    // swaps done by the running operation, for rollback
    std::vector<std::pair<Index, Index>> journal_;
};

template <class Cfg>
std::ostream &operator<<(std::ostream &os, const Heap<Cfg> &h) {
    os << (h.mode() == Mode::Min ? "<MinHeap [" : "<MaxHeap [");
    const auto items = h.toVector();
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) os << ", ";
        os << repr(items[i], Cfg::kMaxReprLength);
    }
    return os << "]>";
}

} // namespace detail

} // namespace vheap
