#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <random>
#include <string>

#include <tlx/die.hpp>

//! The heap item used by all workloads. vheap orders it by its key member.
template <typename K, typename V = std::uint32_t>
struct Item {
    K key;
    V value;

    Item() : Item<K, V>(0, 0) {}
    Item(K key, V value) : key(key), value(value) {}

    constexpr bool operator>(const Item<K, V> &b) const noexcept {
        return key > b.key;
    }
    constexpr bool operator==(const Item<K, V> &b) const noexcept {
        return key == b.key && value == b.value;
    }

    friend std::ostream &operator<<(std::ostream &os, const Item<K, V> &i) {
        return os << i.key << ":" << i.value;
    }
};

using IntItem = Item<std::uint32_t>;
using FloatItem = Item<float>;

template <typename HeapType>
class BaseDriver {
protected:
    using item_type = typename HeapType::value_type;
    using key_type = decltype(item_type::key);

    HeapType heap_;
    std::minstd_rand rand_engine_;

    void push_key(key_type key) {
        heap_.push(item_type(key, static_cast<std::uint32_t>(heap_.size())));
    }

public:
    using heap_type = HeapType;

    BaseDriver() : rand_engine_(42) {}
    size_t size() const noexcept { return heap_.size(); }
    bool empty() const noexcept { return heap_.empty(); }
    key_type top_key() const { return heap_.top().key; }
    void pop() { heap_.pop(); }
};

//! Uniform keys over the generator's full range
template <template <class> class HeapTemplate>
class RandomDriver : public BaseDriver<HeapTemplate<IntItem>> {
    using key_limits = std::numeric_limits<std::uint32_t>;
    using RNE = std::minstd_rand;
    static_assert(key_limits::min() <= RNE::min());
    static_assert(key_limits::max() >= RNE::max());

public:
    static auto name() { return "random"; }

    void push() { this->push_key(this->rand_engine_()); }
};

//! Keys from a handful of values, so most comparisons are ties
template <template <class> class HeapTemplate>
class DuplicateDriver : public BaseDriver<HeapTemplate<IntItem>> {
    std::uniform_int_distribution<std::uint32_t> key_dist_{0, 15};

public:
    static auto name() { return "duplicates"; }

    void push() { this->push_key(key_dist_(this->rand_engine_)); }
};

//! Never pushes below the last popped key, like an event simulation
template <template <class> class HeapTemplate>
class MonotoneDriver : public BaseDriver<HeapTemplate<FloatItem>> {
    float max_deleted_key_{0};
    std::exponential_distribution<float> incr_dist_;

public:
    static auto name() { return "monotone"; }

    void push() {
        this->push_key(max_deleted_key_ + incr_dist_(this->rand_engine_));
    }

    void pop() {
        max_deleted_key_ = this->top_key();
        this->heap_.pop();
    }
};

//! Fills the heap with S push/pop pairs between inserts, then empties it
template <unsigned S, template <template <typename> class> class Driver>
struct Wiggle {
    static constexpr unsigned wiggle_count = S;

    template <template <typename> class HeapType>
    class type {
        using DriverType = Driver<HeapType>;

    public:
        using subject_type = typename DriverType::heap_type;

        static auto name() {
            return "heap_wiggle_" + std::to_string(wiggle_count) + "_" +
                   DriverType::name();
        }

        void run(size_t items) {
            DriverType heap;

            for (size_t i = 0; i < items; i++) {
                for (size_t j = 0; j < wiggle_count; j++) {
                    heap.push();
                    heap.pop();
                }
                heap.push();
            }
            die_unless(heap.size() == items);

            for (size_t i = 0; i < items; i++) {
                heap.pop();
                for (size_t j = 0; j < wiggle_count; j++) {
                    heap.push();
                    heap.pop();
                }
            }
            die_unless(heap.empty());
        }
    };
};

//! Pushes every item, then pops them all and checks they come out sorted
template <template <template <typename> class> class Driver>
struct Sort {
    template <template <typename> class HeapType>
    class type {
        using DriverType = Driver<HeapType>;

    public:
        using subject_type = typename DriverType::heap_type;

        static auto name() {
            return "heap_sort_" + std::string(DriverType::name());
        }

        void run(size_t items) {
            if (items == 0) return;
            DriverType heap;
            for (size_t i = 0; i < items; i++) heap.push();

            auto prev = heap.top_key();
            while (!heap.empty()) {
                const auto key = heap.top_key();
                die_unless(!(key < prev));
                prev = key;
                heap.pop();
            }
        }
    };
};
