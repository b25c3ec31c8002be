#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <vheap/vheap.hpp>

template <typename T>
struct VHeapCfg : vheap::DefaultCfg {
    using Item = T;
};

template <typename T>
class VHeap : public vheap::Heap<VHeapCfg<T>> {
    using Base = vheap::Heap<VHeapCfg<T>>;

public:
    using value_type = T;

    using Base::Base;

    static auto name() { return "vheap"; }

    T top() const { return *this->peek(); }
};

//! Observer that only counts, to measure the cost of rendering events
class CountingObserver : public vheap::Observer {
public:
    void onEvent(std::string_view, const vheap::Attributes &attrs) override {
        ++events;
        attributes += attrs.size();
    }

    std::uint64_t events = 0;
    std::uint64_t attributes = 0;
};

template <typename T>
class ObservedVHeap : public VHeap<T> {
    CountingObserver counter_;

public:
    ObservedVHeap() { this->setObserver(&counter_); }
    ObservedVHeap(const ObservedVHeap &) = delete;
    ObservedVHeap &operator=(const ObservedVHeap &) = delete;

    static auto name() { return "vheap_observed"; }
};

template <typename T>
class VerifiedVHeap : public VHeap<T> {
public:
    static constexpr std::size_t kSampleRate = 64;

    VerifiedVHeap()
        : VHeap<T>(vheap::Options{vheap::Mode::Min, vheap::NanPolicy::Raise,
                                  kSampleRate}) {}

    static auto name() { return "vheap_verified"; }
};
