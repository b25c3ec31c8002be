#pragma once

#include "errors.hpp"
#include "util.hpp"

#include <cstdint>

namespace vheap::detail {

/**
 * Marks a heap as busy for the lifetime of a mutating operation.
 *
 * Acquisition fails with ReentrantMutation if the heap is already busy,
 * which happens when an observer calls back into the heap. Every release,
 * successful or not, counts as one completed operation. Releasing early
 * or twice is fine, only the first release counts.
 */
class MutationGuard {
public:
    MutationGuard(bool &busy, std::uint64_t &ops, const char *op)
        : busy_(busy), ops_(ops) {
        if (busy_) {
            VHEAP_TRACE << "event=reentrant_mutation op=" << op << "\n";
            throw ReentrantMutation(op);
        }
        busy_ = true;
        held_ = true;
    }

    ~MutationGuard() { release(); }

    void release() {
        if (!held_) return;
        held_ = false;
        busy_ = false;
        ++ops_;
    }

    MutationGuard(const MutationGuard &) = delete;
    MutationGuard &operator=(const MutationGuard &) = delete;

private:
    bool &busy_;
    std::uint64_t &ops_;
    bool held_ = false;
};

} // namespace vheap::detail
