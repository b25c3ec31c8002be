#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <string>

#include "benchmark_runner.hpp"
#include "subjects/StdQueue.hpp"
#include "subjects/VHeap.hpp"
#include "workloads.hpp"

template <template <class> class HeapTemplate>
using RandomWiggle = Wiggle<1, RandomDriver>::type<HeapTemplate>;

template <template <class> class HeapTemplate>
using MonotoneWiggle = Wiggle<1, MonotoneDriver>::type<HeapTemplate>;

template <template <class> class HeapTemplate>
using RandomSort = Sort<RandomDriver>::type<HeapTemplate>;

template <template <class> class HeapTemplate>
using DuplicateSort = Sort<DuplicateDriver>::type<HeapTemplate>;

template <template <template <class> class> class Workload>
void run_all(size_t min_items, size_t max_items, double min_time) {
    BenchmarkRunner<Workload<StdQueue>>(min_items, max_items, min_time)
        .run_benchmark();
    BenchmarkRunner<Workload<VHeap>>(min_items, max_items, min_time)
        .run_benchmark();
    BenchmarkRunner<Workload<VerifiedVHeap>>(min_items, max_items, min_time)
        .run_benchmark();
    BenchmarkRunner<Workload<ObservedVHeap>>(min_items, max_items, min_time)
        .run_benchmark();
}

int main(int argc, char *argv[]) {
    if (argc > 4) {
        std::cerr << "usage: " << argv[0]
                  << " [min_items] [max_items] [min_batch_seconds]\n";
        return EXIT_FAILURE;
    }

    const size_t min_items = argc > 1 ? std::stoul(argv[1]) : 125;
    const size_t max_items = argc > 2 ? std::stoul(argv[2]) : 1024000;
    const double min_time = argc > 3 ? std::stod(argv[3]) : 1.0;

    run_all<RandomWiggle>(min_items, max_items, min_time);
    run_all<MonotoneWiggle>(min_items, max_items, min_time);
    run_all<RandomSort>(min_items, max_items, min_time);
    run_all<DuplicateSort>(min_items, max_items, min_time);
}
