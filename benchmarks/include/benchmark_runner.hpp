#pragma once

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include <tlx/timestamp.hpp>

template <class Benchmark>
class BenchmarkRunner {
    using Subject = typename Benchmark::subject_type;

    const size_t min_items, max_items;

    // Seconds a batch has to take before its time is reported
    const double min_batch_time;

    // The number of items to be processed in one benchmark batch
    size_t batch_size = min_items;

    struct Result {
        const size_t run_size, num_runs;
        const double time;

        friend std::ostream &operator<<(std::ostream &os, const Result &r) {
            // clang-format off
            return os << "RESULT"
                << " container=" << Subject::name()
                << " op=" << Benchmark::name()
                << " items=" << r.run_size
                << " repeat=" << r.num_runs
                << std::fixed << std::setprecision(10)
                << " time_total=" << r.time
                << " time=" << r.time / static_cast<double>(r.num_runs);
            // clang-format on
        }
    };

    // Repeat benchmark runs of given size until enough time elapsed
    Result run_until_stable(size_t run_size) {
        batch_size = std::max(batch_size, run_size);
        double time;
        while ((time = run_batch(run_size)) < min_batch_time) {
            batch_size *= 2;
        }
        return {run_size, batch_size / run_size, time};
    }

    // Run a batch of benchmark runs of given size and return total time
    double run_batch(size_t run_size) {
        size_t num_runs = batch_size / run_size;
        Benchmark benchmark;

        double ts1 = tlx::timestamp();
        for (size_t r = 0; r < num_runs; ++r) {
            benchmark.run(run_size);
        }
        double ts2 = tlx::timestamp();

        return ts2 - ts1;
    }

public:
    BenchmarkRunner(size_t min_items, size_t max_items,
                    double min_batch_time = 1.0)
        : min_items(min_items), max_items(max_items),
          min_batch_time(min_batch_time) {}

    void run_benchmark() {
        std::cout << "Benchmark " << Subject::name() << " " << Benchmark::name()
                  << " " << min_items << ".." << max_items << "\n";

        for (size_t items = min_items; items <= max_items; items *= 2) {
            std::cout << run_until_stable(items) << std::endl;
        }
    }
};
