#pragma once

/**
 * Thread Coordination Utility
 *
 * OpenMP and TBB share the same OS threads, so both are capped at one
 * common budget.
 *
 * - OpenMP: row-parallel loops (trace generation, LDE, hashing, quotient rows)
 * - TBB: per-AIR task parallelism (quotient and OOD evaluation per AIR)
 *
 * If OMP_NUM_THREADS is set it is the budget, otherwise half of the
 * logical core count.
 */

#include <cstdlib>
#include <thread>
#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

#ifdef ZKRV_USE_TBB
#include <tbb/global_control.h>
#endif

namespace zkrv::parallel {

inline int get_optimal_thread_count() {
    const char* omp_threads = std::getenv("OMP_NUM_THREADS");
    if (omp_threads) {
        int count = std::atoi(omp_threads);
        if (count > 0) {
            return count;
        }
    }

    // Physical cores, assuming 2-way SMT
    unsigned int hw_threads = std::thread::hardware_concurrency();
    return std::max(1, static_cast<int>(hw_threads / 2));
}

/**
 * Initialize thread coordination for all parallel libraries.
 * Call once at program startup; later calls are no-ops for TBB.
 */
inline void initialize_thread_coordination() {
    int thread_count = get_optimal_thread_count();

#ifdef _OPENMP
    omp_set_num_threads(thread_count);
#endif

#ifdef ZKRV_USE_TBB
    static tbb::global_control tbb_control(
        tbb::global_control::max_allowed_parallelism,
        static_cast<size_t>(thread_count)
    );
#endif
}

inline int get_current_thread_count() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return get_optimal_thread_count();
#endif
}

} // namespace zkrv::parallel
