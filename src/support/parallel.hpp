// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for portability between OpenMP and sequential execution
 *
 * Usage:
 *   VOLSCAN_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * Parallel loops write per-iteration output slots and update shared counters
 * through VOLSCAN_PRAGMA_ATOMIC, so sequential builds produce identical results.
 */

#if defined(_OPENMP)
    #define VOLSCAN_PRAGMA_PARALLEL_FOR         _Pragma("omp parallel for")
    #define VOLSCAN_PRAGMA_PARALLEL_FOR_DYNAMIC _Pragma("omp parallel for schedule(dynamic, 1)")
    #define VOLSCAN_PRAGMA_ATOMIC               _Pragma("omp atomic")
#else
    // Sequential execution (no parallelization)
    #define VOLSCAN_PRAGMA_PARALLEL_FOR
    #define VOLSCAN_PRAGMA_PARALLEL_FOR_DYNAMIC
    #define VOLSCAN_PRAGMA_ATOMIC
#endif

/**
 * Available macros:
 * - VOLSCAN_PRAGMA_PARALLEL_FOR: Parallelize single loop (static schedule)
 * - VOLSCAN_PRAGMA_PARALLEL_FOR_DYNAMIC: Parallelize a loop with uneven
 *   per-iteration cost (e.g. per-symbol chains of different sizes)
 * - VOLSCAN_PRAGMA_ATOMIC: Atomic operation (increment, etc.)
 */
