// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Usage:
 *   COVENANT_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * Loop bodies must not share mutable state: every iteration works on its own
 * market snapshot and writes only its own output slot.
 */

#if defined(_OPENMP)
    #define COVENANT_PRAGMA_PARALLEL_FOR        _Pragma("omp parallel for")
    #define COVENANT_PRAGMA_PARALLEL_FOR_DYNAMIC _Pragma("omp parallel for schedule(dynamic, 1)")
#else
    #define COVENANT_PRAGMA_PARALLEL_FOR
    #define COVENANT_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif
