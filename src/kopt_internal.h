#pragma once

#include "libkopt.h"

#include <cstddef>
#include <limits>

#ifndef WIN32
#define FORCE_INLINE __attribute__((always_inline)) inline
#else
#define FORCE_INLINE inline __forceinline
#endif

namespace kopt {
    using ::cost_t;

    /// Represents a zero-based node index into the cost matrix
    typedef std::ptrdiff_t node_idx;

    /// Represents a position in the tour array
    typedef std::ptrdiff_t tour_pos;

    constexpr cost_t COST_POSITIVE_INFINITY = std::numeric_limits<cost_t>::infinity();

    /// Gains at or below this threshold are treated as numerical noise and never applied.
    constexpr cost_t MIN_IMPROVEMENT_GAIN = 1e-9;
} // namespace kopt
