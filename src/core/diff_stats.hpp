#pragma once

#include <cstdint>

namespace core {

struct DiffStats {
    std::uint64_t comparisons{0};          // compare() calls that ran to completion or aborted
    std::uint64_t positions_visited{0};    // positions that passed the depth/validity/type guards
    std::uint64_t leaves_compared{0};      // scalar equality checks
    std::uint64_t differences_recorded{0}; // insertions accepted by the filters, overwrites included
    std::uint64_t differences_filtered{0}; // insertions dropped by include/exclude patterns
};

} // namespace core
