// include/padist/config.hpp — Named tuning constants shared by both representations.

#pragma once

#include <cstddef>
#include <cstdint>

namespace padist::config {

    // Bounded entries are kept inside (underflow_threshold, overflow_threshold) so that a
    // product of two entries, or seven sums of such products, fits in an int64_t.
    inline constexpr std::int64_t overflow_threshold = std::int64_t{1}
                                                       << (4 * sizeof(std::int64_t) - 1);
    inline constexpr std::int64_t underflow_threshold = -overflow_threshold;

    // A space uses the bounded representation only when
    // bounded_modulus_factor * p^cap < bounded_modulus_limit.
    inline constexpr std::int64_t bounded_modulus_factor = 7;
    inline constexpr std::int64_t bounded_modulus_limit = overflow_threshold;
    inline constexpr std::size_t bounded_max_moments = 100;

    // Sentinel ordp of the canonical zero distribution; also the precision of exact scalars.
    inline constexpr long infinite_ordp = (1L << (sizeof(long) * 8 - 2)) - 1;
    inline constexpr long infinite_precision = infinite_ordp;

    // Acting matrices are recomputed at cache_growth_factor times the cached precision.
    inline constexpr std::size_t cache_growth_factor = 2;

    inline constexpr long default_precision_cap = 20;

} // namespace padist::config
