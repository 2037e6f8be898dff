// include/padist/util/random.hpp — Random moments and matrices for tests and benchmarks.

#pragma once

#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

#include <gmpxx.h>

#include <padist/core/arith.hpp>
#include <padist/core/matrix2.hpp>

namespace padist::util {

    // Uniform in [0, bound), seeded from the caller's generator.
    inline mpz_class random_below(std::mt19937_64 &generator, const mpz_class &bound) {
        gmp_randclass state(gmp_randinit_default);
        state.seed(static_cast<unsigned long>(generator()));
        return state.get_z_range(bound);
    }

    // Moment i uniform modulo p^(count - i).
    inline std::vector<mpq_class> random_moments(std::mt19937_64 &generator, long p, long count) {
        std::vector<mpq_class> moments;
        moments.reserve(static_cast<std::size_t>(count));
        for (long i = 0; i < count; ++i) {
            moments.emplace_back(random_below(generator, core::prime_power(p, count - i)));
        }
        return moments;
    }

    inline std::vector<mpq_class> random_integers(std::mt19937_64 &generator, long count,
                                                  long bound) {
        std::uniform_int_distribution<long> dist(-bound, bound);
        std::vector<mpq_class> values;
        values.reserve(static_cast<std::size_t>(count));
        for (long i = 0; i < count; ++i) {
            values.emplace_back(dist(generator));
        }
        return values;
    }

    // [a b; c d] with gcd(a, level) = 1, level | c and det != 0; entries bounded by bound.
    inline core::matrix2 random_sigma0_matrix(std::mt19937_64 &generator, long level,
                                              std::int64_t bound) {
        std::uniform_int_distribution<std::int64_t> dist(-bound, bound);
        while (true) {
            const std::int64_t a = dist(generator);
            if (a == 0 || std::gcd(a, static_cast<std::int64_t>(level)) != 1) {
                continue;
            }
            const core::matrix2 g(a, dist(generator), level * dist(generator), dist(generator));
            if (g.determinant() != 0) {
                return g;
            }
        }
    }

} // namespace padist::util
