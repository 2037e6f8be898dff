// include/padist/core/arith.hpp — Integer and rational helpers for p-adic bookkeeping.

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

#include <gmpxx.h>

#include <padist/config.hpp>

namespace padist::core {

    // p-adic valuation; config::infinite_ordp for zero.
    long valuation(const mpz_class &value, long p);
    long valuation(const mpq_class &value, long p);
    long valuation(std::int64_t value, long p);

    // Splits a nonzero rational as p^v * u with u a p-unit.
    std::pair<long, mpq_class> val_unit(const mpq_class &value, long p);

    bool is_p_integral(const mpq_class &value, long p);

    // p^exponent for exponent >= 0, served from a per-thread cache.
    const mpz_class &prime_power(long p, long exponent);
    std::int64_t small_prime_power(long p, long exponent);

    // Canonical residue in [0, modulus).
    mpz_class residue(const mpz_class &value, const mpz_class &modulus);
    std::int64_t residue(std::int64_t value, std::int64_t modulus) noexcept;

    // Residue of a p-integral rational modulo p^exponent; throws value_error when p divides
    // the denominator.
    mpz_class residue(const mpq_class &value, long p, long exponent);

    mpz_class inverse_mod(const mpz_class &value, const mpz_class &modulus);
    std::int64_t inverse_mod(std::int64_t value, std::int64_t modulus);

    mpz_class binomial(unsigned long n, unsigned long k);

    // Bernoulli numbers with B_1 = -1/2.
    const mpq_class &bernoulli(std::size_t index);

    mpz_class gcd(const mpz_class &lhs, const mpz_class &rhs);
    long lcm(long lhs, long rhs);

    inline long saturating_add(long lhs, long rhs) noexcept {
        if (lhs >= config::infinite_ordp || rhs >= config::infinite_ordp) {
            return config::infinite_ordp;
        }
        return lhs + rhs;
    }

    inline bool is_infinite(long value) noexcept {
        return value >= config::infinite_ordp;
    }

} // namespace padist::core
