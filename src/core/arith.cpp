// src/core/arith.cpp — Valuations, residues and Bernoulli numbers over GMP.

#include <padist/core/arith.hpp>

#include <deque>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <padist/errors.hpp>

namespace padist::core {

    namespace {

        void require_prime(long p) {
            if (p < 2) {
                throw value_error("a prime p >= 2 is required, got " + std::to_string(p));
            }
        }

        std::deque<mpz_class> &power_cache_for(long p) {
            thread_local std::unordered_map<long, std::deque<mpz_class>> cache_by_prime;
            auto it = cache_by_prime.try_emplace(p, std::deque<mpz_class>{mpz_class(1)}).first;
            return it->second;
        }

        class bernoulli_table {
          public:
            const mpq_class &at(std::size_t index) {
                std::lock_guard<std::mutex> lock(mutex_);
                ensure_size(index + 1);
                return values_[index];
            }

          private:
            // B_m = -1/(m+1) * sum_{j<m} C(m+1, j) B_j
            void ensure_size(std::size_t count) {
                if (values_.empty()) {
                    values_.emplace_back(1);
                }
                while (values_.size() < count) {
                    const std::size_t m = values_.size();
                    mpq_class sum(0);
                    for (std::size_t j = 0; j < m; ++j) {
                        sum += mpq_class(binomial(m + 1, j)) * values_[j];
                    }
                    mpq_class next = -sum / mpq_class(static_cast<long>(m + 1));
                    next.canonicalize();
                    values_.push_back(std::move(next));
                }
            }

            std::mutex mutex_;
            std::deque<mpq_class> values_;
        };

    } // namespace

    long valuation(const mpz_class &value, long p) {
        require_prime(p);
        if (value == 0) {
            return config::infinite_ordp;
        }
        mpz_class unit;
        const mpz_class prime(p);
        return static_cast<long>(mpz_remove(unit.get_mpz_t(), value.get_mpz_t(), prime.get_mpz_t()));
    }

    long valuation(const mpq_class &value, long p) {
        if (value == 0) {
            return config::infinite_ordp;
        }
        return valuation(mpz_class(value.get_num()), p) - valuation(mpz_class(value.get_den()), p);
    }

    long valuation(std::int64_t value, long p) {
        require_prime(p);
        if (value == 0) {
            return config::infinite_ordp;
        }
        long count = 0;
        while (value % p == 0) {
            value /= p;
            ++count;
        }
        return count;
    }

    std::pair<long, mpq_class> val_unit(const mpq_class &value, long p) {
        if (value == 0) {
            throw value_error("val_unit of zero");
        }
        require_prime(p);
        const mpz_class prime(p);
        mpz_class num;
        mpz_class den;
        const long num_val = static_cast<long>(
            mpz_remove(num.get_mpz_t(), value.get_num_mpz_t(), prime.get_mpz_t()));
        const long den_val = static_cast<long>(
            mpz_remove(den.get_mpz_t(), value.get_den_mpz_t(), prime.get_mpz_t()));
        mpq_class unit(num, den);
        unit.canonicalize();
        return {num_val - den_val, unit};
    }

    bool is_p_integral(const mpq_class &value, long p) {
        require_prime(p);
        return mpz_divisible_ui_p(value.get_den_mpz_t(), static_cast<unsigned long>(p)) == 0;
    }

    const mpz_class &prime_power(long p, long exponent) {
        if (exponent < 0) {
            throw std::invalid_argument("prime_power requires a non-negative exponent");
        }
        require_prime(p);
        auto &cache = power_cache_for(p);
        while (static_cast<std::size_t>(exponent) >= cache.size()) {
            cache.push_back(cache.back() * p);
        }
        return cache[static_cast<std::size_t>(exponent)];
    }

    std::int64_t small_prime_power(long p, long exponent) {
        const mpz_class &value = prime_power(p, exponent);
        if (!value.fits_slong_p()) {
            throw std::overflow_error("p^" + std::to_string(exponent) + " does not fit in int64_t");
        }
        return static_cast<std::int64_t>(value.get_si());
    }

    mpz_class residue(const mpz_class &value, const mpz_class &modulus) {
        if (modulus <= 0) {
            throw std::invalid_argument("modulus must be positive");
        }
        mpz_class result;
        mpz_fdiv_r(result.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t());
        return result;
    }

    std::int64_t residue(std::int64_t value, std::int64_t modulus) noexcept {
        std::int64_t result = value % modulus;
        if (result < 0) {
            result += modulus;
        }
        return result;
    }

    mpz_class residue(const mpq_class &value, long p, long exponent) {
        if (exponent <= 0) {
            return mpz_class(0);
        }
        const mpz_class &modulus = prime_power(p, exponent);
        if (value.get_den() == 1) {
            return residue(mpz_class(value.get_num()), modulus);
        }
        if (!is_p_integral(value, p)) {
            throw value_error("rational " + value.get_str() + " is not " + std::to_string(p) +
                              "-integral");
        }
        const mpz_class den_inverse = inverse_mod(mpz_class(value.get_den()), modulus);
        return residue(mpz_class(value.get_num() * den_inverse), modulus);
    }

    mpz_class inverse_mod(const mpz_class &value, const mpz_class &modulus) {
        if (modulus <= 0) {
            throw std::invalid_argument("modulus must be positive");
        }
        if (modulus == 1) {
            return mpz_class(0);
        }
        mpz_class result;
        if (mpz_invert(result.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t()) == 0) {
            throw value_error("value not invertible modulo " + modulus.get_str());
        }
        return result;
    }

    std::int64_t inverse_mod(std::int64_t value, std::int64_t modulus) {
        if (modulus <= 0) {
            throw std::invalid_argument("modulus must be positive");
        }
        std::int64_t r0 = modulus;
        std::int64_t r1 = residue(value, modulus);
        std::int64_t t0 = 0;
        std::int64_t t1 = 1;
        while (r1 != 0) {
            const std::int64_t q = r0 / r1;
            const std::int64_t r2 = r0 - q * r1;
            r0 = r1;
            r1 = r2;
            const std::int64_t t2 = t0 - q * t1;
            t0 = t1;
            t1 = t2;
        }
        if (r0 != 1) {
            throw value_error("value not invertible modulo " + std::to_string(modulus));
        }
        return residue(t0, modulus);
    }

    mpz_class binomial(unsigned long n, unsigned long k) {
        mpz_class result;
        mpz_bin_uiui(result.get_mpz_t(), n, k);
        return result;
    }

    const mpq_class &bernoulli(std::size_t index) {
        static bernoulli_table table;
        return table.at(index);
    }

    mpz_class gcd(const mpz_class &lhs, const mpz_class &rhs) {
        mpz_class result;
        mpz_gcd(result.get_mpz_t(), lhs.get_mpz_t(), rhs.get_mpz_t());
        return result;
    }

    long lcm(long lhs, long rhs) {
        if (lhs == 0 || rhs == 0) {
            return 0;
        }
        return std::lcm(lhs, rhs);
    }

} // namespace padist::core
