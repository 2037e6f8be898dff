// include/padist/core/prime_powers.hpp — Table of the powers of p that fit the bounded representation.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <padist/config.hpp>

namespace padist::core {

    // p^0, p^1, ... up to the largest power below config::overflow_threshold.
    class small_powers {
      public:
        explicit small_powers(long prime) : prime_(prime) {
            if (prime_ < 2) {
                throw std::invalid_argument("small_powers requires a prime p >= 2");
            }
            powers_.push_back(1);
            while (powers_.back() <= config::overflow_threshold / prime_) {
                powers_.push_back(powers_.back() * prime_);
            }
        }

        long prime() const noexcept {
            return prime_;
        }

        // Largest exponent n with bounded_modulus_factor * p^n < bounded_modulus_limit.
        std::size_t max_exponent() const noexcept {
            std::size_t exponent = 0;
            while (exponent + 1 < powers_.size() &&
                   config::bounded_modulus_factor * powers_[exponent + 1] <
                       config::bounded_modulus_limit) {
                ++exponent;
            }
            return exponent;
        }

        std::int64_t operator[](std::size_t exponent) const {
            if (exponent >= powers_.size()) {
                throw std::overflow_error(std::to_string(prime_) + "^" + std::to_string(exponent) +
                                          " exceeds the bounded range");
            }
            return powers_[exponent];
        }

      private:
        long prime_;
        std::vector<std::int64_t> powers_;
    };

} // namespace padist::core
