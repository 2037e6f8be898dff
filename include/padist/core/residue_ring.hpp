// include/padist/core/residue_ring.hpp — Coefficient rings for truncated power series.

#pragma once

#include <cstdint>
#include <stdexcept>

#include <gmpxx.h>

#include <padist/core/arith.hpp>
#include <padist/errors.hpp>

namespace padist::core {

    // Exact rationals; used by classical Sym^k actions.
    class rational_field {
      public:
        using value_type = mpq_class;

        value_type zero() const {
            return value_type(0);
        }
        value_type one() const {
            return value_type(1);
        }
        value_type from_integer(std::int64_t value) const {
            return value_type(static_cast<long>(value));
        }
        value_type add(const value_type &lhs, const value_type &rhs) const {
            return value_type(lhs + rhs);
        }
        value_type sub(const value_type &lhs, const value_type &rhs) const {
            return value_type(lhs - rhs);
        }
        value_type mul(const value_type &lhs, const value_type &rhs) const {
            return value_type(lhs * rhs);
        }
        value_type inverse(const value_type &value) const {
            if (value == 0) {
                throw value_error("inverse of zero in the rational field");
            }
            return value_type(1 / value);
        }
        bool is_zero(const value_type &value) const {
            return value == 0;
        }
    };

    // Z / modulus Z with arbitrary-precision residues in [0, modulus).
    class residue_ring {
      public:
        using value_type = mpz_class;

        explicit residue_ring(mpz_class modulus) : modulus_(std::move(modulus)) {
            if (modulus_ <= 0) {
                throw std::invalid_argument("residue_ring modulus must be positive");
            }
        }

        const mpz_class &modulus() const noexcept {
            return modulus_;
        }
        value_type zero() const {
            return value_type(0);
        }
        value_type one() const {
            return reduce(value_type(1));
        }
        value_type from_integer(std::int64_t value) const {
            return reduce(value_type(static_cast<long>(value)));
        }
        value_type reduce(const value_type &value) const {
            return residue(value, modulus_);
        }
        value_type add(const value_type &lhs, const value_type &rhs) const {
            return reduce(value_type(lhs + rhs));
        }
        value_type sub(const value_type &lhs, const value_type &rhs) const {
            return reduce(value_type(lhs - rhs));
        }
        value_type mul(const value_type &lhs, const value_type &rhs) const {
            return reduce(value_type(lhs * rhs));
        }
        value_type inverse(const value_type &value) const {
            return inverse_mod(value, modulus_);
        }
        bool is_zero(const value_type &value) const {
            return reduce(value) == 0;
        }

      private:
        mpz_class modulus_;
    };

    // Z / modulus Z with int64_t residues. The modulus stays below overflow_threshold, so
    // every product of two residues fits before it is reduced into [0, modulus).
    class small_residue_ring {
      public:
        using value_type = std::int64_t;

        explicit small_residue_ring(std::int64_t modulus) : modulus_(modulus) {
            if (modulus_ <= 0) {
                throw std::invalid_argument("small_residue_ring modulus must be positive");
            }
            if (modulus_ > config::overflow_threshold) {
                throw std::overflow_error("small_residue_ring modulus exceeds the overflow band");
            }
        }

        std::int64_t modulus() const noexcept {
            return modulus_;
        }
        value_type zero() const noexcept {
            return 0;
        }
        value_type one() const noexcept {
            return modulus_ == 1 ? 0 : 1;
        }
        value_type from_integer(std::int64_t value) const noexcept {
            return residue(value, modulus_);
        }
        value_type reduce(value_type value) const noexcept {
            return residue(value, modulus_);
        }
        value_type add(value_type lhs, value_type rhs) const noexcept {
            return residue(lhs + rhs, modulus_);
        }
        value_type sub(value_type lhs, value_type rhs) const noexcept {
            return residue(lhs - rhs, modulus_);
        }
        value_type mul(value_type lhs, value_type rhs) const noexcept {
            return residue(lhs * rhs, modulus_);
        }
        value_type inverse(value_type value) const {
            return inverse_mod(value, modulus_);
        }
        bool is_zero(value_type value) const noexcept {
            return residue(value, modulus_) == 0;
        }

      private:
        std::int64_t modulus_;
    };

} // namespace padist::core
