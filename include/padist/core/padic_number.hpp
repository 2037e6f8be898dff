// include/padist/core/padic_number.hpp — Rational values carried with a p-adic absolute precision.

#pragma once

#include <string>
#include <utility>

#include <gmpxx.h>

#include <padist/config.hpp>

namespace padist::core {

    // A value known modulo p^absprec, or exactly. A prime of 0 marks an exact rational that
    // lives outside any p-adic ring (the scalars of classical Sym^k spaces).
    class padic_number {
      public:
        padic_number() = default;
        padic_number(long value) : value_(value) {
        }
        padic_number(const mpz_class &value) : value_(value) {
        }
        padic_number(mpq_class value) : value_(std::move(value)) {
            value_.canonicalize();
        }
        padic_number(long prime, mpq_class value, long absprec = config::infinite_precision);

        static padic_number exact(long prime, mpq_class value) {
            return padic_number(prime, std::move(value), config::infinite_precision);
        }

        long prime() const noexcept {
            return prime_;
        }
        const mpq_class &value() const noexcept {
            return value_;
        }
        long precision_absolute() const noexcept {
            return absprec_;
        }
        bool is_exact() const noexcept {
            return absprec_ >= config::infinite_precision;
        }
        bool is_exact_zero() const noexcept {
            return is_exact() && value_ == 0;
        }

        // Zero to the recorded precision.
        bool is_zero() const;

        // v_p(value) capped at the absolute precision; infinite for the exact zero.
        long valuation() const;
        long valuation(long p) const;
        long precision_relative() const;

        padic_number add_bigoh(long absprec) const;
        padic_number with_prime(long prime) const;

        padic_number operator-() const;
        friend padic_number operator+(const padic_number &lhs, const padic_number &rhs);
        friend padic_number operator-(const padic_number &lhs, const padic_number &rhs);
        friend padic_number operator*(const padic_number &lhs, const padic_number &rhs);

        // Equal modulo the smaller of the two precisions.
        friend bool operator==(const padic_number &lhs, const padic_number &rhs);
        friend bool operator!=(const padic_number &lhs, const padic_number &rhs) {
            return !(lhs == rhs);
        }

        std::string to_string() const;

      private:
        void reduce();

        long prime_ = 0;
        mpq_class value_{0};
        long absprec_ = config::infinite_precision;
    };

} // namespace padist::core
