// src/core/padic_number.cpp — Precision propagation for p-adic scalars.

#include <padist/core/padic_number.hpp>

#include <algorithm>

#include <padist/core/arith.hpp>
#include <padist/errors.hpp>

namespace padist::core {

    namespace {

        long common_prime(const padic_number &lhs, const padic_number &rhs) {
            if (lhs.prime() == 0) {
                return rhs.prime();
            }
            if (rhs.prime() != 0 && rhs.prime() != lhs.prime()) {
                throw value_error("p-adic numbers over different primes");
            }
            return lhs.prime();
        }

    } // namespace

    padic_number::padic_number(long prime, mpq_class value, long absprec)
        : prime_(prime), value_(std::move(value)), absprec_(absprec) {
        if (prime_ < 0 || prime_ == 1) {
            throw value_error("invalid prime for a p-adic number");
        }
        if (prime_ == 0 && !is_exact()) {
            throw value_error("a p-adic precision needs a prime");
        }
        reduce();
    }

    void padic_number::reduce() {
        value_.canonicalize();
        if (prime_ == 0 || is_exact() || value_ == 0) {
            return;
        }
        const long v = core::valuation(value_, prime_);
        if (v >= absprec_) {
            value_ = 0;
            return;
        }
        const auto [shift, unit] = val_unit(value_, prime_);
        const mpz_class digits = residue(unit, prime_, absprec_ - shift);
        if (shift >= 0) {
            value_ = mpq_class(mpz_class(digits * prime_power(prime_, shift)));
        } else {
            value_ = mpq_class(digits, prime_power(prime_, -shift));
            value_.canonicalize();
        }
    }

    bool padic_number::is_zero() const {
        return value_ == 0;
    }

    long padic_number::valuation() const {
        if (value_ == 0) {
            return absprec_;
        }
        if (prime_ == 0) {
            throw value_error("valuation of an exact rational needs a prime");
        }
        return std::min(core::valuation(value_, prime_), absprec_);
    }

    long padic_number::valuation(long p) const {
        if (prime_ != 0 && p != prime_) {
            throw value_error("valuation requested at a different prime");
        }
        if (value_ == 0) {
            return absprec_;
        }
        return std::min(core::valuation(value_, p), absprec_);
    }

    long padic_number::precision_relative() const {
        if (is_exact()) {
            return config::infinite_precision;
        }
        return absprec_ - valuation();
    }

    padic_number padic_number::add_bigoh(long absprec) const {
        if (prime_ == 0) {
            throw value_error("add_bigoh needs a prime");
        }
        return padic_number(prime_, value_, std::min(absprec_, absprec));
    }

    padic_number padic_number::with_prime(long prime) const {
        if (prime_ != 0 && prime_ != prime) {
            throw value_error("p-adic number already carries a different prime");
        }
        return padic_number(prime, value_, absprec_);
    }

    padic_number padic_number::operator-() const {
        padic_number result = *this;
        result.value_ = -value_;
        result.reduce();
        return result;
    }

    padic_number operator+(const padic_number &lhs, const padic_number &rhs) {
        const long prime = common_prime(lhs, rhs);
        mpq_class sum = lhs.value_ + rhs.value_;
        return padic_number(prime, std::move(sum), std::min(lhs.absprec_, rhs.absprec_));
    }

    padic_number operator-(const padic_number &lhs, const padic_number &rhs) {
        return lhs + (-rhs);
    }

    padic_number operator*(const padic_number &lhs, const padic_number &rhs) {
        const long prime = common_prime(lhs, rhs);
        mpq_class product = lhs.value_ * rhs.value_;
        if (lhs.is_exact() && rhs.is_exact()) {
            return padic_number(prime, std::move(product), config::infinite_precision);
        }
        if (lhs.is_exact_zero() || rhs.is_exact_zero()) {
            return padic_number(prime, mpq_class(0), config::infinite_precision);
        }
        const long lhs_val = lhs.value_ == 0 ? lhs.absprec_ : core::valuation(lhs.value_, prime);
        const long rhs_val = rhs.value_ == 0 ? rhs.absprec_ : core::valuation(rhs.value_, prime);
        const long absprec = std::min(saturating_add(lhs.absprec_, rhs_val),
                                      saturating_add(rhs.absprec_, lhs_val));
        return padic_number(prime, std::move(product), absprec);
    }

    bool operator==(const padic_number &lhs, const padic_number &rhs) {
        if (lhs.is_exact() && rhs.is_exact()) {
            return lhs.value_ == rhs.value_;
        }
        return (lhs - rhs).is_zero();
    }

    std::string padic_number::to_string() const {
        if (is_exact()) {
            return value_.get_str();
        }
        return value_.get_str() + " + O(" + std::to_string(prime_) + "^" +
               std::to_string(absprec_) + ")";
    }

} // namespace padist::core
