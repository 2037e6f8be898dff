// include/padist/core/power_series.hpp — Power series truncated at a fixed precision.

#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace padist::core {

    // Sum of c_i y^i for i < precision over a coefficient ring policy (see residue_ring.hpp).
    // Every product is truncated back to the shared precision.
    template <typename Ring> class power_series {
      public:
        using value_type = typename Ring::value_type;

        power_series(const Ring &ring, std::size_t precision)
            : ring_(ring), coeffs_(precision, ring.zero()) {
        }
        power_series(const Ring &ring, std::vector<value_type> coeffs, std::size_t precision)
            : ring_(ring), coeffs_(std::move(coeffs)) {
            coeffs_.resize(precision, ring_.zero());
            for (auto &coeff : coeffs_) {
                coeff = ring_.add(coeff, ring_.zero());
            }
        }

        static power_series constant(const Ring &ring, const value_type &value,
                                     std::size_t precision) {
            power_series result(ring, precision);
            if (precision > 0) {
                result.coeffs_[0] = ring.add(value, ring.zero());
            }
            return result;
        }

        // constant + slope * y
        static power_series linear(const Ring &ring, const value_type &constant,
                                   const value_type &slope, std::size_t precision) {
            power_series result = power_series::constant(ring, constant, precision);
            if (precision > 1) {
                result.coeffs_[1] = ring.add(slope, ring.zero());
            }
            return result;
        }

        const Ring &ring() const noexcept {
            return ring_;
        }
        std::size_t precision() const noexcept {
            return coeffs_.size();
        }
        const std::vector<value_type> &coefficients() const noexcept {
            return coeffs_;
        }
        const value_type &operator[](std::size_t index) const {
            return coeffs_.at(index);
        }

        power_series &operator+=(const power_series &other) {
            require_same_precision(other);
            for (std::size_t index = 0; index < coeffs_.size(); ++index) {
                coeffs_[index] = ring_.add(coeffs_[index], other.coeffs_[index]);
            }
            return *this;
        }

        power_series &operator-=(const power_series &other) {
            require_same_precision(other);
            for (std::size_t index = 0; index < coeffs_.size(); ++index) {
                coeffs_[index] = ring_.sub(coeffs_[index], other.coeffs_[index]);
            }
            return *this;
        }

        power_series &operator*=(const power_series &other) {
            require_same_precision(other);
            coeffs_ = mullow(coeffs_, other.coeffs_, coeffs_.size());
            return *this;
        }

        power_series &operator*=(const value_type &scalar) {
            for (auto &coeff : coeffs_) {
                coeff = ring_.mul(coeff, scalar);
            }
            return *this;
        }

        friend power_series operator+(power_series lhs, const power_series &rhs) {
            lhs += rhs;
            return lhs;
        }
        friend power_series operator-(power_series lhs, const power_series &rhs) {
            lhs -= rhs;
            return lhs;
        }
        friend power_series operator*(power_series lhs, const power_series &rhs) {
            lhs *= rhs;
            return lhs;
        }
        friend power_series operator*(power_series lhs, const value_type &scalar) {
            lhs *= scalar;
            return lhs;
        }

        // Coefficient recurrence g_n = -u^{-1} * sum_{i=1..n} f_i g_{n-i}; needs a unit
        // constant term.
        power_series inverse() const {
            power_series result(ring_, coeffs_.size());
            if (coeffs_.empty()) {
                return result;
            }
            const value_type lead_inverse = ring_.inverse(coeffs_[0]);
            result.coeffs_[0] = lead_inverse;
            for (std::size_t n = 1; n < coeffs_.size(); ++n) {
                value_type sum = ring_.zero();
                for (std::size_t i = 1; i <= n; ++i) {
                    sum = ring_.add(sum, ring_.mul(coeffs_[i], result.coeffs_[n - i]));
                }
                result.coeffs_[n] = ring_.sub(ring_.zero(), ring_.mul(sum, lead_inverse));
            }
            return result;
        }

        // Newton iteration g <- g * (2 - f * g), doubling the correct length each round.
        power_series inverse_newton() const {
            const std::size_t target = coeffs_.size();
            power_series result(ring_, target);
            if (target == 0) {
                return result;
            }
            std::vector<value_type> approx{ring_.inverse(coeffs_[0])};
            std::size_t length = 1;
            while (length < target) {
                length = std::min(target, 2 * length);
                std::vector<value_type> head(coeffs_.begin(),
                                             coeffs_.begin() + static_cast<std::ptrdiff_t>(length));
                std::vector<value_type> correction = mullow(head, approx, length);
                for (auto &coeff : correction) {
                    coeff = ring_.sub(ring_.zero(), coeff);
                }
                correction[0] = ring_.add(correction[0], ring_.from_integer(2));
                approx = mullow(approx, correction, length);
            }
            result.coeffs_ = std::move(approx);
            result.coeffs_.resize(target, ring_.zero());
            return result;
        }

        // Square-and-multiply; a negative exponent inverts first.
        power_series pow(long exponent) const {
            if (exponent < 0) {
                return inverse().pow(-exponent);
            }
            power_series result = power_series::constant(ring_, ring_.one(), coeffs_.size());
            power_series base = *this;
            while (exponent > 0) {
                if ((exponent & 1) != 0) {
                    result *= base;
                }
                exponent >>= 1;
                if (exponent > 0) {
                    base *= base;
                }
            }
            return result;
        }

      private:
        void require_same_precision(const power_series &other) const {
            if (other.coeffs_.size() != coeffs_.size()) {
                throw std::invalid_argument("power_series precision mismatch");
            }
        }

        std::vector<value_type> mullow(const std::vector<value_type> &lhs,
                                       const std::vector<value_type> &rhs,
                                       std::size_t length) const {
            std::vector<value_type> product(length, ring_.zero());
            const std::size_t lhs_len = std::min(lhs.size(), length);
            for (std::size_t i = 0; i < lhs_len; ++i) {
                if (ring_.is_zero(lhs[i])) {
                    continue;
                }
                const std::size_t rhs_len = std::min(rhs.size(), length - i);
                for (std::size_t j = 0; j < rhs_len; ++j) {
                    product[i + j] = ring_.add(product[i + j], ring_.mul(lhs[i], rhs[j]));
                }
            }
            return product;
        }

        Ring ring_;
        std::vector<value_type> coeffs_;
    };

} // namespace padist::core
