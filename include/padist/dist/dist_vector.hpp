// include/padist/dist/dist_vector.hpp — Distributions with arbitrary-precision (GMP) moments.

#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include <gmpxx.h>

#include <padist/core/matrix2.hpp>
#include <padist/core/padic_number.hpp>
#include <padist/dist/space.hpp>

namespace padist::dist {

    // Moments u_0, ..., u_{N-1} and a shift ordp: the i-th moment is p^ordp * u_i, known modulo
    // p^(ordp + N - i). In a Sym^k space the moments are exact and ordp stays 0.
    class dist_vector {
      public:
        // With check, moments with negative p-adic valuation are rescaled into ordp.
        dist_vector(space_ptr space, std::vector<mpq_class> moments, long ordp = 0,
                    bool check = true, bool normalize = true);

        // Stores the moments as given: no rescaling and no reduction.
        static dist_vector from_raw(space_ptr space, std::vector<mpq_class> moments, long ordp) {
            return dist_vector(std::move(space), std::move(moments), ordp, false, false);
        }

        // Canonical zero: empty moments and infinite ordp (k+1 zeros for Sym^k).
        static dist_vector zero(space_ptr space);

        const space_ptr &space() const noexcept {
            return space_;
        }
        long prime() const noexcept {
            return space_->prime();
        }
        bool is_symk() const noexcept {
            return space_->is_symk();
        }

        mpq_class moment(std::size_t index) const;
        const mpq_class &unscaled_moment(std::size_t index) const;
        const std::vector<mpq_class> &unscaled_moments() const noexcept {
            return moments_;
        }
        long ordp() const noexcept {
            return ordp_;
        }
        long precision_relative() const noexcept {
            return static_cast<long>(moments_.size());
        }
        long precision_absolute() const noexcept;

        dist_vector &normalize();

        dist_vector scale(const core::padic_number &scalar) const;
        dist_vector add(const dist_vector &other) const;
        dist_vector sub(const dist_vector &other) const;
        dist_vector negate() const;

        // Normalizes copies of both operands, then compares the aligned moments.
        int compare(const dist_vector &other) const;

        dist_vector reduce_precision(long M) const;

        bool is_zero() const;
        bool is_zero(long p, std::optional<long> M = std::nullopt) const;

        long valuation(std::optional<long> p = std::nullopt) const;
        long diagonal_valuation(std::optional<long> p = std::nullopt) const;

        // alpha with other == alpha * self.
        core::padic_number find_scalar(const dist_vector &other, std::optional<long> p = std::nullopt,
                                       std::optional<long> M = std::nullopt,
                                       bool check = true) const;

        dist_vector specialize(std::optional<base_ring> ring = std::nullopt) const;
        dist_vector lift(std::optional<long> p = std::nullopt, std::optional<long> M = std::nullopt,
                         std::optional<base_ring> ring = std::nullopt) const;

        // mu with mu | [1 1; 0 1] - mu == self.
        dist_vector solve_diff_eqn() const;

        dist_vector act_right(const core::matrix2 &g) const;

      private:
        long prime_or(std::optional<long> p) const;
        dist_vector addsub(const dist_vector &other, bool negate) const;

        space_ptr space_;
        std::vector<mpq_class> moments_;
        long ordp_ = 0;
    };

} // namespace padist::dist
