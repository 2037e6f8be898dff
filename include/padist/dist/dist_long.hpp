// include/padist/dist/dist_long.hpp — Distributions with overflow-guarded int64_t moments.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include <gmpxx.h>

#include <padist/core/matrix2.hpp>
#include <padist/core/padic_number.hpp>
#include <padist/dist/dist_vector.hpp>
#include <padist/dist/space.hpp>

namespace padist::dist {

    // Same contract as dist_vector for spaces where bounded_modulus_factor * p^N stays below
    // bounded_modulus_limit. Entries are kept inside the overflow band between operations and
    // reduced to canonical residues by normalize().
    class dist_long {
      public:
        dist_long(space_ptr space, const std::vector<std::int64_t> &moments, long ordp = 0,
                  bool check = true, bool normalize = true);

        static dist_long zero(space_ptr space);
        // Stores the moments as given, skipping the overflow checks and reduction.
        static dist_long from_raw(space_ptr space, std::vector<std::int64_t> moments, long ordp) {
            return dist_long(raw_tag{}, std::move(space), std::move(moments), ordp);
        }
        // Exact when every moment of value is p-integral.
        static dist_long from_vector(const dist_vector &value);
        dist_vector to_vector() const;

        const space_ptr &space() const noexcept {
            return space_;
        }
        long prime() const noexcept {
            return space_->prime();
        }

        mpq_class moment(std::size_t index) const;
        std::int64_t unscaled_moment(std::size_t index) const;
        const std::vector<std::int64_t> &unscaled_moments() const noexcept {
            return moments_;
        }
        long ordp() const noexcept {
            return ordp_;
        }
        long precision_relative() const noexcept {
            return static_cast<long>(moments_.size());
        }
        long precision_absolute() const noexcept;

        // Reduces only the entries that left the overflow band.
        dist_long &quasi_normalize();
        dist_long &normalize();

        dist_long scale(const core::padic_number &scalar) const;
        dist_long add(const dist_long &other) const;
        dist_long sub(const dist_long &other) const;
        dist_long negate() const;
        int compare(const dist_long &other) const;
        dist_long reduce_precision(long M) const;

        bool is_zero() const;
        bool is_zero(long p, std::optional<long> M = std::nullopt) const;
        long valuation(std::optional<long> p = std::nullopt) const;
        long diagonal_valuation(std::optional<long> p = std::nullopt) const;

        core::padic_number find_scalar(const dist_long &other, std::optional<long> p = std::nullopt,
                                       std::optional<long> M = std::nullopt,
                                       bool check = true) const;
        dist_vector specialize(std::optional<base_ring> ring = std::nullopt) const;
        dist_long solve_diff_eqn() const;
        dist_long act_right(const core::matrix2 &g) const;

      private:
        struct raw_tag {};
        dist_long(raw_tag, space_ptr space, std::vector<std::int64_t> moments, long ordp);

        std::int64_t power(long exponent) const {
            return space_->powers()[static_cast<std::size_t>(exponent)];
        }
        dist_long addsub(const dist_long &other, bool negate) const;

        space_ptr space_;
        std::vector<std::int64_t> moments_;
        long ordp_ = 0;
    };

} // namespace padist::dist
