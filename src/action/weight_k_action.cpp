// src/action/weight_k_action.cpp — Acting-matrix construction and application.

#include <padist/action/weight_k_action.hpp>

#include <string>

#include <padist/core/arith.hpp>
#include <padist/core/power_series.hpp>
#include <padist/core/residue_ring.hpp>
#include <padist/errors.hpp>

namespace padist::action {

    namespace {

        using core::power_series;

        template <typename Ring>
        typename Ring::value_type twist_factor(const Ring &ring, const dist::distribution_space &space,
                                               const core::matrix_key &abcd) {
            const auto [a, b, c, d] = abcd;
            auto factor = ring.one();
            if (space.character()) {
                factor = ring.mul(factor, ring.from_integer(space.character()(a)));
            }
            if (const auto &twist = space.dettwist(); twist && *twist != 0) {
                const std::int64_t det = core::matrix2(a, b, c, d).determinant();
                auto base = ring.from_integer(det);
                if (*twist < 0) {
                    base = ring.inverse(base);
                }
                for (long e = 0; e < (*twist < 0 ? -*twist : *twist); ++e) {
                    factor = ring.mul(factor, base);
                }
            }
            return factor;
        }

        // Columns t * s^j with t = (a + cy)^k and s = (b + dy) / (a + cy), read off one multiply
        // at a time.
        template <typename Ring>
        dense_matrix<typename Ring::value_type>
        build_iterative(const Ring &ring, const dist::distribution_space &space,
                        const core::matrix_key &abcd, std::size_t M, bool newton) {
            const auto [a, b, c, d] = abcd;
            using series = power_series<Ring>;
            const series denominator = series::linear(ring, ring.from_integer(a), ring.from_integer(c), M);
            const series numerator = series::linear(ring, ring.from_integer(b), ring.from_integer(d), M);
            const series inverse = newton ? denominator.inverse_newton() : denominator.inverse();
            const series s = numerator * inverse;
            series column = space.weight() >= 0 ? denominator.pow(space.weight())
                                                : inverse.pow(-space.weight());
            column *= twist_factor(ring, space, abcd);

            dense_matrix<typename Ring::value_type> result(M, M, ring.zero());
            for (std::size_t j = 0; j < M; ++j) {
                for (std::size_t r = 0; r < M; ++r) {
                    result(r, j) = column[r];
                }
                if (j + 1 < M) {
                    column *= s;
                }
            }
            return result;
        }

        // Sym^k columns are the polynomials (b + dy)^j (a + cy)^(k - j), so a may vanish.
        dense_matrix<mpq_class> build_polynomial(const dist::distribution_space &space,
                                                 const core::matrix_key &abcd, std::size_t M) {
            const core::rational_field ring;
            const long k = space.weight();
            if (static_cast<long>(M) > k + 1) {
                return build_iterative(ring, space, abcd, M, false);
            }
            const auto [a, b, c, d] = abcd;
            using series = power_series<core::rational_field>;
            const series denominator = series::linear(ring, ring.from_integer(a), ring.from_integer(c), M);
            const series numerator = series::linear(ring, ring.from_integer(b), ring.from_integer(d), M);
            const mpq_class twist = twist_factor(ring, space, abcd);

            dense_matrix<mpq_class> result(M, M, mpq_class(0));
            series numerator_power = series::constant(ring, ring.one(), M);
            for (std::size_t j = 0; j < M; ++j) {
                series column = numerator_power * denominator.pow(k - static_cast<long>(j));
                column *= twist;
                for (std::size_t r = 0; r < M; ++r) {
                    result(r, j) = column[r];
                }
                numerator_power *= numerator;
            }
            return result;
        }

    } // namespace

    std::size_t weight_k_action::cap() const noexcept {
        return static_cast<std::size_t>(std::max(space_.precision_cap(), 0L));
    }

    void weight_k_action::check_matrix(const core::matrix_key &abcd) const {
        const auto [a, b, c, d] = abcd;
        if (core::matrix2(a, b, c, d).determinant() == 0) {
            throw action_error("zero determinant");
        }
        if (!space_.is_symk()) {
            if (a % space_.prime() == 0) {
                throw action_error("p divides a");
            }
            if (c % space_.Np() != 0) {
                throw action_error("Np does not divide c");
            }
        }
    }

    weight_k_action::exact_matrix weight_k_action::compute_exact(const core::matrix_key &abcd,
                                                                 std::size_t M) const {
        return build_polynomial(space_, abcd, M);
    }

    weight_k_action::residue_matrix weight_k_action::compute_residue(const core::matrix_key &abcd,
                                                                     std::size_t M) const {
        const core::residue_ring ring(core::prime_power(space_.prime(), static_cast<long>(M)));
        return build_iterative(ring, space_, abcd, M, false);
    }

    weight_k_action::bounded_matrix weight_k_action::compute_bounded(const core::matrix_key &abcd,
                                                                     std::size_t M) const {
        const core::small_residue_ring ring(space_.powers()[M]);
        return build_iterative(ring, space_, abcd, M, true);
    }

    std::shared_ptr<const weight_k_action::exact_matrix>
    weight_k_action::exact_acting_matrix(const core::matrix2 &g, std::size_t M) const {
        const core::matrix_key abcd = space_.tuple(g);
        return exact_cache_.get(
            abcd, M, cap(), [&] { check_matrix(abcd); },
            [&](std::size_t precision) { return compute_exact(abcd, precision); },
            [](const exact_matrix &matrix, std::size_t precision) { return matrix.block(precision); });
    }

    std::shared_ptr<const weight_k_action::residue_matrix>
    weight_k_action::acting_matrix(const core::matrix2 &g, std::size_t M) const {
        const core::matrix_key abcd = space_.tuple(g);
        const long p = space_.prime();
        return residue_cache_.get(
            abcd, M, cap(), [&] { check_matrix(abcd); },
            [&](std::size_t precision) { return compute_residue(abcd, precision); },
            [p](const residue_matrix &matrix, std::size_t precision) {
                residue_matrix block = matrix.block(precision);
                const mpz_class &modulus = core::prime_power(p, static_cast<long>(precision));
                for (std::size_t row = 0; row < precision; ++row) {
                    for (std::size_t col = 0; col < precision; ++col) {
                        block(row, col) = core::residue(block(row, col), modulus);
                    }
                }
                return block;
            });
    }

    std::shared_ptr<const weight_k_action::bounded_matrix>
    weight_k_action::bounded_acting_matrix(const core::matrix2 &g, std::size_t M) const {
        const core::matrix_key abcd = space_.tuple(g);
        const core::small_powers &powers = space_.powers();
        return bounded_cache_.get(
            abcd, M, std::min(cap(), powers.max_exponent()), [&] { check_matrix(abcd); },
            [&](std::size_t precision) { return compute_bounded(abcd, precision); },
            [&powers](const bounded_matrix &matrix, std::size_t precision) {
                bounded_matrix block = matrix.block(precision);
                const std::int64_t modulus = powers[precision];
                for (std::size_t row = 0; row < precision; ++row) {
                    for (std::size_t col = 0; col < precision; ++col) {
                        block(row, col) = core::residue(block(row, col), modulus);
                    }
                }
                return block;
            });
    }

    dist::dist_vector weight_k_action::act(const dist::dist_vector &v, const core::matrix2 &g) const {
        if (g.is_identity()) {
            return v;
        }
        const auto n = static_cast<std::size_t>(v.precision_relative());
        if (n == 0) {
            return v;
        }
        const auto &moments = v.unscaled_moments();
        std::vector<mpq_class> image(n, mpq_class(0));
        if (space_.is_symk()) {
            const auto matrix = exact_acting_matrix(g, n);
            for (std::size_t j = 0; j < n; ++j) {
                for (std::size_t r = 0; r < n; ++r) {
                    image[j] += moments[r] * (*matrix)(r, j);
                }
            }
            return dist::dist_vector::from_raw(v.space(), std::move(image), v.ordp());
        }
        const long p = space_.prime();
        const long length = static_cast<long>(n);
        const auto matrix = acting_matrix(g, n);
        std::vector<mpz_class> digits;
        digits.reserve(n);
        for (std::size_t r = 0; r < n; ++r) {
            digits.push_back(core::residue(moments[r], p, length));
        }
        for (std::size_t j = 0; j < n; ++j) {
            mpz_class sum(0);
            for (std::size_t r = 0; r < n; ++r) {
                sum += digits[r] * (*matrix)(r, j);
            }
            image[j] = mpq_class(core::residue(sum, core::prime_power(p, length - static_cast<long>(j))));
        }
        return dist::dist_vector::from_raw(v.space(), std::move(image), v.ordp());
    }

    dist::dist_long weight_k_action::act(const dist::dist_long &v, const core::matrix2 &g) const {
        if (g.is_identity()) {
            return v;
        }
        const auto n = static_cast<std::size_t>(v.precision_relative());
        if (n == 0) {
            return v;
        }
        dist::dist_long source = v;
        source.quasi_normalize();
        const core::small_powers &powers = space_.powers();
        const std::int64_t modulus = powers[n];
        const auto matrix = bounded_acting_matrix(g, n);
        std::vector<std::int64_t> digits;
        digits.reserve(n);
        for (const std::int64_t value : source.unscaled_moments()) {
            digits.push_back(core::residue(value, modulus));
        }
        std::vector<std::int64_t> image(n, 0);
        for (std::size_t j = 0; j < n; ++j) {
            // Each reduced term is below p^n, so at most bounded_max_moments of them fit.
            std::int64_t sum = 0;
            for (std::size_t r = 0; r < n; ++r) {
                sum += core::residue(digits[r] * (*matrix)(r, j), modulus);
            }
            image[j] = core::residue(sum, powers[n - j]);
        }
        return dist::dist_long::from_raw(v.space(), std::move(image), v.ordp());
    }

    std::size_t weight_k_action::cached_precision(const core::matrix2 &g) const {
        const core::matrix_key abcd = space_.tuple(g);
        return std::max({exact_cache_.cached_precision(abcd), residue_cache_.cached_precision(abcd),
                         bounded_cache_.cached_precision(abcd)});
    }

    std::size_t weight_k_action::cache_size() const {
        return exact_cache_.size() + residue_cache_.size() + bounded_cache_.size();
    }

    void weight_k_action::clear_cache() const {
        exact_cache_.clear();
        residue_cache_.clear();
        bounded_cache_.clear();
        util::verbose(1, "acting matrix caches cleared");
    }

} // namespace padist::action
