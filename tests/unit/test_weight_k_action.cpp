// tests/unit/test_weight_k_action.cpp — Unit tests for acting matrices and the right action law.

#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <padist/padist.hpp>

namespace {

    using padist::action::weight_k_action;
    using padist::core::matrix2;
    using padist::dist::distribution;
    using padist::dist::implementation;

    template <typename T>
    bool expect_matrix(const padist::action::dense_matrix<T> &matrix, const std::vector<std::vector<T>> &rows,
                       const char *label) {
        bool agree = matrix.rows() == rows.size() && matrix.cols() == rows.size();
        for (std::size_t r = 0; agree && r < rows.size(); ++r) {
            for (std::size_t c = 0; c < rows.size(); ++c) {
                if (!(matrix(r, c) == rows[r][c])) {
                    agree = false;
                    break;
                }
            }
        }
        if (!agree) {
            std::cerr << label << " mismatch\n";
            padist::util::dump(std::cerr, matrix);
        }
        return agree;
    }

    bool check_explicit_matrices() {
        const auto translation_space = padist::dist::make_overconvergent_space(0, 7, 5, implementation::vector);
        const auto binomials = translation_space->action().acting_matrix(matrix2(1, 1, 0, 1), 3);
        if (!expect_matrix<mpz_class>(*binomials, {{1, 1, 1}, {0, 1, 2}, {0, 0, 1}}, "translation")) {
            return false;
        }

        const auto space = padist::dist::make_overconvergent_space(2, 7, 3, implementation::vector);
        const matrix2 lower(1, 0, 7, 1);
        if (!expect_matrix<mpz_class>(*space->action().acting_matrix(lower, 3),
                                      {{1, 0, 0}, {14, 1, 0}, {49, 7, 1}}, "weight 2 lower")) {
            return false;
        }
        const distribution v = space->make({1, 2, 3});
        const distribution image = v.act_right(lower);
        if (image.moments() != std::vector<mpq_class>{176, 23, 3} || image.ordp() != 0) {
            std::cerr << "act_right by [1 0; 7 1] mismatch\n";
            padist::util::dump(std::cerr, image) << "\n";
            return false;
        }
        const auto bounded_space = padist::dist::make_overconvergent_space(2, 7, 3, implementation::bounded);
        if (!expect_matrix<std::int64_t>(*bounded_space->action().bounded_acting_matrix(lower, 3),
                                         {{1, 0, 0}, {14, 1, 0}, {49, 7, 1}}, "bounded weight 2")) {
            return false;
        }
        const distribution bounded_image = bounded_space->make({1, 2, 3}).act_right(lower);
        if (!bounded_image.is_bounded() || bounded_image.moments() != std::vector<mpq_class>{176, 23, 3}) {
            std::cerr << "bounded act_right mismatch\n";
            return false;
        }

        // (1 + 7y)^-2 = 1 - 14y + 147y^2
        const auto negative = padist::dist::make_overconvergent_space(-2, 7, 3, implementation::vector);
        const auto inverse_column = negative->action().acting_matrix(lower, 3);
        if ((*inverse_column)(0, 0) != 1 || (*inverse_column)(1, 0) != 329 ||
            (*inverse_column)(2, 0) != 147) {
            std::cerr << "negative weight column mismatch\n";
            padist::util::dump(std::cerr, *inverse_column);
            return false;
        }
        return true;
    }

    bool check_twists() {
        padist::dist::space_options options;
        options.weight = 2;
        options.symk = true;
        options.ring = padist::dist::base_ring::rationals;
        options.dettwist = 1;
        options.character = [](std::int64_t a) { return a; };
        const auto twisted = padist::dist::distribution_space::create(options);
        const matrix2 diagonal(2, 0, 0, 1);
        if (!expect_matrix<mpq_class>(*twisted->action().exact_acting_matrix(diagonal, 3),
                                      {{16, 0, 0}, {0, 8, 0}, {0, 0, 4}}, "character and det twist")) {
            return false;
        }
        options.character = nullptr;
        options.dettwist = -1;
        const auto inverse_twist = padist::dist::distribution_space::create(options);
        return expect_matrix<mpq_class>(*inverse_twist->action().exact_acting_matrix(diagonal, 3),
                                        {{2, 0, 0}, {0, 1, 0}, {0, 0, mpq_class(1, 2)}},
                                        "inverse det twist");
    }

    bool check_truncation(std::mt19937_64 &rng) {
        const auto space = padist::dist::make_overconvergent_space(3, 5, 12, implementation::vector);
        const weight_k_action &action = space->action();
        for (int iteration = 0; iteration < 12; ++iteration) {
            const matrix2 g = padist::util::random_sigma0_matrix(rng, 5, 9);
            const auto full = action.compute_residue(g.key(), 10);
            for (std::size_t M = 1; M <= 10; ++M) {
                const auto small = action.compute_residue(g.key(), M);
                const auto block = full.block(M);
                for (std::size_t r = 0; r < M; ++r) {
                    for (std::size_t c = 0; c < M; ++c) {
                        const mpz_class &modulus = padist::core::prime_power(5, static_cast<long>(M));
                        if (padist::core::residue(block(r, c), modulus) != small(r, c)) {
                            std::cerr << "truncation invariance fails for " << g.to_string() << " at M = " << M
                                      << "\n";
                            return false;
                        }
                    }
                }
                if (!(*action.acting_matrix(g, M) == small)) {
                    std::cerr << "cached matrix differs from the direct construction\n";
                    return false;
                }
            }
        }
        return true;
    }

    bool check_action_law(const padist::dist::space_ptr &space, long level, std::mt19937_64 &rng) {
        for (int iteration = 0; iteration < 20; ++iteration) {
            const matrix2 g1 = padist::util::random_sigma0_matrix(rng, level, 6);
            const matrix2 g2 = padist::util::random_sigma0_matrix(rng, level, 6);
            const distribution v = space->random_element(std::nullopt, rng);
            const distribution lhs = v.act_right(g1).act_right(g2);
            const distribution rhs = v.act_right(g1 * g2);
            if (lhs != rhs) {
                std::cerr << "action law fails on " << space->to_string() << " for " << g1.to_string()
                          << " and " << g2.to_string() << "\n";
                padist::util::dump(std::cerr, lhs) << "\n";
                padist::util::dump(std::cerr, rhs) << "\n";
                return false;
            }
        }
        const distribution v = space->random_element(std::nullopt, rng);
        if (v.act_right(matrix2::identity()) != v) {
            std::cerr << "identity should act trivially\n";
            return false;
        }
        return true;
    }

    bool check_rejections() {
        const auto space = padist::dist::make_overconvergent_space(2, 7, 4, implementation::vector);
        const distribution v = space->make({1, 2, 3, 4});
        const std::vector<std::pair<matrix2, std::string>> cases = {
            {matrix2(7, 1, 7, 1), "zero determinant"},
            {matrix2(7, 1, 0, 1), "p divides a"},
            {matrix2(1, 0, 1, 1), "Np does not divide c"},
        };
        for (const auto &[g, message] : cases) {
            try {
                (void)v.act_right(g);
                std::cerr << g.to_string() << " should be rejected\n";
                return false;
            } catch (const padist::action_error &error) {
                if (std::string(error.what()) != message) {
                    std::cerr << "unexpected rejection message: " << error.what() << "\n";
                    return false;
                }
            }
        }
        return true;
    }

    bool check_sigma0_elements(std::mt19937_64 &rng) {
        const auto space = padist::dist::make_overconvergent_space(2, 7, 6, implementation::vector);
        const padist::core::sigma0 monoid = space->monoid();
        if (monoid.level() != 7) {
            std::cerr << "monoid of a level 1 space at p = 7 should be Sigma0(7)\n";
            return false;
        }
        const distribution v = space->random_element(std::nullopt, rng);
        const auto g = monoid(matrix2(3, 1, 7, 5));
        const auto h = monoid(matrix2(1, 2, 14, 3));
        if (v.act_right(g) != v.act_right(g.matrix()) || v.act_right(g).act_right(h) != v.act_right(g * h)) {
            std::cerr << "Sigma0 elements should act through their matrices\n";
            return false;
        }
        // Sigma0(21) refines Sigma0(7); Sigma0(3) does not.
        if (v.act_right(padist::core::sigma0(21)(matrix2(1, 0, 21, 1))) != v.act_right(matrix2(1, 0, 21, 1))) {
            std::cerr << "a Sigma0(21) element should act on a level 7 space\n";
            return false;
        }
        bool threw = false;
        try {
            (void)v.act_right(padist::core::sigma0(3)(matrix2(1, 0, 3, 1)));
        } catch (const padist::action_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "a Sigma0(3) element should not act on a level 7 space\n";
            return false;
        }
        return true;
    }

} // namespace

int main() {
    std::mt19937_64 rng(0xac7ed);
    if (!check_explicit_matrices() || !check_twists() || !check_truncation(rng) || !check_rejections() ||
        !check_sigma0_elements(rng)) {
        return 1;
    }
    if (!check_action_law(padist::dist::make_overconvergent_space(3, 7, 8, implementation::vector), 7, rng) ||
        !check_action_law(padist::dist::make_overconvergent_space(3, 5, 8, implementation::bounded), 5, rng) ||
        !check_action_law(padist::dist::make_overconvergent_space(-1, 5, 6), 5, rng) ||
        !check_action_law(padist::dist::make_symk_space(4), 1, rng)) {
        return 1;
    }
    std::cout << "weight_k_action tests passed\n";
    return 0;
}
