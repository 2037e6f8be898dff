// tests/unit/test_cross_representation.cpp — Exhaustive agreement between bounded and GMP results.

#include <array>
#include <iostream>
#include <random>
#include <vector>

#include <padist/padist.hpp>

namespace {

    using padist::core::matrix2;
    using padist::core::padic_number;
    using padist::dist::distribution;
    using padist::dist::implementation;

    bool same_value(const distribution &bounded, const distribution &generic, const char *label,
                    const std::vector<mpq_class> &input) {
        distribution lhs = bounded;
        distribution rhs = generic;
        lhs.normalize();
        rhs.normalize();
        const bool agree = lhs.is_bounded() && !rhs.is_bounded() && lhs == rhs &&
                           lhs.ordp() == rhs.ordp() &&
                           lhs.precision_relative() == rhs.precision_relative() &&
                           lhs.is_zero() == rhs.is_zero();
        if (!agree) {
            std::cerr << label << " disagrees for input (";
            for (const auto &value : input) {
                std::cerr << ' ' << value;
            }
            std::cerr << " )\n";
            padist::util::dump(std::cerr, lhs) << "\n";
            padist::util::dump(std::cerr, rhs) << "\n";
            return false;
        }
        return true;
    }

    // (u + v) + w == u + (v + w) with the three operands at different ordp and lengths.
    bool check_associativity(implementation impl, std::mt19937_64 &rng) {
        const auto space = padist::dist::make_overconvergent_space(3, 5, 6, impl);
        const std::array<padic_number, 3> shifts = {padic_number(1), padic_number(5), padic_number(25)};
        for (int iteration = 0; iteration < 40; ++iteration) {
            const distribution u = space->random_element(6, rng).scale(shifts[iteration % 3]);
            const distribution v = space->random_element(5, rng).scale(shifts[(iteration + 1) % 3]);
            const distribution w = space->random_element(4, rng).scale(shifts[(iteration + 2) % 3]);
            const distribution left = (u + v) + w;
            const distribution right = u + (v + w);
            if (left.is_bounded() != (impl == implementation::bounded) || left != right ||
                left.ordp() != right.ordp() || left.precision_absolute() != right.precision_absolute()) {
                std::cerr << "addition is not associative\n";
                padist::util::dump(std::cerr, left) << "\n";
                padist::util::dump(std::cerr, right) << "\n";
                return false;
            }
        }
        return true;
    }

} // namespace

int main() {
    std::mt19937_64 rng(0xa55'0c1a7e);
    if (!check_associativity(implementation::vector, rng) ||
        !check_associativity(implementation::bounded, rng)) {
        return 1;
    }

    const auto bounded_space = padist::dist::make_overconvergent_space(2, 3, 3, implementation::bounded);
    const auto vector_space = padist::dist::make_overconvergent_space(2, 3, 3, implementation::vector);

    const std::array<padic_number, 5> scalars = {padic_number(2), padic_number(3), padic_number(6),
                                                 padic_number(-1),
                                                 padic_number(3, mpq_class(4), 2)};
    const std::array<matrix2, 3> matrices = {matrix2(1, 1, 3, 2), matrix2(2, 0, 0, 1),
                                             matrix2(1, 0, 3, 1)};
    const std::vector<mpq_class> other_moments = {5, -7, 2};
    const distribution other_bounded = bounded_space->make(other_moments);
    const distribution other_vector = vector_space->make(other_moments);
    const distribution shifted_bounded = other_bounded.scale(3);
    const distribution shifted_vector = other_vector.scale(3);

    std::size_t cases = 0;
    for (int a = -13; a <= 13; ++a) {
        for (int b = -4; b <= 4; ++b) {
            for (int c = -1; c <= 1; ++c) {
                const std::vector<mpq_class> input = {a, b, c};
                const distribution bounded = bounded_space->make(input);
                const distribution generic = vector_space->make(input);
                if (!same_value(bounded, generic, "construction", input)) {
                    return 1;
                }
                if (bounded.valuation() != generic.valuation()) {
                    std::cerr << "valuation disagrees\n";
                    return 1;
                }
                for (const auto &scalar : scalars) {
                    if (!same_value(bounded.scale(scalar), generic.scale(scalar), "scale", input)) {
                        return 1;
                    }
                }
                if (!same_value(bounded + other_bounded, generic + other_vector, "add", input) ||
                    !same_value(bounded - shifted_bounded, generic - shifted_vector, "sub", input) ||
                    !same_value(shifted_bounded + bounded, shifted_vector + generic, "shifted add",
                                input)) {
                    return 1;
                }
                for (const auto &g : matrices) {
                    if (!same_value(bounded.act_right(g), generic.act_right(g), "act_right", input)) {
                        return 1;
                    }
                }
                ++cases;
            }
        }
    }
    std::cout << "cross representation tests passed (" << cases << " inputs)\n";
    return 0;
}
