// examples/example_distribution.cpp — Walks through building, scaling and acting on distributions.

#include <iostream>

#include <padist/padist.hpp>

int
main() {
    using padist::core::matrix2;
    using padist::io::operator<<;

    const auto space = padist::dist::make_overconvergent_space(5, 7, 15);
    std::cout << space->to_string() << " (" << (space->uses_bounded() ? "bounded" : "GMP")
              << " moments)\n";

    const auto v = space->make({1, 2, 3, 4, 5});
    std::cout << "v          = " << v << "\n";
    std::cout << "2 * v      = " << v.scale(2) << "\n";
    std::cout << "7 * v      = " << v.scale(7) << "  (ordp " << v.scale(7).ordp() << ")\n";

    const matrix2 g(1, 0, 7, 1);
    std::cout << "v | " << g.to_string() << " = " << v.act_right(g) << "\n";

    auto measure_zero = v.moments();
    measure_zero[0] = 0;
    const auto w = space->make(measure_zero);
    const auto mu = w.solve_diff_eqn();
    std::cout << "mu with mu | [1 1; 0 1] - mu = w: " << mu << "\n";
    std::cout << "check: " << std::format("{}", mu.act_right(matrix2(1, 1, 0, 1)) - mu) << "\n";

    const auto classical = padist::dist::make_symk_space(2)->make({1, 2, 3});
    const auto lifted = classical.lift(7, 6);
    std::cout << "Sym^2 value " << classical << " lifts to " << lifted << " and specializes back to "
              << lifted.specialize(padist::dist::base_ring::rationals) << "\n";
    std::cout << "serialized:\n" << padist::io::serialize(v);

    try {
        (void)v.find_scalar(space->make({1, 1, 1, 1, 1}));
    } catch (const padist::value_error &err) {
        std::cout << "find_scalar refused: " << err.what() << "\n";
    }
    return 0;
}
