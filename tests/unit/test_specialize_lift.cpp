// tests/unit/test_specialize_lift.cpp — Unit tests for moving between overconvergent and Sym^k spaces.

#include <iostream>
#include <vector>

#include <padist/padist.hpp>

namespace {

    using padist::dist::base_ring;
    using padist::dist::distribution;
    using padist::dist::implementation;

    bool check_specialize() {
        const auto space = padist::dist::make_overconvergent_space(2, 7, 5, implementation::vector);
        const distribution v = space->make({1, 2, 3, 4, 5});
        const distribution classical = v.specialize();
        const auto &target = classical.space();
        if (!target->is_symk() || target->weight() != 2 || target->prime() != 7 ||
            target->ring() != base_ring::padic_integers) {
            std::cerr << "specialize landed in " << target->to_string() << "\n";
            return false;
        }
        if (classical.moments() != std::vector<mpq_class>{1, 2, 3}) {
            std::cerr << "specialize kept the wrong moments: " << classical.to_string() << "\n";
            return false;
        }
        const distribution rational = v.specialize(base_ring::rationals);
        if (rational.space()->prime() != 0 || rational.space()->ring() != base_ring::rationals) {
            std::cerr << "specialize to the rationals should drop the prime\n";
            return false;
        }
        // ordp is folded into the exact moments.
        const distribution scaled = v.scale(49).specialize();
        if (scaled.moments() != std::vector<mpq_class>{49, 98, 147}) {
            std::cerr << "specialize of 49 v mismatch: " << scaled.to_string() << "\n";
            return false;
        }

        const auto wide = padist::dist::make_overconvergent_space(4, 7, 6, implementation::vector);
        bool threw = false;
        try {
            (void)wide->make({1, 2}).specialize();
        } catch (const padist::precision_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "specializing two moments to weight 4 should throw\n";
            return false;
        }
        const auto negative = padist::dist::make_overconvergent_space(-1, 7, 6);
        threw = false;
        try {
            (void)negative->make({1, 2, 3}).specialize();
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "specializing a negative weight should throw\n";
            return false;
        }
        return true;
    }

    bool check_lift() {
        const auto symk = padist::dist::make_symk_space(2);
        const distribution v = symk->make({1, 2, 3});
        const distribution lifted = v.lift(7, 6);
        const auto &target = lifted.space();
        if (target->is_symk() || target->prime() != 7 || target->precision_cap() != 6 ||
            target->ring() != base_ring::padic_integers) {
            std::cerr << "lift landed in " << target->to_string() << "\n";
            return false;
        }
        if (lifted.moments() != std::vector<mpq_class>{1, 2, 3, 0, 0, 0} || !lifted.is_bounded()) {
            std::cerr << "lifted moments mismatch: " << lifted.to_string() << "\n";
            return false;
        }
        if (lifted.specialize(base_ring::rationals) != v) {
            std::cerr << "specialize should undo lift\n";
            return false;
        }
        if (v.lift(7).space()->precision_cap() != padist::config::default_precision_cap) {
            std::cerr << "lift should default to the default precision cap\n";
            return false;
        }
        bool threw = false;
        try {
            (void)v.lift();
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "lifting without a prime should throw\n";
            return false;
        }
        return true;
    }

    bool check_space_helpers() {
        const auto space = padist::dist::make_overconvergent_space(3, 5, 4);
        const auto basis = space->basis();
        if (basis.size() != 4) {
            std::cerr << "basis size mismatch\n";
            return false;
        }
        for (std::size_t index = 0; index < basis.size(); ++index) {
            if (basis[index].valuation() != 0 || basis[index].moment(index) != 1) {
                std::cerr << "basis vector " << index << " mismatch: " << basis[index].to_string() << "\n";
                return false;
            }
        }
        bool threw = false;
        try {
            (void)space->basis(5);
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "basis past the cap should throw\n";
            return false;
        }
        if (space->change_precision(9)->precision_cap() != 9 ||
            space->change_ring(base_ring::padic_field)->uses_bounded()) {
            std::cerr << "change_precision/change_ring mismatch\n";
            return false;
        }
        if (space->to_string() != "Space of 5-adic distributions with k=3 action and precision cap 4") {
            std::cerr << "to_string got " << space->to_string() << "\n";
            return false;
        }
        if (padist::dist::make_symk_space(2)->to_string() != "Sym^2 rationals^2") {
            std::cerr << "Sym^k to_string got " << padist::dist::make_symk_space(2)->to_string() << "\n";
            return false;
        }
        const distribution scalar = space->from_scalar(padist::core::padic_number(3));
        if (scalar.moments() != std::vector<mpq_class>{3}) {
            std::cerr << "from_scalar mismatch\n";
            return false;
        }
        threw = false;
        try {
            (void)padist::dist::make_overconvergent_space(2, 1, 4);
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "a space over p = 1 should throw\n";
            return false;
        }
        return true;
    }

} // namespace

int main() {
    if (!check_specialize() || !check_lift() || !check_space_helpers()) {
        return 1;
    }
    std::cout << "specialize/lift tests passed\n";
    return 0;
}
