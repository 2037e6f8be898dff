// tests/unit/test_dist_vector.cpp — Unit tests for GMP-backed distribution arithmetic and precision.

#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

#include <padist/padist.hpp>

namespace {

    using padist::core::padic_number;
    using padist::dist::distribution;

    bool expect_moments(const distribution &value, const std::vector<mpq_class> &expected, long ordp,
                        const char *label) {
        if (value.moments() != expected || value.ordp() != ordp) {
            std::cerr << label << " mismatch\n";
            padist::util::dump(std::cerr, value) << "\n";
            return false;
        }
        return true;
    }

    bool check_concrete_scenario() {
        const auto space = padist::dist::make_overconvergent_space(5, 7, 15);
        if (space->uses_bounded()) {
            std::cerr << "7^15 does not fit the bounded representation\n";
            return false;
        }
        distribution v = space->make({1, 2, 3, 4, 5});
        if (!expect_moments(v, {1, 2, 3, 4, 5}, 0, "construction")) {
            return false;
        }
        distribution normalized = v;
        normalized.normalize();
        if (!expect_moments(normalized, {1, 2, 3, 4, 5}, 0, "normalize")) {
            return false;
        }
        // 8 and 10 reduce modulo 7^2 and 7.
        const distribution doubled = v.scale(2);
        if (!expect_moments(doubled, {2, 4, 6, 8, 3}, 0, "scale by 2")) {
            return false;
        }
        const std::string text = padist::io::to_string(doubled);
        if (text != "(2 + O(7^5), 4 + O(7^4), 6 + O(7^3), 1 + 7 + O(7^2), 3 + O(7^1))") {
            std::cerr << "formatted scale got " << text << "\n";
            return false;
        }
        return true;
    }

    bool check_precision_invariants(std::mt19937_64 &rng) {
        const auto space = padist::dist::make_overconvergent_space(2, 5, 12, padist::dist::implementation::vector);
        for (int iteration = 0; iteration < 16; ++iteration) {
            distribution v = space->random_element(8, rng);
            if (v.precision_absolute() != v.precision_relative() + v.ordp()) {
                std::cerr << "absolute precision is not N + ordp\n";
                return false;
            }
            distribution once = v;
            once.normalize();
            distribution twice = once;
            twice.normalize();
            if (once.moments() != twice.moments() || once.ordp() != twice.ordp()) {
                std::cerr << "normalize is not idempotent\n";
                return false;
            }
            const distribution w = space->random_element(6, rng);
            if (v + w != w + v) {
                std::cerr << "addition is not commutative\n";
                return false;
            }
            distribution cancelled = v + v.scale(-1);
            cancelled.normalize();
            if (!cancelled.is_zero() || cancelled.precision_relative() != 0) {
                std::cerr << "v + (-1) v should normalize to zero\n";
                padist::util::dump(std::cerr, cancelled) << "\n";
                return false;
            }
        }
        return true;
    }

    bool check_zero_scaling() {
        const auto space = padist::dist::make_overconvergent_space(3, 7, 10, padist::dist::implementation::vector);
        const distribution v = space->make({3, 1, 4, 1, 5});
        const distribution zero = v.scale(padic_number::exact(7, 0));
        if (zero.precision_relative() != 0 || !padist::core::is_infinite(zero.ordp()) ||
            padist::io::to_string(zero) != "0") {
            std::cerr << "scaling by the exact zero should give the canonical zero\n";
            return false;
        }
        // O(7^3) times v is only known to 7^3.
        const distribution vague = v.scale(padic_number(7, mpq_class(0), 3));
        if (vague.precision_relative() != 0 || vague.ordp() != 3) {
            std::cerr << "scaling by an inexact zero mismatch\n";
            return false;
        }
        const distribution shifted = v.scale(padic_number(7, mpq_class(14), 3));
        if (shifted.ordp() != 1 || shifted.precision_relative() != 2) {
            std::cerr << "scalar of relative precision 2 should cap the result\n";
            padist::util::dump(std::cerr, shifted) << "\n";
            return false;
        }
        return true;
    }

    bool check_valuations_and_shifts() {
        const auto space = padist::dist::make_overconvergent_space(0, 7, 10, padist::dist::implementation::vector);
        const distribution divisible = space->make({7, 14, 21});
        if (!expect_moments(divisible, {1, 2}, 1, "common factor extraction")) {
            return false;
        }
        if (divisible.valuation() != 1 || divisible.precision_absolute() != 3) {
            std::cerr << "valuation of (7, 14, 21) mismatch\n";
            return false;
        }
        const distribution fractional = space->make({mpq_class(1, 7), 1});
        if (fractional.ordp() != -1 || fractional.moment(0) != mpq_class(1, 7)) {
            std::cerr << "negative valuations should move into ordp\n";
            return false;
        }
        if (divisible.diagonal_valuation() != 1) {
            std::cerr << "diagonal valuation mismatch\n";
            return false;
        }
        bool threw = false;
        try {
            (void)divisible.moment(5);
        } catch (const std::out_of_range &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "moment past N should throw\n";
            return false;
        }
        threw = false;
        try {
            (void)space->make(std::vector<mpq_class>(11, mpq_class(1)));
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "more moments than the cap should throw\n";
            return false;
        }
        return true;
    }

    bool check_reduce_precision() {
        const auto space = padist::dist::make_overconvergent_space(4, 5, 10, padist::dist::implementation::vector);
        const distribution v = space->make({1, 2, 3, 4, 1, 2});
        const distribution shorter = v.reduce_precision(3);
        if (!expect_moments(shorter, {1, 2, 3}, v.ordp(), "reduce_precision")) {
            return false;
        }
        bool threw = false;
        try {
            (void)v.reduce_precision(7);
        } catch (const padist::precision_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "reduce_precision past N should throw\n";
            return false;
        }
        return true;
    }

    bool check_find_scalar() {
        const auto space = padist::dist::make_overconvergent_space(5, 7, 15);
        const distribution v = space->make({1, 2, 3, 4, 5});
        const distribution w = v.scale(3);
        const padic_number alpha = v.find_scalar(w);
        if (!(alpha == padic_number(3))) {
            std::cerr << "find_scalar got " << alpha.to_string() << "\n";
            return false;
        }
        bool threw = false;
        try {
            (void)v.find_scalar(space->make({1, 1, 1, 1, 1}));
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "find_scalar on a non-multiple should throw\n";
            return false;
        }
        threw = false;
        try {
            (void)space->zero().find_scalar(v);
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "find_scalar from zero should throw\n";
            return false;
        }
        threw = false;
        try {
            (void)v.find_scalar(w, std::nullopt, 9);
        } catch (const padist::precision_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "find_scalar should reject an unattainable precision\n";
            return false;
        }
        return true;
    }

    // alpha agrees with the expected scalar to the precision it reports.
    bool scalar_matches(const padic_number &alpha, const mpq_class &expected, long p) {
        const long absprec = alpha.precision_absolute();
        return absprec >= 1 && padist::core::valuation(mpq_class(alpha.value() - expected), p) >= absprec;
    }

    bool check_find_scalar_random(std::mt19937_64 &rng) {
        const auto space = padist::dist::make_overconvergent_space(3, 7, 12, padist::dist::implementation::vector);
        std::uniform_int_distribution<long> draw(1, 117648);
        for (int iteration = 0; iteration < 32; ++iteration) {
            const distribution v = space->random_element(8, rng);
            if (v.is_zero()) {
                continue;
            }
            long unit = draw(rng);
            if (unit % 7 == 0) {
                ++unit;
            }
            const mpq_class c(unit);
            const padic_number alpha = v.find_scalar(v.scale(padic_number(c)));
            if (!scalar_matches(alpha, c, 7)) {
                std::cerr << "find_scalar for unit " << unit << " got " << alpha.to_string() << "\n";
                return false;
            }
            // Self divisible by 7, other by 49: the result carries the ordp difference.
            const distribution shifted = v.scale(7);
            const padic_number beta = shifted.find_scalar(shifted.scale(padic_number(mpq_class(7 * unit))));
            if (!scalar_matches(beta, mpq_class(7 * unit), 7) || padist::core::valuation(beta.value(), 7) != 1) {
                std::cerr << "find_scalar from a multiple of 7 got " << beta.to_string() << "\n";
                return false;
            }
        }
        return true;
    }

    bool check_symk() {
        const auto space = padist::dist::make_symk_space(2);
        const distribution v = space->make({1, 2, 3});
        const distribution half = v.scale(padic_number(mpq_class(1, 2)));
        if (!expect_moments(half, {mpq_class(1, 2), 1, mpq_class(3, 2)}, 0, "Sym^k scale")) {
            return false;
        }
        if (space->zero().moments().size() != 3 || !space->zero().is_zero()) {
            std::cerr << "Sym^2 zero should hold three zeros\n";
            return false;
        }
        const auto cubic = padist::dist::make_symk_space(3);
        const distribution zeroed = cubic->make({1, 2}).scale(padic_number(0));
        if (zeroed.moments() != cubic->zero().moments() || zeroed.moments().size() != 4) {
            std::cerr << "Sym^3 value scaled by the exact zero should be the space zero\n";
            padist::util::dump(std::cerr, zeroed) << "\n";
            return false;
        }
        if (space->make({5, 25, 10}).valuation(5) != 1) {
            std::cerr << "Sym^k valuation mismatch\n";
            return false;
        }
        if (padist::io::to_string(v) != "(1, 2, 3)") {
            std::cerr << "Sym^k to_string got " << padist::io::to_string(v) << "\n";
            return false;
        }
        bool threw = false;
        try {
            (void)space->make({1, 2, 3}, 1);
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "a valuation shift on an exact ring should throw\n";
            return false;
        }
        return true;
    }

} // namespace

int main() {
    std::mt19937_64 rng(0x7a11e5);
    if (!check_concrete_scenario() || !check_precision_invariants(rng) || !check_zero_scaling() ||
        !check_valuations_and_shifts() || !check_reduce_precision() || !check_find_scalar() || !check_find_scalar_random(rng) ||
        !check_symk()) {
        return 1;
    }
    std::cout << "dist_vector tests passed\n";
    return 0;
}
