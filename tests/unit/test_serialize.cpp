// tests/unit/test_serialize.cpp — Unit tests for the text serialization of distributions.

#include <cstdint>
#include <iostream>
#include <random>
#include <string>

#include <padist/padist.hpp>

namespace {

    using padist::dist::distribution;
    using padist::dist::implementation;

    bool same_distribution(const distribution &original, const distribution &restored, const char *label) {
        if (original.is_bounded() != restored.is_bounded() || original.moments() != restored.moments() ||
            original.ordp() != restored.ordp() || original != restored) {
            std::cerr << label << " round trip mismatch\n";
            padist::util::dump(std::cerr, original) << "\n";
            padist::util::dump(std::cerr, restored) << "\n";
            return false;
        }
        return true;
    }

    bool check_round_trips(std::mt19937_64 &rng) {
        const auto generic = padist::dist::make_overconvergent_space(4, 7, 12);
        const auto bounded = padist::dist::make_overconvergent_space(4, 5, 6);
        const distribution v = generic->random_element(std::nullopt, rng).scale(49);
        const distribution w = bounded->random_element(std::nullopt, rng);
        if (!same_distribution(v, padist::io::deserialize(padist::io::serialize(v)), "vector") ||
            !same_distribution(w, padist::io::deserialize(padist::io::serialize(w)), "bounded") ||
            !same_distribution(v, padist::io::deserialize(padist::io::serialize(v), generic), "same space")) {
            return false;
        }
        const distribution zero = generic->zero();
        const distribution restored_zero = padist::io::deserialize(padist::io::serialize(zero));
        if (!padist::core::is_infinite(restored_zero.ordp()) || restored_zero.precision_relative() != 0) {
            std::cerr << "zero round trip lost the infinite ordp\n";
            return false;
        }
        padist::dist::space_options options;
        options.weight = 3;
        options.symk = true;
        options.ring = padist::dist::base_ring::integers;
        options.dettwist = -2;
        options.level = 11;
        const auto symk = padist::dist::distribution_space::create(options);
        const distribution classical = symk->make({1, -2, mpq_class(3, 4), 0});
        const distribution restored = padist::io::deserialize(padist::io::serialize(classical));
        if (!same_distribution(classical, restored, "Sym^k") || restored.space()->dettwist() != -2 ||
            restored.space()->level() != 11) {
            std::cerr << "Sym^k space parameters were not restored\n";
            return false;
        }
        return true;
    }

    bool check_text_form() {
        const auto space = padist::dist::make_overconvergent_space(2, 7, 10, implementation::vector);
        const std::string text = padist::io::serialize(space->make({1, 2, 3}).scale(7));
        const std::string expected = "padist-distribution 1\n"
                                     "class dist_vector\n"
                                     "space weight=2 prime=7 cap=10 ring=padic_integers symk=0 level=1 "
                                     "impl=vector dettwist=none character=0 tuplegen=0\n"
                                     "ordp 1\n"
                                     "moments 1 2 3\n"
                                     "skip_validation 1\n";
        if (text != expected) {
            std::cerr << "serialized text mismatch:\n" << text;
            return false;
        }
        // With validation the moments are normalized on the way in.
        padist::io::serialized_distribution data = padist::io::parse(text);
        data.moments = {mpq_class(50), 9, 3};
        data.skip_validation = false;
        const distribution checked = padist::io::from_serialized(data);
        if (checked.moments() != std::vector<mpq_class>{50, 9, 3} || checked.ordp() != 1) {
            std::cerr << "validated moments mismatch: " << checked.to_string() << "\n";
            return false;
        }
        data.moments = {mpq_class(350), 7, 7};
        const distribution shifted = padist::io::from_serialized(data);
        if (shifted.ordp() != 2 || shifted.moments() != std::vector<mpq_class>{1, 1}) {
            std::cerr << "validation should extract the common factor: " << shifted.to_string() << "\n";
            return false;
        }
        return true;
    }

    // The character cannot be written out, so a twisted value only comes back into its own space.
    bool check_character_space() {
        padist::dist::space_options options;
        options.weight = 2;
        options.prime = 7;
        options.precision_cap = 4;
        options.impl = implementation::vector;
        options.character = [](std::int64_t a) { return a * a; };
        const auto twisted = padist::dist::distribution_space::create(options);
        const distribution v = twisted->make({1, 2, 3, 4});
        const std::string text = padist::io::serialize(v);
        if (text.find(" character=1 tuplegen=0\n") == std::string::npos) {
            std::cerr << "character presence missing from space line:\n" << text;
            return false;
        }
        bool threw = false;
        try {
            (void)padist::io::deserialize(text);
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "deserializing a twisted value without its space should throw\n";
            return false;
        }
        options.character = nullptr;
        const auto untwisted = padist::dist::distribution_space::create(options);
        threw = false;
        try {
            (void)padist::io::deserialize(text, untwisted);
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "deserializing a twisted value into an untwisted space should throw\n";
            return false;
        }
        const distribution restored = padist::io::deserialize(text, twisted);
        if (!same_distribution(v, restored, "character space")) {
            return false;
        }
        const padist::core::matrix2 g(3, 1, 7, 5);
        if (v.act_right(g) != restored.act_right(g)) {
            std::cerr << "restored value acts differently: " << restored.act_right(g).to_string() << " vs "
                      << v.act_right(g).to_string() << "\n";
            return false;
        }
        return true;
    }

    template <typename Error> bool expect_failure(const std::string &text, const char *label) {
        try {
            (void)padist::io::deserialize(text);
        } catch (const Error &) {
            return true;
        }
        std::cerr << label << " should be rejected\n";
        return false;
    }

    bool check_failures() {
        const auto space = padist::dist::make_overconvergent_space(2, 7, 10, implementation::vector);
        const std::string text = padist::io::serialize(space->make({1, 2, 3}));
        const auto other = padist::dist::make_overconvergent_space(2, 7, 11, implementation::vector);
        bool threw = false;
        try {
            (void)padist::io::deserialize(text, other);
        } catch (const padist::value_error &) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "deserializing into a different space should throw\n";
            return false;
        }
        std::string bad_class = text;
        bad_class.replace(bad_class.find("dist_vector"), 11, "dist_matrix");
        std::string bad_ring = text;
        bad_ring.replace(bad_ring.find("padic_integers"), 14, "padic_numbers");
        return expect_failure<padist::value_error>("not a distribution\n", "missing header") &&
               expect_failure<padist::value_error>(bad_class, "unknown class") &&
               expect_failure<padist::value_error>(bad_ring, "unknown ring") &&
               expect_failure<padist::value_error>("padist-distribution 1\nclass dist_vector\n", "missing space");
    }

} // namespace

int main() {
    std::mt19937_64 rng(0x5e71a1);
    if (!check_round_trips(rng) || !check_text_form() || !check_character_space() || !check_failures()) {
        return 1;
    }
    std::cout << "serialize tests passed\n";
    return 0;
}
