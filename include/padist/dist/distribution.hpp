// include/padist/dist/distribution.hpp — One value type over both moment representations.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <gmpxx.h>

#include <padist/core/matrix2.hpp>
#include <padist/core/padic_number.hpp>
#include <padist/core/sigma0.hpp>
#include <padist/dist/dist_long.hpp>
#include <padist/dist/dist_vector.hpp>
#include <padist/dist/space.hpp>

namespace padist::dist {

    // Holds whichever representation the space selected. Binary operations on two bounded
    // values stay bounded; mixed pairs are computed on the GMP representation.
    class distribution {
      public:
        using representation = std::variant<dist_vector, dist_long>;

        distribution(dist_vector value) : value_(std::move(value)) {
        }
        distribution(dist_long value) : value_(std::move(value)) {
        }

        bool is_bounded() const noexcept {
            return std::holds_alternative<dist_long>(value_);
        }
        const representation &value() const noexcept {
            return value_;
        }
        dist_vector to_vector() const;
        // Throws unsupported_operation on the GMP representation.
        const dist_long &as_bounded() const;

        const space_ptr &space() const noexcept;
        long prime() const noexcept {
            return space()->prime();
        }

        mpq_class moment(std::size_t index) const;
        mpq_class unscaled_moment(std::size_t index) const;
        std::vector<mpq_class> moments() const;
        long ordp() const noexcept;
        long precision_relative() const noexcept;
        long precision_absolute() const noexcept;

        distribution &normalize();
        distribution &quasi_normalize();

        distribution scale(const core::padic_number &scalar) const;
        distribution add(const distribution &other) const;
        distribution sub(const distribution &other) const;
        distribution negate() const;
        int compare(const distribution &other) const;
        distribution reduce_precision(long M) const;

        bool is_zero() const;
        bool is_zero(long p, std::optional<long> M = std::nullopt) const;
        long valuation(std::optional<long> p = std::nullopt) const;
        long diagonal_valuation(std::optional<long> p = std::nullopt) const;

        core::padic_number find_scalar(const distribution &other, std::optional<long> p = std::nullopt,
                                       std::optional<long> M = std::nullopt,
                                       bool check = true) const;
        distribution specialize(std::optional<base_ring> ring = std::nullopt) const;
        distribution lift(std::optional<long> p = std::nullopt, std::optional<long> M = std::nullopt,
                          std::optional<base_ring> ring = std::nullopt) const;
        distribution solve_diff_eqn() const;
        distribution act_right(const core::matrix2 &g) const;
        // The element's level must be a multiple of the space's Np.
        distribution act_right(const core::sigma0_element &g) const;

        std::string to_string() const;

        distribution operator-() const {
            return negate();
        }
        friend distribution operator+(const distribution &lhs, const distribution &rhs) {
            return lhs.add(rhs);
        }
        friend distribution operator-(const distribution &lhs, const distribution &rhs) {
            return lhs.sub(rhs);
        }
        friend distribution operator*(const distribution &lhs, const core::padic_number &scalar) {
            return lhs.scale(scalar);
        }
        friend distribution operator*(const core::padic_number &scalar, const distribution &rhs) {
            return rhs.scale(scalar);
        }
        friend bool operator==(const distribution &lhs, const distribution &rhs) {
            return lhs.compare(rhs) == 0;
        }
        friend bool operator!=(const distribution &lhs, const distribution &rhs) {
            return lhs.compare(rhs) != 0;
        }

      private:
        // Converts a GMP value into the representation its space selects.
        static distribution adopt(dist_vector value);

        representation value_;
    };

} // namespace padist::dist
