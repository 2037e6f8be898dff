// include/padist/core/sigma0.hpp — The monoid Sigma0(N) of matrices acting on distributions.

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <padist/core/matrix2.hpp>

namespace padist::core {

    class sigma0;

    class sigma0_element {
      public:
        const matrix2 &matrix() const noexcept {
            return matrix_;
        }
        long level() const noexcept {
            return level_;
        }
        std::int64_t determinant() const {
            return matrix_.determinant();
        }
        std::int64_t operator()(std::size_t row, std::size_t column) const {
            return matrix_(row, column);
        }

        // Defined only when det = +-1, so that the inverse stays integral.
        sigma0_element inverse() const;

        friend sigma0_element operator*(const sigma0_element &lhs, const sigma0_element &rhs);
        friend bool operator==(const sigma0_element &lhs, const sigma0_element &rhs) noexcept {
            return lhs.level_ == rhs.level_ && lhs.matrix_ == rhs.matrix_;
        }

        std::string to_string() const {
            return matrix_.to_string();
        }

      private:
        friend class sigma0;
        sigma0_element(long level, const matrix2 &matrix) : level_(level), matrix_(matrix) {
        }

        long level_;
        matrix2 matrix_;
    };

    // Integer matrices [a b; c d] with det != 0, a a unit at every prime dividing N and c
    // divisible by N.
    class sigma0 {
      public:
        explicit sigma0(long level);

        long level() const noexcept {
            return level_;
        }
        const std::vector<std::pair<long, long>> &factorization() const noexcept {
            return factors_;
        }

        sigma0_element operator()(const matrix2 &matrix, bool check = true) const;

        // Throws value_error describing the first violated condition.
        void check(const matrix2 &matrix) const;
        bool contains(const matrix2 &matrix) const;

        std::string to_string() const {
            return "Monoid Sigma0(" + std::to_string(level_) + ")";
        }

      private:
        long level_;
        std::vector<std::pair<long, long>> factors_;
    };

} // namespace padist::core
