// src/core/sigma0.cpp — Membership checks and arithmetic in Sigma0(N).

#include <padist/core/sigma0.hpp>

#include <padist/core/arith.hpp>
#include <padist/errors.hpp>

namespace padist::core {

    namespace {

        std::vector<std::pair<long, long>> factor(long n) {
            std::vector<std::pair<long, long>> factors;
            for (long p = 2; p * p <= n; ++p) {
                long e = 0;
                while (n % p == 0) {
                    n /= p;
                    ++e;
                }
                if (e > 0) {
                    factors.emplace_back(p, e);
                }
            }
            if (n > 1) {
                factors.emplace_back(n, 1);
            }
            return factors;
        }

    } // namespace

    sigma0::sigma0(long level) : level_(level) {
        if (level_ <= 0) {
            throw value_error("Modulus should be > 0");
        }
        factors_ = factor(level_);
    }

    void sigma0::check(const matrix2 &matrix) const {
        for (const auto &[p, e] : factors_) {
            if (valuation(matrix.c(), p) < e) {
                throw value_error("level " + std::to_string(p) + "^" + std::to_string(e) +
                                  " does not divide " + std::to_string(matrix.c()));
            }
            if (matrix.a() % p == 0) {
                throw value_error(std::to_string(matrix.a()) + " is not a unit at " +
                                  std::to_string(p));
            }
        }
        if (matrix.determinant() == 0) {
            throw value_error("matrix must be nonsingular");
        }
    }

    bool sigma0::contains(const matrix2 &matrix) const {
        try {
            check(matrix);
        } catch (const value_error &) {
            return false;
        }
        return true;
    }

    sigma0_element sigma0::operator()(const matrix2 &matrix, bool check_matrix) const {
        if (check_matrix) {
            check(matrix);
        }
        return sigma0_element(level_, matrix);
    }

    sigma0_element sigma0_element::inverse() const {
        const std::int64_t det = matrix_.determinant();
        if (det != 1 && det != -1) {
            throw value_error("matrix is not invertible over the integers");
        }
        // adj(g) / det with det = +-1
        const matrix2 inv(matrix_.d() * det, -matrix_.b() * det, -matrix_.c() * det,
                          matrix_.a() * det);
        return sigma0(level_)(inv);
    }

    sigma0_element operator*(const sigma0_element &lhs, const sigma0_element &rhs) {
        if (lhs.level_ != rhs.level_) {
            throw value_error("Sigma0 elements of different levels");
        }
        return sigma0_element(lhs.level_, lhs.matrix_ * rhs.matrix_);
    }

} // namespace padist::core
