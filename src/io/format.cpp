// src/io/format.cpp — Base-p expansions of moments.

#include <padist/io/format.hpp>

#include <padist/core/arith.hpp>

namespace padist::io {

    namespace {

        std::string power_term(long p, long exponent) {
            if (exponent == 0) {
                return "";
            }
            if (exponent == 1) {
                return std::to_string(p);
            }
            return std::to_string(p) + "^" + std::to_string(exponent);
        }

        std::string digit_term(const mpz_class &digit, long p, long exponent) {
            if (exponent == 0) {
                return digit.get_str();
            }
            if (digit == 1) {
                return power_term(p, exponent);
            }
            return digit.get_str() + "*" + power_term(p, exponent);
        }

    } // namespace

    std::string padic_expansion(const mpq_class &value, long p, long absprec) {
        std::string text;
        if (absprec > 0) {
            mpz_class cursor = core::residue(value, p, absprec);
            const mpz_class prime(p);
            for (long exponent = 0; cursor != 0; ++exponent) {
                mpz_class digit;
                mpz_fdiv_qr(cursor.get_mpz_t(), digit.get_mpz_t(), cursor.get_mpz_t(),
                            prime.get_mpz_t());
                if (digit != 0) {
                    if (!text.empty()) {
                        text += " + ";
                    }
                    text += digit_term(digit, p, exponent);
                }
            }
        }
        if (!text.empty()) {
            text += " + ";
        }
        return text + "O(" + std::to_string(p) + "^" + std::to_string(absprec) + ")";
    }

    std::string to_string(const dist::distribution &value) {
        const dist::dist_vector vector = value.to_vector();
        const auto &moments = vector.unscaled_moments();
        std::string body = "(";
        if (vector.is_symk()) {
            for (std::size_t i = 0; i < moments.size(); ++i) {
                if (i != 0) {
                    body += ", ";
                }
                body += moments[i].get_str();
            }
            return body + ")";
        }
        if (core::is_infinite(vector.ordp())) {
            return "0";
        }
        const long p = vector.prime();
        const long n = vector.precision_relative();
        for (long i = 0; i < n; ++i) {
            if (i != 0) {
                body += ", ";
            }
            body += padic_expansion(moments[static_cast<std::size_t>(i)], p, n - i);
        }
        body += ")";
        if (vector.ordp() == 0) {
            return body;
        }
        return power_term(p, vector.ordp()) + " * " + body;
    }

} // namespace padist::io
