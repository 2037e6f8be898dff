// include/padist/io/format.hpp — Text rendering of distributions and p-adic scalars.

#pragma once

#include <format>
#include <ostream>
#include <string>
#include <string_view>

#include <gmpxx.h>

#include <padist/core/padic_number.hpp>
#include <padist/dist/distribution.hpp>

namespace padist::io {

    // Base-p expansion of value mod p^absprec, e.g. "1 + 7 + O(7^2)"; value must be
    // p-integral.
    std::string padic_expansion(const mpq_class &value, long p, long absprec);

    // "(m_0 + O(p^N), ..., m_{N-1} + O(p))" with a "p^ordp * " prefix when ordp != 0;
    // Sym^k values print their exact moments as "(m_0, ..., m_k)".
    std::string to_string(const dist::distribution &value);

    inline std::string to_string(const core::padic_number &value) {
        return value.to_string();
    }

    inline std::ostream &operator<<(std::ostream &os, const dist::distribution &value) {
        return os << to_string(value);
    }

} // namespace padist::io

namespace std {

    template <> struct formatter<padist::dist::distribution, char> : std::formatter<std::string_view, char> {
        template <typename FormatContext>
        auto format(const padist::dist::distribution &value, FormatContext &ctx) const {
            const std::string text = padist::io::to_string(value);
            return std::formatter<std::string_view, char>::format(text, ctx);
        }
    };

} // namespace std
