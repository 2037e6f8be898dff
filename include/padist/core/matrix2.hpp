// include/padist/core/matrix2.hpp — 2x2 integer matrices and their canonical hash keys.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>

namespace padist::core {

#if !defined(__SIZEOF_INT128__)
#error "padist::core::matrix2 requires __int128 support"
#endif

    namespace detail {
        using wide_int = __int128_t;

        inline std::int64_t narrow_checked(wide_int value) {
            if (value > std::numeric_limits<std::int64_t>::max() ||
                value < std::numeric_limits<std::int64_t>::min()) {
                throw std::overflow_error("matrix2 entry overflows int64_t");
            }
            return static_cast<std::int64_t>(value);
        }
    } // namespace detail

    // Canonical coefficient tuple (a, b, c, d) used to key acting-matrix caches.
    using matrix_key = std::array<std::int64_t, 4>;

    struct matrix_key_hash {
        std::size_t operator()(const matrix_key &key) const noexcept {
            std::size_t seed = 0;
            for (const std::int64_t entry : key) {
                seed ^= std::hash<std::int64_t>{}(entry) + 0x9e3779b97f4a7c15ULL + (seed << 6) +
                        (seed >> 2);
            }
            return seed;
        }
    };

    class matrix2 {
      public:
        constexpr matrix2() noexcept = default;
        constexpr matrix2(std::int64_t a, std::int64_t b, std::int64_t c, std::int64_t d) noexcept
            : a_(a), b_(b), c_(c), d_(d) {
        }
        matrix2(std::initializer_list<std::int64_t> init) {
            if (init.size() != 4) {
                throw std::invalid_argument("matrix2 initializer size mismatch");
            }
            auto it = init.begin();
            a_ = *it++;
            b_ = *it++;
            c_ = *it++;
            d_ = *it;
        }

        static constexpr matrix2 identity() noexcept {
            return matrix2(1, 0, 0, 1);
        }

        constexpr std::int64_t a() const noexcept {
            return a_;
        }
        constexpr std::int64_t b() const noexcept {
            return b_;
        }
        constexpr std::int64_t c() const noexcept {
            return c_;
        }
        constexpr std::int64_t d() const noexcept {
            return d_;
        }

        std::int64_t operator()(std::size_t row, std::size_t column) const {
            if (row > 1 || column > 1) {
                throw std::out_of_range("matrix2 index out of range");
            }
            return row == 0 ? (column == 0 ? a_ : b_) : (column == 0 ? c_ : d_);
        }

        std::int64_t determinant() const {
            return detail::narrow_checked(detail::wide_int(a_) * d_ - detail::wide_int(b_) * c_);
        }

        constexpr bool is_identity() const noexcept {
            return a_ == 1 && b_ == 0 && c_ == 0 && d_ == 1;
        }

        constexpr matrix_key key() const noexcept {
            return {a_, b_, c_, d_};
        }

        friend matrix2 operator*(const matrix2 &lhs, const matrix2 &rhs) {
            using detail::narrow_checked;
            using detail::wide_int;
            return matrix2(narrow_checked(wide_int(lhs.a_) * rhs.a_ + wide_int(lhs.b_) * rhs.c_),
                           narrow_checked(wide_int(lhs.a_) * rhs.b_ + wide_int(lhs.b_) * rhs.d_),
                           narrow_checked(wide_int(lhs.c_) * rhs.a_ + wide_int(lhs.d_) * rhs.c_),
                           narrow_checked(wide_int(lhs.c_) * rhs.b_ + wide_int(lhs.d_) * rhs.d_));
        }

        friend constexpr bool operator==(const matrix2 &lhs, const matrix2 &rhs) noexcept {
            return lhs.key() == rhs.key();
        }

        std::string to_string() const {
            return "[" + std::to_string(a_) + " " + std::to_string(b_) + "; " +
                   std::to_string(c_) + " " + std::to_string(d_) + "]";
        }

      private:
        std::int64_t a_ = 1;
        std::int64_t b_ = 0;
        std::int64_t c_ = 0;
        std::int64_t d_ = 1;
    };

} // namespace padist::core
