// include/padist/util/debug.hpp — Tagged dumps of distributions and acting matrices.

#pragma once

#include <cstddef>
#include <ostream>

#include <padist/action/weight_k_action.hpp>
#include <padist/core/padic_number.hpp>
#include <padist/dist/distribution.hpp>
#include <padist/io/format.hpp>

namespace padist::util {

    inline std::ostream &dump(std::ostream &os, const core::padic_number &value) {
        return os << "padic(" << value.to_string() << ')';
    }

    inline std::ostream &dump(std::ostream &os, const dist::distribution &value) {
        return os << (value.is_bounded() ? "dist_long" : "dist_vector") << '('
                  << io::to_string(value) << " | ordp=" << value.ordp()
                  << " N=" << value.precision_relative() << ')';
    }

    template <typename T>
    std::ostream &dump(std::ostream &os, const action::dense_matrix<T> &matrix) {
        os << "matrix " << matrix.rows() << 'x' << matrix.cols() << '\n';
        for (std::size_t row = 0; row < matrix.rows(); ++row) {
            for (std::size_t col = 0; col < matrix.cols(); ++col) {
                os << (col == 0 ? "  " : " ") << matrix(row, col);
            }
            os << '\n';
        }
        return os;
    }

} // namespace padist::util
