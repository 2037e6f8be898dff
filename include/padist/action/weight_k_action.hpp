// include/padist/action/weight_k_action.hpp — Weight-k right action of 2x2 matrices on moments.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <gmpxx.h>

#include <padist/config.hpp>
#include <padist/core/matrix2.hpp>
#include <padist/dist/dist_long.hpp>
#include <padist/dist/dist_vector.hpp>
#include <padist/dist/space.hpp>
#include <padist/util/verbose.hpp>

namespace padist::action {

    // Row-major rows x cols storage.
    template <typename T> class dense_matrix {
      public:
        using value_type = T;

        dense_matrix() = default;
        dense_matrix(std::size_t rows, std::size_t cols, const T &fill = T())
            : rows_(rows), cols_(cols), storage_(rows * cols, fill) {
        }

        std::size_t rows() const noexcept {
            return rows_;
        }
        std::size_t cols() const noexcept {
            return cols_;
        }

        T &operator()(std::size_t row, std::size_t column) {
            return storage_.at(row * cols_ + column);
        }
        const T &operator()(std::size_t row, std::size_t column) const {
            return storage_.at(row * cols_ + column);
        }

        // Top-left size x size block.
        dense_matrix block(std::size_t size) const {
            if (size > rows_ || size > cols_) {
                throw std::out_of_range("dense_matrix block larger than the matrix");
            }
            dense_matrix result(size, size);
            for (std::size_t row = 0; row < size; ++row) {
                for (std::size_t col = 0; col < size; ++col) {
                    result(row, col) = (*this)(row, col);
                }
            }
            return result;
        }

        friend bool operator==(const dense_matrix &lhs, const dense_matrix &rhs) {
            return lhs.rows_ == rhs.rows_ && lhs.cols_ == rhs.cols_ && lhs.storage_ == rhs.storage_;
        }

      private:
        std::size_t rows_ = 0;
        std::size_t cols_ = 0;
        std::vector<T> storage_;
    };

    // Per-key acting matrices. The key map sits behind a shared mutex; each entry has its own
    // mutex so that one key is computed once while other keys proceed.
    template <typename Matrix> class acting_matrix_cache {
      public:
        using matrix_ptr = std::shared_ptr<const Matrix>;

        // check() runs before a key is first inserted; compute(M) builds the matrix at precision
        // M and truncate(matrix, M) cuts a higher-precision one down.
        template <typename Check, typename Compute, typename Truncate>
        matrix_ptr get(const core::matrix_key &key, std::size_t M, std::size_t cap, Check &&check,
                       Compute &&compute, Truncate &&truncate) {
            std::shared_ptr<entry> slot = find(key);
            if (!slot) {
                check();
                std::unique_lock<std::shared_mutex> lock(mutex_);
                slot = entries_.try_emplace(key, std::make_shared<entry>()).first->second;
            }
            std::lock_guard<std::mutex> guard(slot->mutex);
            if (const auto it = slot->by_precision.find(M); it != slot->by_precision.end()) {
                return it->second;
            }
            if (slot->max_precision > 0 && M <= slot->max_precision) {
                auto truncated = std::make_shared<const Matrix>(
                    truncate(*slot->by_precision.at(slot->max_precision), M));
                slot->by_precision.emplace(M, truncated);
                return truncated;
            }
            std::size_t target = M;
            if (slot->max_precision > 0) {
                target = std::max(M, std::min(config::cache_growth_factor * slot->max_precision, cap));
            }
            util::verbose(1, "acting matrix [{} {}; {} {}]: computing at precision {} (requested {})",
                          key[0], key[1], key[2], key[3], target, M);
            auto full = std::make_shared<const Matrix>(compute(target));
            slot->by_precision[target] = full;
            slot->max_precision = target;
            if (target == M) {
                return full;
            }
            auto truncated = std::make_shared<const Matrix>(truncate(*full, M));
            slot->by_precision.emplace(M, truncated);
            return truncated;
        }

        std::size_t cached_precision(const core::matrix_key &key) const {
            const std::shared_ptr<entry> slot = find(key);
            if (!slot) {
                return 0;
            }
            std::lock_guard<std::mutex> guard(slot->mutex);
            return slot->max_precision;
        }

        void clear() {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            entries_.clear();
        }

        std::size_t size() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return entries_.size();
        }

      private:
        struct entry {
            std::mutex mutex;
            std::size_t max_precision = 0;
            std::map<std::size_t, matrix_ptr> by_precision;
        };

        std::shared_ptr<entry> find(const core::matrix_key &key) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            const auto it = entries_.find(key);
            return it == entries_.end() ? nullptr : it->second;
        }

        mutable std::shared_mutex mutex_;
        std::unordered_map<core::matrix_key, std::shared_ptr<entry>, core::matrix_key_hash> entries_;
    };

    // The image of v under g has moments v * A(g, N), where column j of A(g, N) holds the
    // coefficients of (a + cy)^k ((b + dy) / (a + cy))^j, optionally twisted by chi(a) and
    // det(g)^n. Entries live in Q for Sym^k and in Z/p^N otherwise.
    class weight_k_action {
      public:
        using exact_matrix = dense_matrix<mpq_class>;
        using residue_matrix = dense_matrix<mpz_class>;
        using bounded_matrix = dense_matrix<std::int64_t>;

        explicit weight_k_action(const dist::distribution_space &space) : space_(space) {
        }

        std::shared_ptr<const exact_matrix> exact_acting_matrix(const core::matrix2 &g,
                                                                std::size_t M) const;
        std::shared_ptr<const residue_matrix> acting_matrix(const core::matrix2 &g,
                                                            std::size_t M) const;
        std::shared_ptr<const bounded_matrix> bounded_acting_matrix(const core::matrix2 &g,
                                                                    std::size_t M) const;

        // Direct constructions, bypassing the cache and the matrix checks.
        exact_matrix compute_exact(const core::matrix_key &abcd, std::size_t M) const;
        residue_matrix compute_residue(const core::matrix_key &abcd, std::size_t M) const;
        bounded_matrix compute_bounded(const core::matrix_key &abcd, std::size_t M) const;

        dist::dist_vector act(const dist::dist_vector &v, const core::matrix2 &g) const;
        dist::dist_long act(const dist::dist_long &v, const core::matrix2 &g) const;

        // Throws action_error for matrices outside the monoid the action is defined on.
        void check_matrix(const core::matrix_key &abcd) const;

        std::size_t cached_precision(const core::matrix2 &g) const;
        std::size_t cache_size() const;
        void clear_cache() const;

      private:
        std::size_t cap() const noexcept;

        const dist::distribution_space &space_;
        mutable acting_matrix_cache<exact_matrix> exact_cache_;
        mutable acting_matrix_cache<residue_matrix> residue_cache_;
        mutable acting_matrix_cache<bounded_matrix> bounded_cache_;
    };

} // namespace padist::action
