// src/dist/dist_vector.cpp — Moment arithmetic and precision tracking over GMP rationals.

#include <padist/dist/dist_vector.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

#include <padist/action/weight_k_action.hpp>
#include <padist/core/arith.hpp>
#include <padist/errors.hpp>
#include <padist/util/verbose.hpp>

namespace padist::dist {

    namespace {

        using core::is_infinite;
        using core::prime_power;
        using core::saturating_add;

        mpq_class times_prime_power(const mpq_class &value, long p, long exponent) {
            if (exponent >= 0) {
                return mpq_class(value * mpq_class(prime_power(p, exponent)));
            }
            return mpq_class(value / mpq_class(prime_power(p, -exponent)));
        }

        mpq_class reduced(const mpq_class &value, long p, long exponent) {
            if (exponent <= 0) {
                return mpq_class(0);
            }
            return mpq_class(core::residue(value, p, exponent));
        }

        // Moment i of a distribution rescaled to the shift target_ordp; zero past its length.
        mpq_class aligned_moment(const std::vector<mpq_class> &moments, long ordp, long target_ordp,
                                 long p, std::size_t index) {
            if (is_infinite(ordp) || index >= moments.size()) {
                return mpq_class(0);
            }
            if (ordp == target_ordp) {
                return moments[index];
            }
            return times_prime_power(moments[index], p, ordp - target_ordp);
        }

        int sign_of(int cmp_result) noexcept {
            return cmp_result < 0 ? -1 : (cmp_result > 0 ? 1 : 0);
        }

        void require_compatible(const dist_vector &lhs, const dist_vector &rhs) {
            if (lhs.space() == rhs.space()) {
                return;
            }
            if (lhs.prime() != rhs.prime() || lhs.is_symk() != rhs.is_symk() ||
                lhs.space()->weight() != rhs.space()->weight()) {
                throw value_error("distributions belong to incompatible spaces");
            }
        }

    } // namespace

    dist_vector::dist_vector(space_ptr space, std::vector<mpq_class> moments, long ordp, bool check,
                             bool normalize_moments)
        : space_(std::move(space)), moments_(std::move(moments)), ordp_(ordp) {
        if (!space_) {
            throw std::invalid_argument("dist_vector requires a space");
        }
        if (check) {
            for (auto &value : moments_) {
                value.canonicalize();
            }
            if (ordp_ != 0 && (space_->is_symk() || space_->prime() == 0)) {
                throw value_error("can not specify a valuation shift for an exact ring");
            }
            space_->approx_length_check(static_cast<long>(moments_.size()));
            if (!space_->is_symk()) {
                const long p = space_->prime();
                long lowest = 0;
                for (const auto &value : moments_) {
                    if (value != 0) {
                        lowest = std::min(lowest, core::valuation(value, p));
                    }
                }
                if (lowest < 0) {
                    for (auto &value : moments_) {
                        value = times_prime_power(value, p, -lowest);
                    }
                    ordp_ += lowest;
                }
            }
        }
        if (normalize_moments) {
            normalize();
        }
    }

    dist_vector dist_vector::zero(space_ptr space) {
        if (space->is_symk()) {
            const auto count = static_cast<std::size_t>(std::max(space->weight() + 1, 0L));
            return from_raw(std::move(space), std::vector<mpq_class>(count, mpq_class(0)), 0);
        }
        return from_raw(std::move(space), {}, config::infinite_ordp);
    }

    mpq_class dist_vector::moment(std::size_t index) const {
        if (index >= moments_.size()) {
            throw std::out_of_range("moment index " + std::to_string(index) + " out of range");
        }
        if (ordp_ == 0 || is_symk()) {
            return moments_[index];
        }
        return times_prime_power(moments_[index], prime(), ordp_);
    }

    const mpq_class &dist_vector::unscaled_moment(std::size_t index) const {
        if (index >= moments_.size()) {
            throw std::out_of_range("moment index " + std::to_string(index) + " out of range");
        }
        return moments_[index];
    }

    long dist_vector::precision_absolute() const noexcept {
        return saturating_add(ordp_, precision_relative());
    }

    dist_vector &dist_vector::normalize() {
        if (is_symk()) {
            return *this;
        }
        if (is_infinite(ordp_)) {
            moments_.clear();
            return *this;
        }
        const long p = prime();
        const long n = precision_relative();
        for (long i = 0; i < n; ++i) {
            moments_[static_cast<std::size_t>(i)] =
                reduced(moments_[static_cast<std::size_t>(i)], p, n - i);
        }
        long shift = n;
        for (const auto &value : moments_) {
            if (value != 0) {
                shift = std::min(shift, core::valuation(value, p));
            }
        }
        if (shift > 0) {
            moments_.resize(static_cast<std::size_t>(n - shift));
            const mpq_class divisor(prime_power(p, shift));
            for (auto &value : moments_) {
                value /= divisor;
            }
            ordp_ += shift;
        }
        return *this;
    }

    dist_vector dist_vector::scale(const core::padic_number &scalar) const {
        if (scalar.is_exact_zero()) {
            return zero(space_);
        }
        if (is_symk()) {
            std::vector<mpq_class> scaled;
            scaled.reserve(moments_.size());
            for (const auto &value : moments_) {
                scaled.emplace_back(value * scalar.value());
            }
            return from_raw(space_, std::move(scaled), ordp_);
        }
        const long p = prime();
        if (scalar.prime() != 0 && scalar.prime() != p) {
            throw value_error("scalar lives over a different prime");
        }
        if (is_infinite(ordp_)) {
            return *this;
        }
        if (scalar.value() == 0) {
            return from_raw(space_, {}, saturating_add(ordp_, scalar.precision_absolute()));
        }
        const auto [shift, unit] = core::val_unit(scalar.value(), p);
        std::vector<mpq_class> scaled;
        scaled.reserve(moments_.size());
        for (const auto &value : moments_) {
            scaled.emplace_back(value * unit);
        }
        if (!scalar.is_exact()) {
            const long relprec = std::max(scalar.precision_relative(), 0L);
            if (relprec < precision_relative()) {
                scaled.resize(static_cast<std::size_t>(relprec));
            }
        }
        dist_vector result = from_raw(space_, std::move(scaled), ordp_ + shift);
        result.normalize();
        return result;
    }

    dist_vector dist_vector::addsub(const dist_vector &other, bool negate) const {
        require_compatible(*this, other);
        if (is_symk()) {
            const std::size_t length = std::min(moments_.size(), other.moments_.size());
            std::vector<mpq_class> combined(length);
            for (std::size_t i = 0; i < length; ++i) {
                combined[i] = negate ? mpq_class(moments_[i] - other.moments_[i])
                                     : mpq_class(moments_[i] + other.moments_[i]);
            }
            return from_raw(space_, std::move(combined), 0);
        }
        if (is_infinite(other.ordp_)) {
            return *this;
        }
        if (is_infinite(ordp_)) {
            return negate ? other.negate() : dist_vector::from_raw(space_, other.moments_, other.ordp_);
        }
        const long p = prime();
        const long aprec = std::min(precision_absolute(), other.precision_absolute());
        const long ordp = std::min(ordp_, other.ordp_);
        const long rprec = std::max(aprec - ordp, 0L);
        std::vector<mpq_class> combined(static_cast<std::size_t>(rprec));
        for (std::size_t i = 0; i < combined.size(); ++i) {
            const mpq_class lhs = aligned_moment(moments_, ordp_, ordp, p, i);
            const mpq_class rhs = aligned_moment(other.moments_, other.ordp_, ordp, p, i);
            combined[i] = negate ? mpq_class(lhs - rhs) : mpq_class(lhs + rhs);
        }
        return from_raw(space_, std::move(combined), ordp);
    }

    dist_vector dist_vector::add(const dist_vector &other) const {
        return addsub(other, false);
    }

    dist_vector dist_vector::sub(const dist_vector &other) const {
        return addsub(other, true);
    }

    dist_vector dist_vector::negate() const {
        std::vector<mpq_class> negated;
        negated.reserve(moments_.size());
        for (const auto &value : moments_) {
            negated.emplace_back(-value);
        }
        return from_raw(space_, std::move(negated), ordp_);
    }

    int dist_vector::compare(const dist_vector &other) const {
        require_compatible(*this, other);
        dist_vector lhs = *this;
        dist_vector rhs = other;
        lhs.normalize();
        rhs.normalize();
        if (is_symk()) {
            const std::size_t length = std::min(lhs.moments_.size(), rhs.moments_.size());
            for (std::size_t i = 0; i < length; ++i) {
                if (const int c = sign_of(cmp(lhs.moments_[i], rhs.moments_[i])); c != 0) {
                    return c;
                }
            }
            return 0;
        }
        if (is_infinite(lhs.ordp_) && is_infinite(rhs.ordp_)) {
            return 0;
        }
        const long p = prime();
        const long ordp = std::min(lhs.ordp_, rhs.ordp_);
        const long aprec = std::min(lhs.precision_absolute(), rhs.precision_absolute());
        const long rprec = aprec - ordp;
        for (long i = 0; i < rprec; ++i) {
            const auto index = static_cast<std::size_t>(i);
            const mpz_class left =
                core::residue(aligned_moment(lhs.moments_, lhs.ordp_, ordp, p, index), p, rprec - i);
            const mpz_class right =
                core::residue(aligned_moment(rhs.moments_, rhs.ordp_, ordp, p, index), p, rprec - i);
            if (const int c = sign_of(cmp(left, right)); c != 0) {
                return c;
            }
        }
        return 0;
    }

    dist_vector dist_vector::reduce_precision(long M) const {
        if (M > precision_relative()) {
            throw precision_error("not enough moments");
        }
        if (M < 0) {
            throw value_error("precision must be at least 0");
        }
        return from_raw(space_, std::vector<mpq_class>(moments_.begin(), moments_.begin() + M), ordp_);
    }

    bool dist_vector::is_zero() const {
        if (is_symk()) {
            return std::all_of(moments_.begin(), moments_.end(),
                               [](const mpq_class &value) { return value == 0; });
        }
        const long p = prime();
        const long n = precision_relative();
        for (long i = 0; i < n; ++i) {
            if (core::residue(moments_[static_cast<std::size_t>(i)], p, n - i) != 0) {
                return false;
            }
        }
        return true;
    }

    bool dist_vector::is_zero(long p, std::optional<long> M) const {
        if (!M || is_symk()) {
            return is_zero();
        }
        if (*M > precision_absolute()) {
            return false;
        }
        if (is_infinite(ordp_)) {
            return true;
        }
        const long n = std::min(precision_relative(), *M - ordp_);
        for (long i = 0; i < n; ++i) {
            if (core::residue(moments_[static_cast<std::size_t>(i)], p, n - i) != 0) {
                return false;
            }
        }
        return true;
    }

    long dist_vector::prime_or(std::optional<long> p) const {
        if (p) {
            return *p;
        }
        if (prime() == 0) {
            throw value_error("a prime is required for a space without one");
        }
        return prime();
    }

    long dist_vector::valuation(std::optional<long> p) const {
        if (is_infinite(ordp_)) {
            return config::infinite_ordp;
        }
        const long q = prime_or(p);
        if (is_symk()) {
            long best = config::infinite_ordp;
            for (const auto &value : moments_) {
                best = std::min(best, core::valuation(value, q));
            }
            return best;
        }
        // Unknown digits are not credited: the bound is N, whatever the moments hold.
        long best = precision_relative();
        for (const auto &value : moments_) {
            if (value != 0) {
                best = std::min(best, core::valuation(value, q));
            }
        }
        return ordp_ + best;
    }

    long dist_vector::diagonal_valuation(std::optional<long> p) const {
        if (is_infinite(ordp_)) {
            return config::infinite_ordp;
        }
        const long q = prime_or(p);
        long best = is_symk() ? config::infinite_ordp : precision_relative();
        for (std::size_t i = 0; i < moments_.size(); ++i) {
            if (moments_[i] != 0) {
                best = std::min(best, static_cast<long>(i) + core::valuation(moments_[i], q));
            }
        }
        return saturating_add(ordp_, best);
    }

    core::padic_number dist_vector::find_scalar(const dist_vector &other, std::optional<long> p_arg,
                                                std::optional<long> M, bool check) const {
        const auto n = static_cast<std::size_t>(precision_relative());
        const auto other_n = static_cast<std::size_t>(other.precision_relative());
        if (n == 0) {
            throw value_error("self is zero");
        }
        util::verbose(2, "find_scalar: n = {}", n);
        auto other_moment = [&](std::size_t index) {
            return index < other_n ? other.moments_[index] : mpq_class(0);
        };

        std::size_t i = 0;
        if (is_symk()) {
            while (moments_[i] == 0) {
                if (other_moment(i) != 0) {
                    throw value_error("not a scalar multiple");
                }
                if (++i >= n) {
                    throw value_error("self is zero");
                }
            }
            const mpq_class alpha = other_moment(i) / moments_[i];
            if (check) {
                for (std::size_t j = i + 1; j < n; ++j) {
                    if (alpha * moments_[j] != other_moment(j)) {
                        throw value_error("not a scalar multiple");
                    }
                }
            }
            return core::padic_number(alpha);
        }

        const long p = p_arg.value_or(prime());
        const auto remaining = [&](std::size_t index) { return static_cast<long>(n - index); };
        long v = core::valuation(moments_[0], p);
        while (v >= remaining(i)) {
            if (++i >= n) {
                throw value_error("self is zero");
            }
            v = core::valuation(moments_[i], p);
        }
        if (is_infinite(other.ordp_)) {
            return core::padic_number::exact(p, mpq_class(0));
        }
        long relprec = remaining(i) - v;
        mpq_class alpha = other_moment(i) / moments_[i];
        long alpha_absprec = relprec;
        util::verbose(2, "find_scalar: alpha = {} from moment {}", alpha.get_str(), i);

        const std::size_t last = std::min(n, other_n);
        for (std::size_t j = i + 1; j < last; ++j) {
            const mpq_class &a = moments_[j];
            const long vj = core::valuation(a, p);
            if (check) {
                long attainable = std::min(remaining(j), static_cast<long>(other_n - j));
                attainable = std::min(attainable, saturating_add(alpha_absprec, vj));
                if (alpha != 0) {
                    attainable = std::min(attainable, remaining(j) + std::min(core::valuation(alpha, p), 0L));
                }
                const mpq_class difference = alpha * a - other_moment(j);
                if (attainable > 0 && difference != 0 && core::valuation(difference, p) < attainable) {
                    throw value_error("not a scalar multiple");
                }
            }
            if (!is_infinite(vj) && remaining(j) - vj > relprec) {
                util::verbose(2, "find_scalar: sharpening at moment {}: relprec {} -> {}", j, relprec,
                              remaining(j) - vj);
                relprec = remaining(j) - vj;
                alpha = other_moment(j) / a;
                alpha_absprec = relprec;
            }
        }
        if (M && relprec < *M) {
            throw precision_error("insufficient precision");
        }
        const long shift = other.ordp_ - ordp_;
        return core::padic_number(p, times_prime_power(alpha, p, shift), alpha_absprec + shift);
    }

    dist_vector dist_vector::specialize(std::optional<base_ring> ring) const {
        const long k = space_->weight();
        if (k < 0) {
            throw value_error("negative weight");
        }
        dist_vector source = *this;
        source.normalize();
        if (source.precision_absolute() < k + 1) {
            throw precision_error("not enough moments");
        }
        auto target = space_->specialize_space(ring);
        if (source.precision_relative() == 0) {
            return zero(std::move(target));
        }
        std::vector<mpq_class> values;
        values.reserve(static_cast<std::size_t>(k + 1));
        for (long j = 0; j <= k; ++j) {
            const auto index = static_cast<std::size_t>(j);
            values.push_back(index < source.moments_.size() ? source.moment(index) : mpq_class(0));
        }
        return dist_vector(std::move(target), std::move(values), 0, true, true);
    }

    dist_vector dist_vector::lift(std::optional<long> p, std::optional<long> M,
                                  std::optional<base_ring> ring) const {
        auto target = space_->lift_space(p, M, ring);
        const auto length = static_cast<std::size_t>(target->precision_cap());
        const auto known = std::min(moments_.size(), static_cast<std::size_t>(std::max(space_->weight() + 1, 0L)));
        std::vector<mpq_class> values(length, mpq_class(0));
        for (std::size_t j = 0; j < std::min(known, length); ++j) {
            values[j] = moment(j);
        }
        return dist_vector(std::move(target), std::move(values), 0, true, true);
    }

    dist_vector dist_vector::solve_diff_eqn() const {
        const long M = precision_relative();
        if (M == 0) {
            return *this;
        }
        const long p = prime();
        const bool total_zero = is_symk() ? moments_[0] == 0 : core::residue(moments_[0], p, M) == 0;
        if (!total_zero) {
            throw value_error("not total measure zero");
        }

        const auto size = static_cast<std::size_t>(M);
        std::vector<mpq_class> solved(size, mpq_class(0));
        // Absolute p-adic precision to which each solved slot is known.
        std::vector<long> slot_precision(size, config::infinite_precision);
        const mpq_class minus_half(-1, 2);
        auto accumulate = [&](std::size_t slot, const mpq_class &coefficient, const mpq_class &scalar,
                              long scalar_precision) {
            solved[slot] += coefficient * scalar;
            if (!is_symk()) {
                slot_precision[slot] = std::min(
                    slot_precision[slot], scalar_precision + core::valuation(coefficient, p));
            }
        };
        for (long m = 1; m < M; ++m) {
            const mpq_class scalar = moment(static_cast<std::size_t>(m)) / mpq_class(m);
            const long scalar_precision =
                is_symk() ? config::infinite_precision
                          : ordp_ + (M - m) - core::valuation(std::int64_t{m}, p);
            // B_1 = -1/2 is the only nonzero odd Bernoulli number.
            accumulate(static_cast<std::size_t>(m), mpq_class(m) * minus_half, scalar,
                       scalar_precision);
            for (long j = m - 1; j < M; j += 2) {
                const mpq_class coefficient =
                    mpq_class(core::binomial(static_cast<unsigned long>(j),
                                             static_cast<unsigned long>(m - 1))) *
                    core::bernoulli(static_cast<std::size_t>(j - m + 1));
                accumulate(static_cast<std::size_t>(j), coefficient, scalar, scalar_precision);
            }
        }

        if (is_symk()) {
            auto target = space_->ring() == base_ring::integers
                              ? space_->change_ring(base_ring::rationals)
                              : space_;
            return from_raw(std::move(target), std::move(solved), 0);
        }

        long ordp = config::infinite_ordp;
        for (std::size_t j = 0; j < size; ++j) {
            const long vj = solved[j] == 0 ? config::infinite_ordp : core::valuation(solved[j], p);
            ordp = std::min({ordp, vj, slot_precision[j]});
        }
        if (is_infinite(ordp)) {
            return zero(space_);
        }
        long length = M;
        for (long j = 0; j < length; ++j) {
            const long precision = slot_precision[static_cast<std::size_t>(j)];
            if (!is_infinite(precision)) {
                length = std::min(length, j + precision - ordp);
            }
        }
        length = std::max(length, 0L);
        util::verbose(2, "solve_diff_eqn: ordp {}, {} of {} moments determined", ordp, length, M);
        std::vector<mpq_class> values;
        values.reserve(static_cast<std::size_t>(length));
        for (long j = 0; j < length; ++j) {
            values.push_back(times_prime_power(solved[static_cast<std::size_t>(j)], p, -ordp));
        }
        return dist_vector(space_, std::move(values), ordp, false, true);
    }

    dist_vector dist_vector::act_right(const core::matrix2 &g) const {
        return space_->action().act(*this, g);
    }

} // namespace padist::dist
