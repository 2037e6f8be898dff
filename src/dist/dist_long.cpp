// src/dist/dist_long.cpp — Bounded-width moment arithmetic with explicit overflow bands.

#include <padist/dist/dist_long.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

#include <padist/action/weight_k_action.hpp>
#include <padist/core/arith.hpp>
#include <padist/errors.hpp>

namespace padist::dist {

    namespace {

        using core::is_infinite;
        using core::residue;
        using core::saturating_add;

        bool outside_band(std::int64_t value) noexcept {
            return value > config::overflow_threshold || value < config::underflow_threshold;
        }

        void require_compatible(const dist_long &lhs, const dist_long &rhs) {
            if (lhs.space() == rhs.space()) {
                return;
            }
            if (lhs.prime() != rhs.prime() || lhs.space()->weight() != rhs.space()->weight()) {
                throw value_error("distributions belong to incompatible spaces");
            }
        }

    } // namespace

    dist_long::dist_long(raw_tag, space_ptr space, std::vector<std::int64_t> moments, long ordp)
        : space_(std::move(space)), moments_(std::move(moments)), ordp_(ordp) {
    }

    dist_long::dist_long(space_ptr space, const std::vector<std::int64_t> &moments, long ordp,
                         bool check, bool normalize_moments)
        : space_(std::move(space)), moments_(moments), ordp_(ordp) {
        if (!space_) {
            throw std::invalid_argument("dist_long requires a space");
        }
        if (space_->is_symk() || space_->prime() == 0) {
            throw value_error("bounded distributions need a p-adic space");
        }
        if (moments_.size() > config::bounded_max_moments ||
            moments_.size() > space_->powers().max_exponent()) {
            throw value_error("moments too long");
        }
        if (check) {
            space_->approx_length_check(static_cast<long>(moments_.size()));
            quasi_normalize();
        }
        if (normalize_moments) {
            normalize();
        }
    }

    dist_long dist_long::zero(space_ptr space) {
        return from_raw(std::move(space), {}, config::infinite_ordp);
    }

    dist_long dist_long::from_vector(const dist_vector &value) {
        if (is_infinite(value.ordp())) {
            return zero(value.space());
        }
        const long p = value.prime();
        const long n = value.precision_relative();
        std::vector<std::int64_t> moments;
        moments.reserve(static_cast<std::size_t>(n));
        for (long i = 0; i < n; ++i) {
            const mpz_class digits =
                residue(value.unscaled_moment(static_cast<std::size_t>(i)), p, n - i);
            if (!digits.fits_slong_p()) {
                throw value_error("moments too long");
            }
            moments.push_back(static_cast<std::int64_t>(digits.get_si()));
        }
        return dist_long(value.space(), moments, value.ordp(), false, true);
    }

    dist_vector dist_long::to_vector() const {
        std::vector<mpq_class> moments;
        moments.reserve(moments_.size());
        for (const std::int64_t value : moments_) {
            moments.emplace_back(static_cast<long>(value));
        }
        return dist_vector::from_raw(space_, std::move(moments), ordp_);
    }

    mpq_class dist_long::moment(std::size_t index) const {
        if (index >= moments_.size()) {
            throw std::out_of_range("moment index " + std::to_string(index) + " out of range");
        }
        const mpq_class value(static_cast<long>(moments_[index]));
        if (ordp_ >= 0) {
            return mpq_class(value * mpq_class(core::prime_power(prime(), ordp_)));
        }
        return mpq_class(value / mpq_class(core::prime_power(prime(), -ordp_)));
    }

    std::int64_t dist_long::unscaled_moment(std::size_t index) const {
        if (index >= moments_.size()) {
            throw std::out_of_range("moment index " + std::to_string(index) + " out of range");
        }
        return moments_[index];
    }

    long dist_long::precision_absolute() const noexcept {
        return saturating_add(ordp_, precision_relative());
    }

    dist_long &dist_long::quasi_normalize() {
        const long n = precision_relative();
        for (long i = 0; i < n; ++i) {
            auto &value = moments_[static_cast<std::size_t>(i)];
            if (outside_band(value)) {
                value = residue(value, power(n - i));
            }
        }
        return *this;
    }

    dist_long &dist_long::normalize() {
        if (is_infinite(ordp_)) {
            moments_.clear();
            return *this;
        }
        const long n = precision_relative();
        const long p = prime();
        for (long i = 0; i < n; ++i) {
            auto &value = moments_[static_cast<std::size_t>(i)];
            value = residue(value, power(n - i));
        }
        long shift = n;
        for (const std::int64_t value : moments_) {
            if (value != 0) {
                shift = std::min(shift, core::valuation(value, p));
            }
        }
        if (shift > 0) {
            moments_.resize(static_cast<std::size_t>(n - shift));
            const std::int64_t divisor = power(shift);
            for (auto &value : moments_) {
                value /= divisor;
            }
            ordp_ += shift;
        }
        return *this;
    }

    dist_long dist_long::scale(const core::padic_number &scalar) const {
        if (scalar.is_exact_zero()) {
            return zero(space_);
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
        dist_long source = *this;
        source.quasi_normalize();
        auto length = source.moments_.size();
        if (!scalar.is_exact()) {
            length = std::min(length,
                              static_cast<std::size_t>(std::max(scalar.precision_relative(), 0L)));
        }
        const auto [shift, unit] = core::val_unit(scalar.value(), p);
        std::vector<std::int64_t> scaled(length, 0);
        if (length > 0) {
            // unit mod p^length is below the bounded modulus, so each product fits.
            const auto factor = static_cast<std::int64_t>(
                residue(unit, p, static_cast<long>(length)).get_si());
            for (std::size_t i = 0; i < length; ++i) {
                scaled[i] = source.moments_[i] * factor;
            }
        }
        dist_long result = from_raw(space_, std::move(scaled), ordp_ + shift);
        result.normalize();
        return result;
    }

    dist_long dist_long::addsub(const dist_long &other, bool negate) const {
        require_compatible(*this, other);
        if (is_infinite(other.ordp_)) {
            return *this;
        }
        if (is_infinite(ordp_)) {
            return negate ? other.negate() : dist_long::from_raw(space_, other.moments_, other.ordp_);
        }
        dist_long lhs = *this;
        dist_long rhs = other;
        lhs.quasi_normalize();
        rhs.quasi_normalize();

        const long aprec = std::min(lhs.precision_absolute(), rhs.precision_absolute());
        const long ordp = std::min(lhs.ordp_, rhs.ordp_);
        const long rprec = std::max(aprec - ordp, 0L);
        std::vector<std::int64_t> combined(static_cast<std::size_t>(rprec), 0);

        if (lhs.ordp_ == rhs.ordp_) {
            for (long i = 0; i < rprec; ++i) {
                const auto index = static_cast<std::size_t>(i);
                combined[index] = negate ? lhs.moments_[index] - rhs.moments_[index]
                                         : lhs.moments_[index] + rhs.moments_[index];
            }
        } else {
            const bool self_is_lower = lhs.ordp_ < rhs.ordp_;
            const dist_long &lower = self_is_lower ? lhs : rhs;
            const dist_long &higher = self_is_lower ? rhs : lhs;
            const long diff = higher.ordp_ - lower.ordp_;
            const long cutoff = std::max(rprec - diff, 0L);
            // The lower-ordp side enters with sign +1 when it is self; the other operand
            // carries the sign of the operation.
            const std::int64_t lower_sign = self_is_lower || !negate ? 1 : -1;
            const std::int64_t higher_sign = !self_is_lower || !negate ? 1 : -1;
            for (long i = 0; i < rprec; ++i) {
                const auto index = static_cast<std::size_t>(i);
                std::int64_t value = lower_sign * lower.moments_[index];
                if (i < cutoff) {
                    // Re-mask against the shrunken length before multiplying by p^diff.
                    const std::int64_t masked =
                        residue(higher.moments_[index], power(rprec - i - diff));
                    value += higher_sign * power(diff) * masked;
                }
                combined[index] = value;
            }
        }
        dist_long result = from_raw(space_, std::move(combined), ordp);
        result.quasi_normalize();
        return result;
    }

    dist_long dist_long::add(const dist_long &other) const {
        return addsub(other, false);
    }

    dist_long dist_long::sub(const dist_long &other) const {
        return addsub(other, true);
    }

    dist_long dist_long::negate() const {
        std::vector<std::int64_t> negated;
        negated.reserve(moments_.size());
        for (const std::int64_t value : moments_) {
            negated.push_back(-value);
        }
        return from_raw(space_, std::move(negated), ordp_);
    }

    int dist_long::compare(const dist_long &other) const {
        require_compatible(*this, other);
        dist_long lhs = *this;
        dist_long rhs = other;
        lhs.normalize();
        rhs.normalize();
        if (is_infinite(lhs.ordp_) && is_infinite(rhs.ordp_)) {
            return 0;
        }
        const long ordp = std::min(lhs.ordp_, rhs.ordp_);
        const long aprec = std::min(lhs.precision_absolute(), rhs.precision_absolute());
        const long rprec = aprec - ordp;
        auto aligned = [&](const dist_long &side, long i) -> std::int64_t {
            if (is_infinite(side.ordp_) || i >= side.precision_relative()) {
                return 0;
            }
            const long diff = side.ordp_ - ordp;
            const long width = rprec - i - diff;
            if (width <= 0) {
                return 0;
            }
            return residue(side.moments_[static_cast<std::size_t>(i)], power(width)) * power(diff);
        };
        for (long i = 0; i < rprec; ++i) {
            const std::int64_t left = aligned(lhs, i);
            const std::int64_t right = aligned(rhs, i);
            if (left != right) {
                return left < right ? -1 : 1;
            }
        }
        return 0;
    }

    dist_long dist_long::reduce_precision(long M) const {
        if (M > precision_relative()) {
            throw precision_error("not enough moments");
        }
        if (M < 0) {
            throw value_error("precision must be at least 0");
        }
        return from_raw(space_,
                        std::vector<std::int64_t>(moments_.begin(), moments_.begin() + M), ordp_);
    }

    bool dist_long::is_zero() const {
        const long n = precision_relative();
        for (long i = 0; i < n; ++i) {
            if (residue(moments_[static_cast<std::size_t>(i)], power(n - i)) != 0) {
                return false;
            }
        }
        return true;
    }

    bool dist_long::is_zero(long p, std::optional<long> M) const {
        if (!M) {
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
            const std::int64_t modulus = core::small_prime_power(p, n - i);
            if (residue(moments_[static_cast<std::size_t>(i)], modulus) != 0) {
                return false;
            }
        }
        return true;
    }

    long dist_long::valuation(std::optional<long> p) const {
        if (is_infinite(ordp_)) {
            return config::infinite_ordp;
        }
        const long q = p.value_or(prime());
        long best = precision_relative();
        for (const std::int64_t value : moments_) {
            if (value != 0) {
                best = std::min(best, core::valuation(value, q));
            }
        }
        return ordp_ + best;
    }

    long dist_long::diagonal_valuation(std::optional<long> p) const {
        if (is_infinite(ordp_)) {
            return config::infinite_ordp;
        }
        const long q = p.value_or(prime());
        long best = precision_relative();
        for (std::size_t i = 0; i < moments_.size(); ++i) {
            if (moments_[i] != 0) {
                best = std::min(best, static_cast<long>(i) + core::valuation(moments_[i], q));
            }
        }
        return ordp_ + best;
    }

    core::padic_number dist_long::find_scalar(const dist_long &other, std::optional<long> p,
                                              std::optional<long> M, bool check) const {
        return to_vector().find_scalar(other.to_vector(), p, M, check);
    }

    dist_vector dist_long::specialize(std::optional<base_ring> ring) const {
        return to_vector().specialize(ring);
    }

    dist_long dist_long::solve_diff_eqn() const {
        return from_vector(to_vector().solve_diff_eqn());
    }

    dist_long dist_long::act_right(const core::matrix2 &g) const {
        return space_->action().act(*this, g);
    }

} // namespace padist::dist
