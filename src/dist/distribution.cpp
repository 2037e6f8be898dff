// src/dist/distribution.cpp — Dispatch over the two moment representations.

#include <padist/dist/distribution.hpp>

#include <padist/errors.hpp>
#include <padist/io/format.hpp>

namespace padist::dist {

    distribution distribution::adopt(dist_vector value) {
        if (value.space()->uses_bounded()) {
            return distribution(dist_long::from_vector(value));
        }
        return distribution(std::move(value));
    }

    dist_vector distribution::to_vector() const {
        if (const auto *bounded = std::get_if<dist_long>(&value_)) {
            return bounded->to_vector();
        }
        return std::get<dist_vector>(value_);
    }

    const dist_long &distribution::as_bounded() const {
        if (const auto *bounded = std::get_if<dist_long>(&value_)) {
            return *bounded;
        }
        throw unsupported_operation("distribution is not backed by the bounded representation");
    }

    const space_ptr &distribution::space() const noexcept {
        return std::visit([](const auto &v) -> const space_ptr & { return v.space(); }, value_);
    }

    mpq_class distribution::moment(std::size_t index) const {
        return std::visit([index](const auto &v) { return v.moment(index); }, value_);
    }

    mpq_class distribution::unscaled_moment(std::size_t index) const {
        return std::visit([index](const auto &v) { return mpq_class(v.unscaled_moment(index)); },
                          value_);
    }

    std::vector<mpq_class> distribution::moments() const {
        return to_vector().unscaled_moments();
    }

    long distribution::ordp() const noexcept {
        return std::visit([](const auto &v) { return v.ordp(); }, value_);
    }

    long distribution::precision_relative() const noexcept {
        return std::visit([](const auto &v) { return v.precision_relative(); }, value_);
    }

    long distribution::precision_absolute() const noexcept {
        return std::visit([](const auto &v) { return v.precision_absolute(); }, value_);
    }

    distribution &distribution::normalize() {
        std::visit([](auto &v) { v.normalize(); }, value_);
        return *this;
    }

    distribution &distribution::quasi_normalize() {
        if (auto *bounded = std::get_if<dist_long>(&value_)) {
            bounded->quasi_normalize();
            return *this;
        }
        throw unsupported_operation("quasi_normalize is only defined on bounded distributions");
    }

    distribution distribution::scale(const core::padic_number &scalar) const {
        return std::visit([&scalar](const auto &v) { return distribution(v.scale(scalar)); }, value_);
    }

    distribution distribution::add(const distribution &other) const {
        if (is_bounded() && other.is_bounded()) {
            return distribution(as_bounded().add(other.as_bounded()));
        }
        return adopt(to_vector().add(other.to_vector()));
    }

    distribution distribution::sub(const distribution &other) const {
        if (is_bounded() && other.is_bounded()) {
            return distribution(as_bounded().sub(other.as_bounded()));
        }
        return adopt(to_vector().sub(other.to_vector()));
    }

    distribution distribution::negate() const {
        return std::visit([](const auto &v) { return distribution(v.negate()); }, value_);
    }

    int distribution::compare(const distribution &other) const {
        if (is_bounded() && other.is_bounded()) {
            return as_bounded().compare(other.as_bounded());
        }
        return to_vector().compare(other.to_vector());
    }

    distribution distribution::reduce_precision(long M) const {
        return std::visit([M](const auto &v) { return distribution(v.reduce_precision(M)); }, value_);
    }

    bool distribution::is_zero() const {
        return std::visit([](const auto &v) { return v.is_zero(); }, value_);
    }

    bool distribution::is_zero(long p, std::optional<long> M) const {
        return std::visit([p, M](const auto &v) { return v.is_zero(p, M); }, value_);
    }

    long distribution::valuation(std::optional<long> p) const {
        return std::visit([p](const auto &v) { return v.valuation(p); }, value_);
    }

    long distribution::diagonal_valuation(std::optional<long> p) const {
        return std::visit([p](const auto &v) { return v.diagonal_valuation(p); }, value_);
    }

    core::padic_number distribution::find_scalar(const distribution &other, std::optional<long> p,
                                                 std::optional<long> M, bool check) const {
        if (is_bounded() && other.is_bounded()) {
            return as_bounded().find_scalar(other.as_bounded(), p, M, check);
        }
        return to_vector().find_scalar(other.to_vector(), p, M, check);
    }

    distribution distribution::specialize(std::optional<base_ring> ring) const {
        return distribution(to_vector().specialize(ring));
    }

    distribution distribution::lift(std::optional<long> p, std::optional<long> M,
                                    std::optional<base_ring> ring) const {
        return adopt(to_vector().lift(p, M, ring));
    }

    distribution distribution::solve_diff_eqn() const {
        return std::visit([](const auto &v) { return distribution(v.solve_diff_eqn()); }, value_);
    }

    distribution distribution::act_right(const core::matrix2 &g) const {
        return std::visit([&g](const auto &v) { return distribution(v.act_right(g)); }, value_);
    }

    distribution distribution::act_right(const core::sigma0_element &g) const {
        const long np = space()->Np();
        if (g.level() % np != 0) {
            throw action_error("Sigma0(" + std::to_string(g.level()) + ") does not act on level " +
                               std::to_string(np));
        }
        return act_right(g.matrix());
    }

    std::string distribution::to_string() const {
        return io::to_string(*this);
    }

} // namespace padist::dist
