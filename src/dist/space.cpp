// src/dist/space.cpp — Space validation, representation choice and element factories.

#include <padist/dist/space.hpp>

#include <algorithm>
#include <stdexcept>

#include <padist/action/weight_k_action.hpp>
#include <padist/core/arith.hpp>
#include <padist/dist/distribution.hpp>
#include <padist/errors.hpp>
#include <padist/util/random.hpp>
#include <padist/util/verbose.hpp>

namespace padist::dist {

    const char *base_ring_name(base_ring ring) noexcept {
        switch (ring) {
        case base_ring::rationals:
            return "rationals";
        case base_ring::integers:
            return "integers";
        case base_ring::padic_integers:
            return "padic_integers";
        case base_ring::padic_field:
            return "padic_field";
        }
        return "unknown";
    }

    bool is_field(base_ring ring) noexcept {
        return ring == base_ring::rationals || ring == base_ring::padic_field;
    }

    distribution_space::distribution_space(space_options options) : options_(std::move(options)) {
        if (options_.symk) {
            if (options_.prime == 1 || options_.prime < 0) {
                throw value_error("invalid prime " + std::to_string(options_.prime));
            }
            options_.precision_cap = std::max(options_.weight + 1, 0L);
        } else {
            if (options_.prime < 2) {
                throw value_error("distributions need a prime p >= 2");
            }
            if (options_.precision_cap < 0) {
                throw value_error("precision cap must be non-negative");
            }
        }
        if (options_.level <= 0) {
            throw value_error("level must be positive");
        }
        np_ = options_.prime >= 2 ? core::lcm(options_.prime, options_.level) : options_.level;
        if (options_.prime >= 2) {
            powers_.emplace(options_.prime);
        }

        const bool fits = !options_.symk && options_.prime > 0 && !is_field(options_.ring) &&
                          static_cast<std::size_t>(options_.precision_cap) <= config::bounded_max_moments &&
                          static_cast<std::size_t>(options_.precision_cap) <= powers_->max_exponent();
        switch (options_.impl) {
        case implementation::automatic:
            bounded_ = fits;
            break;
        case implementation::vector:
            bounded_ = false;
            break;
        case implementation::bounded:
            if (!fits) {
                throw value_error("bounded representation needs a non-field p-adic space with "
                                  "7 * p^cap < 2^31");
            }
            bounded_ = true;
            break;
        }
        action_ = std::make_unique<action::weight_k_action>(*this);
        util::verbose(2, "created {} ({})", to_string(), bounded_ ? "bounded" : "vector");
    }

    distribution_space::~distribution_space() = default;

    std::shared_ptr<const distribution_space> distribution_space::create(space_options options) {
        return std::shared_ptr<const distribution_space>(new distribution_space(std::move(options)));
    }

    core::matrix_key distribution_space::tuple(const core::matrix2 &g) const {
        if (options_.tuplegen) {
            return options_.tuplegen(g);
        }
        return g.key();
    }

    const core::small_powers &distribution_space::powers() const {
        if (!powers_) {
            throw value_error("space has no prime");
        }
        return *powers_;
    }

    void distribution_space::clear_cache() const {
        action_->clear_cache();
    }

    distribution distribution_space::zero() const {
        if (bounded_) {
            return distribution(dist_long::zero(shared_from_this()));
        }
        return distribution(dist_vector::zero(shared_from_this()));
    }

    distribution distribution_space::make(std::vector<mpq_class> moments, long ordp, bool check) const {
        dist_vector value(shared_from_this(), std::move(moments), ordp, check, true);
        if (bounded_) {
            return distribution(dist_long::from_vector(value));
        }
        return distribution(std::move(value));
    }

    distribution distribution_space::from_scalar(const core::padic_number &value) const {
        return make({value.value()});
    }

    std::vector<distribution> distribution_space::basis(std::optional<long> M) const {
        const long length = approx_length_check(M);
        std::vector<distribution> result;
        result.reserve(static_cast<std::size_t>(length));
        for (long i = 0; i < length; ++i) {
            std::vector<mpq_class> moments(static_cast<std::size_t>(length), mpq_class(0));
            moments[static_cast<std::size_t>(i)] = 1;
            result.push_back(make(std::move(moments)));
        }
        return result;
    }

    distribution distribution_space::random_element(std::optional<long> M,
                                                    std::mt19937_64 &rng) const {
        const long length = approx_length_check(M);
        if (options_.symk) {
            return make(util::random_integers(rng, length, 100));
        }
        return make(util::random_moments(rng, options_.prime, length));
    }

    long distribution_space::approx_length_check(std::optional<long> M) const {
        if (!M) {
            return options_.precision_cap;
        }
        if (*M > options_.precision_cap) {
            throw value_error("M must be less than or equal to the precision cap");
        }
        if (*M < 0) {
            throw value_error("M must be non-negative");
        }
        return *M;
    }

    std::shared_ptr<const distribution_space>
    distribution_space::specialize_space(std::optional<base_ring> ring) const {
        if (options_.weight < 0) {
            throw value_error("negative weight");
        }
        space_options options = options_;
        options.symk = true;
        options.ring = ring.value_or(options_.ring);
        if (options.ring == base_ring::rationals || options.ring == base_ring::integers) {
            options.prime = 0;
        }
        options.impl = implementation::automatic;
        return create(std::move(options));
    }

    std::shared_ptr<const distribution_space>
    distribution_space::lift_space(std::optional<long> p, std::optional<long> M,
                                   std::optional<base_ring> ring) const {
        space_options options = options_;
        options.prime = p.value_or(options_.prime);
        if (options.prime == 0) {
            throw value_error("a prime must be given to lift a space without one");
        }
        if (options_.prime != 0 && options.prime != options_.prime) {
            throw value_error("cannot lift to a different prime");
        }
        options.symk = false;
        if (ring) {
            options.ring = *ring;
        } else if (options_.ring == base_ring::rationals || options_.ring == base_ring::integers) {
            options.ring = base_ring::padic_integers;
        }
        options.precision_cap = M.value_or(config::default_precision_cap);
        options.impl = implementation::automatic;
        return create(std::move(options));
    }

    std::shared_ptr<const distribution_space> distribution_space::change_precision(long M) const {
        space_options options = options_;
        options.precision_cap = M;
        return create(std::move(options));
    }

    std::shared_ptr<const distribution_space> distribution_space::change_ring(base_ring ring) const {
        space_options options = options_;
        options.ring = ring;
        if (options.impl == implementation::bounded && is_field(ring)) {
            options.impl = implementation::automatic;
        }
        return create(std::move(options));
    }

    std::string distribution_space::to_string() const {
        if (options_.symk) {
            return "Sym^" + std::to_string(options_.weight) + " " + base_ring_name(options_.ring) +
                   "^2";
        }
        return "Space of " + std::to_string(options_.prime) + "-adic distributions with k=" +
               std::to_string(options_.weight) + " action and precision cap " +
               std::to_string(options_.precision_cap);
    }

    space_ptr make_overconvergent_space(long weight, long prime, long precision_cap,
                                        implementation impl) {
        space_options options;
        options.weight = weight;
        options.prime = prime;
        options.precision_cap = precision_cap;
        options.ring = base_ring::padic_integers;
        options.impl = impl;
        return distribution_space::create(std::move(options));
    }

    space_ptr make_symk_space(long weight, base_ring ring, long prime) {
        space_options options;
        options.weight = weight;
        options.prime = prime;
        options.ring = ring;
        options.symk = true;
        return distribution_space::create(std::move(options));
    }

} // namespace padist::dist
