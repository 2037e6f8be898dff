// include/padist/dist/space.hpp — Parent spaces of p-adic distributions and Sym^k modules.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <gmpxx.h>

#include <padist/config.hpp>
#include <padist/core/matrix2.hpp>
#include <padist/core/padic_number.hpp>
#include <padist/core/prime_powers.hpp>
#include <padist/core/sigma0.hpp>

namespace padist::action {
    class weight_k_action;
}

namespace padist::dist {

    class distribution;

    enum class base_ring {
        rationals,
        integers,
        padic_integers,
        padic_field,
    };

    enum class implementation {
        automatic,
        vector,
        bounded,
    };

    using character_fn = std::function<std::int64_t(std::int64_t)>;
    using tuplegen_fn = std::function<core::matrix_key(const core::matrix2 &)>;

    const char *base_ring_name(base_ring ring) noexcept;
    bool is_field(base_ring ring) noexcept;

    struct space_options {
        long weight = 0;
        // 0 for a classical space without a distinguished prime.
        long prime = 0;
        long precision_cap = config::default_precision_cap;
        base_ring ring = base_ring::padic_integers;
        bool symk = false;
        character_fn character;
        std::optional<long> dettwist;
        long level = 1;
        implementation impl = implementation::automatic;
        tuplegen_fn tuplegen;
    };

    class distribution_space : public std::enable_shared_from_this<distribution_space> {
      public:
        static std::shared_ptr<const distribution_space> create(space_options options);

        distribution_space(const distribution_space &) = delete;
        distribution_space &operator=(const distribution_space &) = delete;
        ~distribution_space();

        const space_options &options() const noexcept {
            return options_;
        }
        long weight() const noexcept {
            return options_.weight;
        }
        long prime() const noexcept {
            return options_.prime;
        }
        long precision_cap() const noexcept {
            return options_.precision_cap;
        }
        base_ring ring() const noexcept {
            return options_.ring;
        }
        bool is_symk() const noexcept {
            return options_.symk;
        }
        const character_fn &character() const noexcept {
            return options_.character;
        }
        const std::optional<long> &dettwist() const noexcept {
            return options_.dettwist;
        }
        long level() const noexcept {
            return options_.level;
        }
        // lcm(p, level) for p-adic spaces; the level alone otherwise.
        long Np() const noexcept {
            return np_;
        }
        core::matrix_key tuple(const core::matrix2 &g) const;
        // Sigma0(Np); its elements satisfy every condition act_right checks.
        core::sigma0 monoid() const {
            return core::sigma0(np_);
        }

        bool uses_bounded() const noexcept {
            return bounded_;
        }
        // Throws for spaces without a prime.
        const core::small_powers &powers() const;

        action::weight_k_action &action() const {
            return *action_;
        }
        void clear_cache() const;

        distribution zero() const;
        distribution make(std::vector<mpq_class> moments, long ordp = 0, bool check = true) const;
        distribution from_scalar(const core::padic_number &value) const;
        std::vector<distribution> basis(std::optional<long> M = std::nullopt) const;
        distribution random_element(std::optional<long> M, std::mt19937_64 &rng) const;

        // M, or the precision cap when M is absent; rejects M above the cap.
        long approx_length_check(std::optional<long> M) const;

        std::shared_ptr<const distribution_space> specialize_space(
            std::optional<base_ring> ring = std::nullopt) const;
        std::shared_ptr<const distribution_space> lift_space(
            std::optional<long> p = std::nullopt, std::optional<long> M = std::nullopt,
            std::optional<base_ring> ring = std::nullopt) const;
        std::shared_ptr<const distribution_space> change_precision(long M) const;
        std::shared_ptr<const distribution_space> change_ring(base_ring ring) const;

        std::string to_string() const;

      private:
        explicit distribution_space(space_options options);

        space_options options_;
        long np_ = 1;
        bool bounded_ = false;
        std::optional<core::small_powers> powers_;
        std::unique_ptr<action::weight_k_action> action_;
    };

    using space_ptr = std::shared_ptr<const distribution_space>;

    // Overconvergent distributions of weight k over Z_p with the given precision cap.
    space_ptr make_overconvergent_space(long weight, long prime,
                                        long precision_cap = config::default_precision_cap,
                                        implementation impl = implementation::automatic);

    // Sym^k of the standard representation; prime may be 0.
    space_ptr make_symk_space(long weight, base_ring ring = base_ring::rationals, long prime = 0);

} // namespace padist::dist
