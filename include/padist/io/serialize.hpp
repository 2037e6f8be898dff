// include/padist/io/serialize.hpp — Serialized form of distributions and their spaces.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gmpxx.h>

#include <padist/dist/distribution.hpp>
#include <padist/dist/space.hpp>

namespace padist::io {

    // The serializable part of space_options. Characters and tuplegens are recorded only by
    // presence; a space that has either must be supplied to from_serialized.
    struct space_descriptor {
        long weight = 0;
        long prime = 0;
        long precision_cap = 0;
        dist::base_ring ring = dist::base_ring::padic_integers;
        bool symk = false;
        long level = 1;
        dist::implementation impl = dist::implementation::automatic;
        std::optional<long> dettwist;
        bool character = false;
        bool tuplegen = false;

        static space_descriptor of(const dist::distribution_space &space);
        dist::space_options to_options() const;
        bool operator==(const space_descriptor &) const = default;
    };

    struct serialized_distribution {
        std::string class_tag;
        std::vector<mpq_class> moments;
        space_descriptor space;
        long ordp = 0;
        bool skip_validation = true;
    };

    serialized_distribution to_serialized(const dist::distribution &value);
    // Rebuilds the value; with skip_validation the moments are stored without normalization.
    dist::distribution from_serialized(const serialized_distribution &data,
                                       dist::space_ptr space = nullptr);

    std::string serialize(const dist::distribution &value);
    serialized_distribution parse(std::string_view text);
    dist::distribution deserialize(std::string_view text, dist::space_ptr space = nullptr);

} // namespace padist::io
