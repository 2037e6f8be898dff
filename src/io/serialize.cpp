// src/io/serialize.cpp — Line-oriented text form of serialized distributions.

#include <padist/io/serialize.hpp>

#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <padist/core/arith.hpp>
#include <padist/errors.hpp>

namespace padist::io {

    namespace {

        constexpr std::string_view header = "padist-distribution 1";
        constexpr std::string_view vector_tag = "dist_vector";
        constexpr std::string_view long_tag = "dist_long";

        const char *implementation_name(dist::implementation impl) noexcept {
            switch (impl) {
            case dist::implementation::vector:
                return "vector";
            case dist::implementation::bounded:
                return "bounded";
            case dist::implementation::automatic:
                break;
            }
            return "automatic";
        }

        dist::base_ring parse_ring(const std::string &name) {
            for (const auto ring : {dist::base_ring::rationals, dist::base_ring::integers,
                                    dist::base_ring::padic_integers, dist::base_ring::padic_field}) {
                if (name == dist::base_ring_name(ring)) {
                    return ring;
                }
            }
            throw value_error("unknown base ring '" + name + "'");
        }

        dist::implementation parse_implementation(const std::string &name) {
            for (const auto impl : {dist::implementation::automatic, dist::implementation::vector,
                                    dist::implementation::bounded}) {
                if (name == implementation_name(impl)) {
                    return impl;
                }
            }
            throw value_error("unknown implementation '" + name + "'");
        }

        long parse_long(const std::string &text) {
            std::size_t used = 0;
            long value = 0;
            try {
                value = std::stol(text, &used);
            } catch (const std::logic_error &) {
                throw value_error("malformed integer '" + text + "'");
            }
            if (used != text.size()) {
                throw value_error("malformed integer '" + text + "'");
            }
            return value;
        }

        std::string ordp_text(long ordp) {
            return core::is_infinite(ordp) ? std::string("inf") : std::to_string(ordp);
        }

    } // namespace

    space_descriptor space_descriptor::of(const dist::distribution_space &space) {
        space_descriptor descriptor;
        descriptor.weight = space.weight();
        descriptor.prime = space.prime();
        descriptor.precision_cap = space.precision_cap();
        descriptor.ring = space.ring();
        descriptor.symk = space.is_symk();
        descriptor.level = space.level();
        descriptor.impl = space.options().impl;
        descriptor.dettwist = space.dettwist();
        descriptor.character = static_cast<bool>(space.character());
        descriptor.tuplegen = static_cast<bool>(space.options().tuplegen);
        return descriptor;
    }

    dist::space_options space_descriptor::to_options() const {
        dist::space_options options;
        options.weight = weight;
        options.prime = prime;
        options.precision_cap = precision_cap;
        options.ring = ring;
        options.symk = symk;
        options.level = level;
        options.impl = impl;
        options.dettwist = dettwist;
        return options;
    }

    serialized_distribution to_serialized(const dist::distribution &value) {
        serialized_distribution data;
        data.class_tag = std::string(value.is_bounded() ? long_tag : vector_tag);
        data.moments = value.moments();
        data.space = space_descriptor::of(*value.space());
        data.ordp = value.ordp();
        data.skip_validation = true;
        return data;
    }

    dist::distribution from_serialized(const serialized_distribution &data, dist::space_ptr space) {
        if (space) {
            if (space_descriptor::of(*space) != data.space) {
                throw value_error("serialized distribution does not belong to the given space");
            }
        } else if (data.space.character || data.space.tuplegen) {
            throw value_error("serialized space has a character or tuplegen; pass the target space");
        } else {
            space = dist::distribution_space::create(data.space.to_options());
        }
        const bool validate = !data.skip_validation;
        if (data.class_tag == vector_tag) {
            return dist::distribution(
                dist::dist_vector(std::move(space), data.moments, data.ordp, validate, validate));
        }
        if (data.class_tag == long_tag) {
            std::vector<std::int64_t> moments;
            moments.reserve(data.moments.size());
            for (const auto &value : data.moments) {
                if (value.get_den() != 1 || !value.get_num().fits_slong_p()) {
                    throw value_error("bounded moment " + value.get_str() + " is not a machine integer");
                }
                moments.push_back(static_cast<std::int64_t>(value.get_num().get_si()));
            }
            if (data.skip_validation) {
                return dist::distribution(
                    dist::dist_long::from_raw(std::move(space), std::move(moments), data.ordp));
            }
            return dist::distribution(dist::dist_long(std::move(space), moments, data.ordp));
        }
        throw value_error("unknown distribution class '" + data.class_tag + "'");
    }

    std::string serialize(const dist::distribution &value) {
        const serialized_distribution data = to_serialized(value);
        std::ostringstream out;
        out << header << '\n';
        out << "class " << data.class_tag << '\n';
        out << "space weight=" << data.space.weight << " prime=" << data.space.prime
            << " cap=" << data.space.precision_cap << " ring=" << dist::base_ring_name(data.space.ring)
            << " symk=" << (data.space.symk ? 1 : 0) << " level=" << data.space.level
            << " impl=" << implementation_name(data.space.impl) << " dettwist="
            << (data.space.dettwist ? std::to_string(*data.space.dettwist) : std::string("none"))
            << " character=" << (data.space.character ? 1 : 0)
            << " tuplegen=" << (data.space.tuplegen ? 1 : 0) << '\n';
        out << "ordp " << ordp_text(data.ordp) << '\n';
        out << "moments";
        for (const auto &moment : data.moments) {
            out << ' ' << moment.get_str();
        }
        out << '\n';
        out << "skip_validation " << (data.skip_validation ? 1 : 0) << '\n';
        return out.str();
    }

    serialized_distribution parse(std::string_view text) {
        std::istringstream in{std::string(text)};
        std::string line;
        if (!std::getline(in, line) || line != header) {
            throw value_error("missing serialized distribution header");
        }
        serialized_distribution data;
        bool seen_class = false;
        bool seen_space = false;
        while (std::getline(in, line)) {
            if (line.empty()) {
                continue;
            }
            std::istringstream fields(line);
            std::string key;
            fields >> key;
            if (key == "class") {
                fields >> data.class_tag;
                seen_class = true;
            } else if (key == "space") {
                std::unordered_map<std::string, std::string> entries;
                std::string entry;
                while (fields >> entry) {
                    const auto eq = entry.find('=');
                    if (eq == std::string::npos) {
                        throw value_error("malformed space entry '" + entry + "'");
                    }
                    entries[entry.substr(0, eq)] = entry.substr(eq + 1);
                }
                auto field = [&](const char *name) -> const std::string & {
                    const auto it = entries.find(name);
                    if (it == entries.end()) {
                        throw value_error(std::string("space descriptor lacks ") + name);
                    }
                    return it->second;
                };
                data.space.weight = parse_long(field("weight"));
                data.space.prime = parse_long(field("prime"));
                data.space.precision_cap = parse_long(field("cap"));
                data.space.ring = parse_ring(field("ring"));
                data.space.symk = parse_long(field("symk")) != 0;
                data.space.level = parse_long(field("level"));
                data.space.impl = parse_implementation(field("impl"));
                const std::string &twist = field("dettwist");
                data.space.dettwist =
                    twist == "none" ? std::nullopt : std::optional<long>(parse_long(twist));
                data.space.character = parse_long(field("character")) != 0;
                data.space.tuplegen = parse_long(field("tuplegen")) != 0;
                seen_space = true;
            } else if (key == "ordp") {
                std::string value;
                fields >> value;
                data.ordp = value == "inf" ? config::infinite_ordp : parse_long(value);
            } else if (key == "moments") {
                std::string value;
                while (fields >> value) {
                    mpq_class moment;
                    if (moment.set_str(value, 10) != 0) {
                        throw value_error("malformed moment '" + value + "'");
                    }
                    moment.canonicalize();
                    data.moments.push_back(std::move(moment));
                }
            } else if (key == "skip_validation") {
                std::string value;
                fields >> value;
                data.skip_validation = parse_long(value) != 0;
            } else {
                throw value_error("unknown serialized field '" + key + "'");
            }
        }
        if (!seen_class || !seen_space) {
            throw value_error("serialized distribution lacks a class or space line");
        }
        return data;
    }

    dist::distribution deserialize(std::string_view text, dist::space_ptr space) {
        return from_serialized(parse(text), std::move(space));
    }

} // namespace padist::io
