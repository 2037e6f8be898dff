// python/padist_module.cpp — Pybind11 module entrypoint exposing padist.

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>

#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include <padist/padist.hpp>

namespace py = pybind11;
using padist::core::matrix2;
using padist::core::padic_number;
using padist::dist::distribution;
using padist::dist::distribution_space;

static mpq_class to_rational(const py::handle &value) {
    const std::string text = py::str(value);
    mpq_class result;
    if (result.set_str(text, 10) != 0) {
        throw py::value_error("cannot read '" + text + "' as a rational number");
    }
    result.canonicalize();
    return result;
}

static py::object to_fraction(const mpq_class &value) {
    const auto fractions = py::module_::import("fractions");
    return fractions.attr("Fraction")(value.get_str());
}

namespace {

    std::vector<mpq_class> to_moments(const py::sequence &values) {
        std::vector<mpq_class> moments;
        moments.reserve(values.size());
        for (const auto &value : values) {
            moments.push_back(to_rational(value));
        }
        return moments;
    }

    py::list from_moments(const std::vector<mpq_class> &moments) {
        py::list result;
        for (const auto &value : moments) {
            result.append(to_fraction(value));
        }
        return result;
    }

    padic_number to_scalar(const py::handle &value, long prime, std::optional<long> absprec) {
        if (py::isinstance<padic_number>(value)) {
            return value.cast<padic_number>();
        }
        if (absprec) {
            return padic_number(prime, to_rational(value), *absprec);
        }
        return padic_number(to_rational(value));
    }

    matrix2 to_matrix(const std::vector<std::int64_t> &entries) {
        if (entries.size() != 4) {
            throw py::value_error("a 2x2 matrix is given as [a, b, c, d]");
        }
        return matrix2(entries[0], entries[1], entries[2], entries[3]);
    }

} // namespace

PYBIND11_MODULE(padist, module) {
    module.doc() = "p-adic distributions with a weight-k matrix action";

    py::register_exception<padist::value_error>(module, "ValueError", PyExc_ValueError);
    py::register_exception<padist::precision_error>(module, "PrecisionError", PyExc_ArithmeticError);
    py::register_exception<padist::action_error>(module, "ActionError", PyExc_ValueError);
    py::register_exception<padist::unsupported_operation>(module, "UnsupportedOperation",
                                                          PyExc_NotImplementedError);

    module.def("set_verbosity", &padist::util::set_verbosity, py::arg("level"),
               "Set the trace level written to stderr");

    py::enum_<padist::dist::base_ring>(module, "BaseRing")
        .value("RATIONALS", padist::dist::base_ring::rationals)
        .value("INTEGERS", padist::dist::base_ring::integers)
        .value("PADIC_INTEGERS", padist::dist::base_ring::padic_integers)
        .value("PADIC_FIELD", padist::dist::base_ring::padic_field);

    py::enum_<padist::dist::implementation>(module, "Implementation")
        .value("AUTOMATIC", padist::dist::implementation::automatic)
        .value("VECTOR", padist::dist::implementation::vector)
        .value("BOUNDED", padist::dist::implementation::bounded);

    py::class_<padic_number>(module, "PadicNumber")
        .def(py::init([](const py::object &value, long prime, std::optional<long> absprec) {
                 return padic_number(prime, to_rational(value),
                                     absprec.value_or(padist::config::infinite_precision));
             }),
             py::arg("value"), py::arg("prime") = 0, py::arg("absprec") = py::none())
        .def_property_readonly("prime", &padic_number::prime)
        .def_property_readonly("value", [](const padic_number &x) { return to_fraction(x.value()); })
        .def_property_readonly("precision_absolute", &padic_number::precision_absolute)
        .def("is_exact", &padic_number::is_exact)
        .def("is_zero", &padic_number::is_zero)
        .def("valuation", py::overload_cast<>(&padic_number::valuation, py::const_))
        .def("__add__", [](const padic_number &lhs, const padic_number &rhs) { return lhs + rhs; })
        .def("__sub__", [](const padic_number &lhs, const padic_number &rhs) { return lhs - rhs; })
        .def("__mul__", [](const padic_number &lhs, const padic_number &rhs) { return lhs * rhs; })
        .def("__neg__", [](const padic_number &value) { return -value; })
        .def("__eq__", [](const padic_number &lhs, const padic_number &rhs) { return lhs == rhs; })
        .def("__str__", &padic_number::to_string)
        .def("__repr__", [](const padic_number &value) { return "PadicNumber(" + value.to_string() + ")"; });

    py::class_<distribution_space, std::shared_ptr<distribution_space>>(module, "Space")
        .def(py::init([](long weight, long prime, long precision_cap, padist::dist::base_ring ring,
                         bool symk, std::optional<long> dettwist, long level,
                         padist::dist::implementation impl, padist::dist::character_fn character) {
                 padist::dist::space_options options;
                 options.weight = weight;
                 options.prime = prime;
                 options.precision_cap = precision_cap;
                 options.ring = ring;
                 options.symk = symk;
                 options.dettwist = dettwist;
                 options.level = level;
                 options.impl = impl;
                 options.character = std::move(character);
                 return std::const_pointer_cast<distribution_space>(distribution_space::create(options));
             }),
             py::arg("weight"), py::arg("prime") = 0,
             py::arg("precision_cap") = padist::config::default_precision_cap,
             py::arg("ring") = padist::dist::base_ring::padic_integers, py::arg("symk") = false,
             py::arg("dettwist") = py::none(), py::arg("level") = 1,
             py::arg("impl") = padist::dist::implementation::automatic,
             py::arg("character") = py::none())
        .def_property_readonly("weight", &distribution_space::weight)
        .def_property_readonly("prime", &distribution_space::prime)
        .def_property_readonly("precision_cap", &distribution_space::precision_cap)
        .def_property_readonly("ring", &distribution_space::ring)
        .def_property_readonly("is_symk", &distribution_space::is_symk)
        .def_property_readonly("uses_bounded", &distribution_space::uses_bounded)
        .def("zero", &distribution_space::zero)
        .def("make",
             [](const distribution_space &space, const py::sequence &moments, long ordp, bool check) {
                 return space.make(to_moments(moments), ordp, check);
             },
             py::arg("moments"), py::arg("ordp") = 0, py::arg("check") = true)
        .def("basis", &distribution_space::basis, py::arg("M") = py::none())
        .def("random_element",
             [](const distribution_space &space, std::optional<long> M, std::uint64_t seed) {
                 std::mt19937_64 rng(seed);
                 return space.random_element(M, rng);
             },
             py::arg("M") = py::none(), py::arg("seed") = 0)
        .def("clear_cache", &distribution_space::clear_cache)
        .def("cache_size", [](const distribution_space &space) { return space.action().cache_size(); })
        .def("__str__", &distribution_space::to_string);

    py::class_<distribution>(module, "Distribution")
        .def_property_readonly("is_bounded", &distribution::is_bounded)
        .def_property_readonly("ordp", &distribution::ordp)
        .def_property_readonly("prime", &distribution::prime)
        .def("moments", [](const distribution &value) { return from_moments(value.moments()); })
        .def("moment", [](const distribution &value, std::size_t index) {
            return to_fraction(value.moment(index));
        })
        .def("precision_relative", &distribution::precision_relative)
        .def("precision_absolute", &distribution::precision_absolute)
        .def("normalize", [](distribution value) { return value.normalize(); })
        .def("scale",
             [](const distribution &value, const py::object &scalar, std::optional<long> absprec) {
                 return value.scale(to_scalar(scalar, value.prime(), absprec));
             },
             py::arg("scalar"), py::arg("absprec") = py::none())
        .def("reduce_precision", &distribution::reduce_precision, py::arg("M"))
        .def("is_zero", [](const distribution &value) { return value.is_zero(); })
        .def("valuation", &distribution::valuation, py::arg("p") = py::none())
        .def("diagonal_valuation", &distribution::diagonal_valuation, py::arg("p") = py::none())
        .def("find_scalar", &distribution::find_scalar, py::arg("other"), py::arg("p") = py::none(),
             py::arg("M") = py::none(), py::arg("check") = true)
        .def("specialize", &distribution::specialize, py::arg("ring") = py::none())
        .def("lift", &distribution::lift, py::arg("p") = py::none(), py::arg("M") = py::none(),
             py::arg("ring") = py::none())
        .def("solve_diff_eqn", &distribution::solve_diff_eqn)
        .def("act_right", [](const distribution &value, const std::vector<std::int64_t> &g) {
            return value.act_right(to_matrix(g));
        })
        .def("serialize", [](const distribution &value) { return padist::io::serialize(value); })
        .def("__add__", [](const distribution &lhs, const distribution &rhs) { return lhs + rhs; })
        .def("__sub__", [](const distribution &lhs, const distribution &rhs) { return lhs - rhs; })
        .def("__neg__", [](const distribution &value) { return -value; })
        .def("__eq__", [](const distribution &lhs, const distribution &rhs) { return lhs == rhs; })
        .def("__str__", &distribution::to_string)
        .def("__repr__", [](const distribution &value) { return "Distribution" + value.to_string(); });

    module.def("deserialize",
               [](const std::string &text, std::shared_ptr<distribution_space> space) {
                   return padist::io::deserialize(text, std::move(space));
               },
               py::arg("text"), py::arg("space") = nullptr,
               "Rebuild a distribution from its serialized text");
    module.def(
        "overconvergent_space",
        [](long weight, long prime, long precision_cap, padist::dist::implementation impl) {
            return std::const_pointer_cast<distribution_space>(
                padist::dist::make_overconvergent_space(weight, prime, precision_cap, impl));
        },
        py::arg("weight"), py::arg("prime"), py::arg("precision_cap") = padist::config::default_precision_cap,
        py::arg("impl") = padist::dist::implementation::automatic);
    module.def(
        "symk_space",
        [](long weight, padist::dist::base_ring ring, long prime) {
            return std::const_pointer_cast<distribution_space>(padist::dist::make_symk_space(weight, ring, prime));
        },
        py::arg("weight"), py::arg("ring") = padist::dist::base_ring::rationals, py::arg("prime") = 0);
}
