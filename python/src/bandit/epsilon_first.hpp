#pragma once
#include <pybind11/pybind11.h>

#include <banditry_bits/constant.hpp>
#include <banditry_bits/bandit/epsilon/epsilon_first.hpp>

namespace banditry {
namespace bandit {

namespace py = pybind11;

template <class EpsilonBaseType, class EpsilonFirstType>
void add_epsilon_first(py::module_& m) {
    using base_t = EpsilonBaseType;
    using bandit_t = EpsilonFirstType;
    using interface_t = typename base_t::base_t;
    using hi_t = typename bandit_t::historical_info_t;
    using value_t = typename bandit_t::value_t;

    py::class_<base_t, interface_t>(m, "EpsilonBase")
        .def_property_readonly("epsilon", &base_t::epsilon);

    py::class_<bandit_t, base_t>(m, "EpsilonFirst")
        .def(py::init<const hi_t&, value_t, value_t>(),
             py::arg("historical_info"), py::arg("epsilon") = default_epsilon,
             py::arg("total_samples") = default_total_samples,
             py::keep_alive<1, 2>())
        .def_property_readonly("total_samples", &bandit_t::total_samples)
        .def("is_exploring", &bandit_t::is_exploring);
}

}  // namespace bandit
}  // namespace banditry
