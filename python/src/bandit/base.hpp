#pragma once
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <banditry_bits/bandit/base.hpp>
#include <random>
#include <string>

namespace banditry {
namespace bandit {

namespace py = pybind11;

/*
 * Trampoline so that bandits of other subtypes
 * can be implemented in Python.
 */
template <class BanditBaseType>
struct PyBanditBase : BanditBaseType {
    using base_t = BanditBaseType;
    using typename base_t::allocation_t;
    using base_t::base_t;

    allocation_t allocate_arms() const override {
        PYBIND11_OVERRIDE_PURE(allocation_t, base_t, allocate_arms, );
    }
};

template <class BanditBaseType>
void add_bandit_base(py::module_& m) {
    using bandit_t = BanditBaseType;
    using py_bandit_t = PyBanditBase<bandit_t>;
    using hi_t = typename bandit_t::historical_info_t;
    using allocation_t = typename bandit_t::allocation_t;
    using gen_t = std::mt19937;

    py::class_<bandit_t, py_bandit_t>(m, "BanditBase")
        .def(py::init<const hi_t&, const std::string&>(),
             py::arg("historical_info"), py::arg("subtype"),
             py::keep_alive<1, 2>())
        .def("allocate_arms", &bandit_t::allocate_arms)
        .def(
            "choose_arm",
            [](const bandit_t& b, gen_t& gen) { return b.choose_arm(gen); },
            py::arg("gen"))
        .def(
            "choose_arm",
            [](const bandit_t&, const allocation_t& allocation, gen_t& gen) {
                return bandit_t::choose_arm(allocation, gen);
            },
            py::arg("allocation"), py::arg("gen"))
        .def_property_readonly("subtype", &bandit_t::subtype)
        .def_property_readonly("historical_info", &bandit_t::historical_info,
                               py::return_value_policy::reference_internal);
}

}  // namespace bandit
}  // namespace banditry
