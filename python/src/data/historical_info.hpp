#pragma once
#include <pybind11/eigen.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <banditry_bits/data/historical_info.hpp>
#include <sstream>

namespace banditry {
namespace data {

namespace py = pybind11;

template <class SampledArmType>
void add_sampled_arm(py::module_& m) {
    using arm_t = SampledArmType;
    using value_t = typename arm_t::value_t;

    py::class_<arm_t>(m, "SampledArm")
        .def(py::init<>())
        .def(py::init<value_t, value_t, value_t>(), py::arg("win") = 0,
             py::arg("loss") = 0, py::arg("total") = 0)
        .def_property_readonly("win", &arm_t::win)
        .def_property_readonly("loss", &arm_t::loss)
        .def_property_readonly("total", &arm_t::total)
        .def("payoff", &arm_t::payoff)
        .def("validate", &arm_t::validate, py::arg("name"))
        .def(py::self + py::self)
        .def(py::self += py::self)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__repr__", [](const arm_t& a) {
            std::ostringstream ss;
            ss << a;
            return ss.str();
        })
        .def(py::pickle(
            [](const arm_t& a) {
                return py::make_tuple(a.win(), a.loss(), a.total());
            },
            [](py::tuple t) {
                if (t.size() != 3) {
                    throw std::runtime_error("Invalid state!");
                }
                return arm_t(t[0].cast<value_t>(), t[1].cast<value_t>(),
                             t[2].cast<value_t>());
            }));
}

template <class HistoricalInfoType>
void add_historical_info(py::module_& m) {
    using hi_t = HistoricalInfoType;
    using arms_sampled_t = typename hi_t::arms_sampled_t;
    using arm_t = typename hi_t::sampled_arm_t;

    py::class_<hi_t>(m, "HistoricalInfo")
        .def(py::init<>())
        .def(py::init<arms_sampled_t>(), py::arg("arms_sampled"))
        .def_property_readonly("arms_sampled", &hi_t::arms_sampled)
        .def_property_readonly("num_arms", &hi_t::num_arms)
        .def("num_sampled", &hi_t::num_sampled)
        .def("payoffs", &hi_t::payoffs)
        .def("update_historical_data",
             py::overload_cast<const arms_sampled_t&>(
                 &hi_t::update_historical_data),
             py::arg("arms_sampled"))
        .def("update_historical_data",
             py::overload_cast<const std::string&, const arm_t&>(
                 &hi_t::update_historical_data),
             py::arg("name"), py::arg("sampled_arm"))
        .def("validate", &hi_t::validate)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__len__", &hi_t::num_arms)
        .def("__repr__", [](const hi_t& hi) {
            std::ostringstream ss;
            ss << hi;
            return ss.str();
        });
}

}  // namespace data
}  // namespace banditry
