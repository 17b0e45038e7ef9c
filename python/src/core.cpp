#include <pybind11/pybind11.h>

#include <bandit/bandit.hpp>
#include <data/data.hpp>
#include <endpoint/endpoint.hpp>
#include <export_utils/exceptions.hpp>
#include <cstdint>
#include <random>

namespace py = pybind11;

PYBIND11_MODULE(core, m) {
    using namespace banditry;

    add_exceptions(m);

    /* Call each adder function from each subdirectory */
    py::module_ data_m = m.def_submodule("data", "Data submodule.");
    data::add_to_module(data_m);

    py::module_ bandit_m = m.def_submodule("bandit", "Bandit submodule.");
    bandit::add_to_module(bandit_m);

    py::module_ endpoint_m =
        m.def_submodule("endpoint", "Endpoint submodule.");
    endpoint::add_to_module(endpoint_m);

    /* Rest of the dependencies */

    py::class_<std::mt19937>(m, "mt19937")
        .def(py::init<uint32_t>())
        .def("seed", [](std::mt19937& gen, uint32_t s) { gen.seed(s); });
}
