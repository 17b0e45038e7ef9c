#pragma once
#include <pybind11/pybind11.h>

namespace banditry {
namespace data {

namespace py = pybind11;

void add_to_module(py::module_& m);

}  // namespace data
}  // namespace banditry
