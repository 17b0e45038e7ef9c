#include <pybind11/stl.h>

#include <endpoint/bandit_epsilon.hpp>
#include <endpoint/endpoint.hpp>
#include <export_utils/types.hpp>

namespace banditry {
namespace endpoint {

namespace py = pybind11;

void add_to_module(py::module_& m) { add_bandit_epsilon<py_double_t>(m); }

}  // namespace endpoint
}  // namespace banditry
