#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include <data/data.hpp>
#include <data/historical_info.hpp>
#include <export_utils/types.hpp>

namespace banditry {
namespace data {

namespace py = pybind11;

using value_t = py_double_t;

void add_to_module(py::module_& m) {
    add_sampled_arm<SampledArm<value_t>>(m);
    add_historical_info<HistoricalInfo<value_t>>(m);
}

}  // namespace data
}  // namespace banditry
