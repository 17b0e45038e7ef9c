#pragma once
#include <cstddef>
#include <cstdint>

namespace banditry {

// default typedefs for pybind exports
using py_double_t = double;

}  // namespace banditry
