#include <pybind11/stl.h>

#include <bandit/bandit.hpp>
#include <bandit/base.hpp>
#include <bandit/epsilon_first.hpp>
#include <export_utils/types.hpp>

namespace banditry {
namespace bandit {

namespace py = pybind11;

using value_t = py_double_t;

void add_to_module(py::module_& m) {
    using bandit_base_t = BanditBase<value_t>;
    add_bandit_base<bandit_base_t>(m);

    py::module_ eps_m = m.def_submodule("epsilon", "Epsilon bandit submodule.");
    using epsilon_base_t = epsilon::EpsilonBase<value_t>;
    using epsilon_first_t = epsilon::EpsilonFirst<value_t>;
    add_epsilon_first<epsilon_base_t, epsilon_first_t>(eps_m);
}

}  // namespace bandit
}  // namespace banditry
