#pragma once
#include <pybind11/pybind11.h>

#include <banditry_bits/util/exceptions.hpp>

namespace banditry {

namespace py = pybind11;

/*
 * Registers every banditry exception type as its own Python exception.
 * All of them derive from BanditryError, which derives from ValueError.
 * Translators registered later are tried first,
 * so the base must be registered before the derived types.
 */
inline void add_exceptions(py::module_& m) {
    auto& base = py::register_exception<banditry_error>(m, "BanditryError",
                                                        PyExc_ValueError);
    py::register_exception<empty_history_error>(m, "EmptyHistoryError",
                                                base.ptr());
    py::register_exception<invalid_allocation_error>(
        m, "InvalidAllocationError", base.ptr());
    py::register_exception<invalid_hyperparameter_error>(
        m, "InvalidHyperparameterError", base.ptr());
    py::register_exception<invalid_historical_info_error>(
        m, "InvalidHistoricalInfoError", base.ptr());
    py::register_exception<unknown_subtype_error>(m, "UnknownSubtypeError",
                                                  base.ptr());
}

}  // namespace banditry
