#pragma once
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <banditry_bits/constant.hpp>
#include <banditry_bits/endpoint/bandit_epsilon.hpp>
#include <banditry_bits/util/exceptions.hpp>
#include <random>
#include <string>

namespace banditry {
namespace endpoint {

namespace py = pybind11;

/*
 * Converts a Python dict into a hyperparameter mapping.
 * Keys must be strings and values must be real numbers convertible to float.
 * This includes numpy scalars. bool is rejected.
 */
template <class ValueType>
inline hyperparameter_info_type<ValueType> to_hyperparameter_info(
    const py::dict& d) {
    hyperparameter_info_type<ValueType> out;
    for (const auto& item : d) {
        if (!py::isinstance<py::str>(item.first)) {
            throw invalid_hyperparameter_error(
                py::str(item.first).cast<std::string>(),
                "key must be a string.");
        }
        const auto key = item.first.cast<std::string>();
        const auto& v = item.second;
        if (py::isinstance<py::bool_>(v) || !PyNumber_Check(v.ptr())) {
            throw invalid_hyperparameter_error(key, "must be a number.");
        }
        ValueType value;
        try {
            value = v.cast<ValueType>();
        } catch (const py::cast_error&) {
            throw invalid_hyperparameter_error(key, "must be a real number.");
        }
        out.emplace(key, value);
    }
    return out;
}

template <class ValueType>
void add_bandit_epsilon(py::module_& m) {
    using value_t = ValueType;
    using request_t = BanditEpsilonRequest<value_t>;
    using hi_t = data::HistoricalInfo<value_t>;
    using linker_t = EpsilonLinker<value_t>;
    using gen_t = std::mt19937;

    m.attr("EPSILON_SUBTYPES") = linker_t::instance().subtypes();
    m.attr("DEFAULT_EPSILON") = default_epsilon;
    m.attr("DEFAULT_TOTAL_SAMPLES") = default_total_samples;

    m.def(
        "bandit_epsilon",
        [](const hi_t& historical_info, gen_t& gen, const std::string& subtype,
           const py::dict& hyperparameter_info) {
            request_t req;
            req.subtype = subtype;
            req.historical_info = historical_info;
            req.hyperparameter_info =
                to_hyperparameter_info<value_t>(hyperparameter_info);

            const auto resp = bandit_epsilon(req, gen);

            py::dict out;
            out["endpoint"] = resp.endpoint;
            out["arms"] = resp.arms;
            out["winner"] = resp.winner;
            return out;
        },
        py::arg("historical_info"), py::arg("gen"),
        py::arg("subtype") = epsilon_subtype_first,
        py::arg("hyperparameter_info") = py::dict());
}

}  // namespace endpoint
}  // namespace banditry
