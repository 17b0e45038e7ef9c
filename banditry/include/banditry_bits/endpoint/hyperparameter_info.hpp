#pragma once
#include <banditry_bits/constant.hpp>
#include <banditry_bits/util/exceptions.hpp>
#include <cmath>
#include <map>
#include <string>

namespace banditry {
namespace endpoint {

/*
 * Free-form hyperparameter mapping of a request.
 * Its shape depends on the bandit subtype and is checked by
 * the subtype's hyperparameter info schema.
 */
template <class ValueType>
using hyperparameter_info_type = std::map<std::string, ValueType>;

/*
 * Hyperparameter schema of the epsilon-first bandit.
 *
 *      epsilon:        in [0, 1], default default_epsilon
 *      total_samples:  finite and positive, default default_total_samples
 *
 * Missing keys take their default value; unknown keys are ignored.
 */
template <class ValueType>
struct EpsilonFirstHyperparameterInfo {
    using value_t = ValueType;
    using hyperparameter_info_t = hyperparameter_info_type<value_t>;

    value_t epsilon = default_epsilon;
    value_t total_samples = default_total_samples;

    /*
     * Validates info and returns the deserialized hyperparameters.
     * Throws invalid_hyperparameter_error on the first offending key.
     */
    static EpsilonFirstHyperparameterInfo deserialize(
        const hyperparameter_info_t& info) {
        EpsilonFirstHyperparameterInfo out;

        auto it = info.find("epsilon");
        if (it != info.end()) {
            const auto eps = it->second;
            if (!std::isfinite(eps) || eps < 0 || eps > 1) {
                throw invalid_hyperparameter_error("epsilon",
                                                   "must be in [0, 1].");
            }
            out.epsilon = eps;
        }

        it = info.find("total_samples");
        if (it != info.end()) {
            const auto t = it->second;
            if (!std::isfinite(t) || t <= 0) {
                throw invalid_hyperparameter_error(
                    "total_samples", "must be a positive number.");
            }
            out.total_samples = t;
        }

        return out;
    }
};

}  // namespace endpoint
}  // namespace banditry
