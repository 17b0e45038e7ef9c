#pragma once
#include <Eigen/Core>
#include <map>
#include <string>

namespace banditry {

template <class ValueType>
using colvec_type = Eigen::Matrix<ValueType, Eigen::Dynamic, 1>;

template <class ValueType>
using mat_type = Eigen::Matrix<ValueType, Eigen::Dynamic, Eigen::Dynamic>;

/*
 * Mapping from arm name to allocation.
 * Ordered by arm name so that iteration is deterministic.
 */
template <class ValueType>
using allocation_type = std::map<std::string, ValueType>;

}  // namespace banditry
