#pragma once

namespace banditry {

// Subtype tags of the epsilon bandit family.
inline constexpr const char* epsilon_subtype_first = "epsilon_first";

// Name of the epsilon bandit endpoint reported in responses.
inline constexpr const char* bandit_epsilon_endpoint = "bandit_epsilon";

inline constexpr double default_epsilon = 0.05;
inline constexpr double default_total_samples = 100;

// Tolerance on the sum of an allocation consumed by choose_arm.
inline constexpr double allocation_sum_tol = 1e-6;

}  // namespace banditry
