#pragma once
#include <banditry_bits/bandit/base.hpp>
#include <banditry_bits/constant.hpp>
#include <string>

namespace banditry {
namespace bandit {
namespace epsilon {

/*
 * Base class for the epsilon bandit family.
 * Every member of the family trades off exploration and exploitation
 * through the parameter epsilon in [0, 1].
 */
template <class ValueType>
struct EpsilonBase : BanditBase<ValueType> {
    using base_t = BanditBase<ValueType>;
    using typename base_t::allocation_t;
    using typename base_t::historical_info_t;
    using typename base_t::value_t;

   private:
    const value_t epsilon_;

   public:
    EpsilonBase(const historical_info_t& historical_info,
                const std::string& subtype, value_t epsilon = default_epsilon)
        : base_t(historical_info, subtype), epsilon_(epsilon) {}

    value_t epsilon() const { return epsilon_; }
};

}  // namespace epsilon
}  // namespace bandit
}  // namespace banditry
