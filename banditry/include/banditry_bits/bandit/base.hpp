#pragma once
#include <banditry_bits/constant.hpp>
#include <banditry_bits/data/historical_info.hpp>
#include <banditry_bits/distribution/uniform.hpp>
#include <banditry_bits/util/exceptions.hpp>
#include <banditry_bits/util/types.hpp>
#include <cmath>
#include <string>

namespace banditry {
namespace bandit {

/*
 * Base class for all bandit classes.
 * A bandit computes an allocation over the arms of its historical info
 * and chooses the next arm to pull from an allocation.
 * Subclasses only need to implement allocate_arms().
 */
template <class ValueType>
struct BanditBase {
    using value_t = ValueType;
    using interface_t = BanditBase;
    using historical_info_t = data::HistoricalInfo<value_t>;
    using allocation_t = allocation_type<value_t>;

   private:
    const historical_info_t& historical_info_;
    const std::string subtype_;

   public:
    BanditBase(const historical_info_t& historical_info,
               const std::string& subtype)
        : historical_info_(historical_info), subtype_(subtype) {}

    virtual ~BanditBase(){};

    const historical_info_t& historical_info() const {
        return historical_info_;
    }
    const std::string& subtype() const { return subtype_; }

    /*
     * Computes the allocation to each arm given the historical info.
     * Every arm of the historical info appears in the result
     * and the allocations sum to 1.
     */
    virtual allocation_t allocate_arms() const = 0;

    /*
     * Chooses an arm from allocation using the RNG gen.
     * The arms (in name order) partition [0, 1) into consecutive intervals
     * of length equal to their allocation and the arm whose interval
     * contains a uniform draw is returned.
     * Arms with zero allocation are never chosen.
     */
    template <class GenType>
    static std::string choose_arm(const allocation_t& allocation,
                                  GenType&& gen) {
        if (allocation.empty()) {
            throw invalid_allocation_error("allocation is empty.");
        }

        value_t sum = 0;
        for (const auto& kv : allocation) {
            if (!std::isfinite(kv.second) || kv.second < 0) {
                throw invalid_allocation_error(
                    "allocation of " + kv.first +
                    " must be a finite non-negative value.");
            }
            sum += kv.second;
        }
        if (std::abs(sum - 1) > allocation_sum_tol) {
            throw invalid_allocation_error("allocation must sum to 1, got " +
                                           std::to_string(sum) + ".");
        }

        distribution::Uniform<value_t> unif(0, 1);
        const auto u = unif.sample(gen);

        value_t cumulative = 0;
        const std::string* last_positive = nullptr;
        for (const auto& kv : allocation) {
            if (kv.second <= 0) continue;
            cumulative += kv.second;
            last_positive = &kv.first;
            if (u < cumulative) return kv.first;
        }

        // u landed past the last boundary due to rounding in the sum.
        return *last_positive;
    }

    /*
     * Chooses an arm from the allocation computed by allocate_arms().
     */
    template <class GenType>
    std::string choose_arm(GenType&& gen) const {
        return choose_arm(allocate_arms(), gen);
    }
};

}  // namespace bandit
}  // namespace banditry
