#pragma once
#include <algorithm>
#include <banditry_bits/bandit/epsilon/epsilon.hpp>
#include <banditry_bits/constant.hpp>
#include <banditry_bits/util/exceptions.hpp>
#include <banditry_bits/util/macros.hpp>
#include <numeric>
#include <vector>

namespace banditry {
namespace bandit {
namespace epsilon {

/*
 * Epsilon-first bandit.
 *
 * total_samples is the budget T of the experiment
 * (number of trials already sampled + number of trials left).
 * The number sampled is the sum of total over all arms.
 * The first epsilon * T trials are pure exploration
 * and the remaining trials are pure exploitation.
 */
template <class ValueType>
struct EpsilonFirst : EpsilonBase<ValueType> {
    using base_t = EpsilonBase<ValueType>;
    using typename base_t::allocation_t;
    using typename base_t::historical_info_t;
    using typename base_t::value_t;

   private:
    const value_t total_samples_;

    /*
     * Returns arm indices (in name order) sorted by payoff descending.
     * Equal payoffs keep name order.
     */
    static std::vector<size_t> rank_arms(
        const colvec_type<value_t>& payoffs) {
        std::vector<size_t> order(payoffs.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t i, size_t j) {
            return payoffs[i] > payoffs[j];
        });
        return order;
    }

   public:
    EpsilonFirst(const historical_info_t& historical_info,
                 value_t epsilon = default_epsilon,
                 value_t total_samples = default_total_samples)
        : base_t(historical_info, epsilon_subtype_first, epsilon),
          total_samples_(total_samples) {}

    using base_t::epsilon;
    using base_t::historical_info;

    value_t total_samples() const { return total_samples_; }

    /*
     * Returns true if the next trial belongs to the exploration phase,
     * i.e. fewer than epsilon * total_samples trials have been sampled.
     */
    BANDITRY_STRONG_INLINE bool is_exploring() const {
        return historical_info().num_sampled() < total_samples_ * epsilon();
    }

    /*
     * Exploration phase: every arm gets 1 / num_arms.
     *
     * Exploitation phase: the arms with the best average payoff
     * (win - loss) / total split the allocation equally and every other arm
     * gets 0. An arm with total = 0 has payoff 0.
     * Ties are exact floating-point equality of payoffs.
     *
     * For example, with arm1 {win: 10, loss: 0, total: 20},
     * arm2 {win: 10, loss: 0, total: 20}, arm3 {win: 0, loss: 0, total: 0}
     * and epsilon = 0.1, 40 trials have been sampled.
     * With T = 50 we explore the first 5 trials only, so we exploit:
     *      arm1: 0.5, arm2: 0.5, arm3: 0.
     * With T = 500 we explore the first 50 trials:
     *      arm1: 1/3, arm2: 1/3, arm3: 1/3.
     */
    allocation_t allocate_arms() const override {
        const auto& hi = historical_info();
        const auto& arms_sampled = hi.arms_sampled();

        if (arms_sampled.empty()) {
            throw empty_history_error();
        }

        allocation_t allocation;

        if (is_exploring()) {
            const value_t equal_allocation = value_t(1) / hi.num_arms();
            for (const auto& kv : arms_sampled) {
                allocation.emplace_hint(allocation.end(), kv.first,
                                        equal_allocation);
            }
            return allocation;
        }

        const auto payoffs = hi.payoffs();
        const auto order = rank_arms(payoffs);
        const value_t best_payoff = payoffs[order[0]];

        // winning set is the leading run of order with the best payoff.
        std::vector<bool> is_winner(payoffs.size(), false);
        size_t n_winners = 0;
        for (; n_winners < order.size() &&
               payoffs[order[n_winners]] == best_payoff;
             ++n_winners) {
            is_winner[order[n_winners]] = true;
        }

        const value_t winning_allocation = value_t(1) / n_winners;
        size_t i = 0;
        for (const auto& kv : arms_sampled) {
            allocation.emplace_hint(allocation.end(), kv.first,
                                    is_winner[i] ? winning_allocation : 0);
            ++i;
        }
        return allocation;
    }
};

}  // namespace epsilon
}  // namespace bandit
}  // namespace banditry
