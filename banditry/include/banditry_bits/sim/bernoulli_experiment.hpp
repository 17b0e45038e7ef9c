#pragma once
#include <omp.h>

#include <algorithm>
#include <banditry_bits/bandit/base.hpp>
#include <banditry_bits/data/historical_info.hpp>
#include <banditry_bits/distribution/binomial.hpp>
#include <banditry_bits/util/types.hpp>
#include <cmath>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace banditry {
namespace sim {

/*
 * Simulates a bandit experiment where pulling an arm is a Bernoulli trial
 * with a fixed (unknown to the bandit) win probability.
 * Each round, a bandit is constructed over the current observations,
 * it chooses an arm and the outcome is recorded as a win or a loss.
 */
template <class ValueType>
struct BernoulliExperiment {
    using value_t = ValueType;
    using historical_info_t = data::HistoricalInfo<value_t>;
    using sampled_arm_t = typename historical_info_t::sampled_arm_t;
    using bandit_t = bandit::BanditBase<value_t>;
    using make_bandit_t =
        std::function<std::unique_ptr<bandit_t>(const historical_info_t&)>;
    using win_probs_t = std::map<std::string, value_t>;

   private:
    const win_probs_t win_probs_;
    const size_t n_rounds_;

   public:
    BernoulliExperiment(const win_probs_t& win_probs, size_t n_rounds)
        : win_probs_(win_probs), n_rounds_(n_rounds) {
        if (win_probs_.empty()) {
            throw std::invalid_argument("win_probs must be non-empty.");
        }
        for (const auto& kv : win_probs_) {
            if (!(kv.second >= 0 && kv.second <= 1)) {
                throw std::invalid_argument("win probability of " + kv.first +
                                            " must be in [0, 1].");
            }
        }
    }

    const win_probs_t& win_probs() const { return win_probs_; }
    size_t n_rounds() const { return n_rounds_; }
    size_t n_arms() const { return win_probs_.size(); }

    /*
     * Runs one experiment with the RNG gen and returns
     * the observations at the end of it.
     * Every arm starts with zero counts.
     */
    template <class GenType>
    historical_info_t run(const make_bandit_t& make_bandit,
                          GenType&& gen) const {
        typename historical_info_t::arms_sampled_t arms;
        std::map<std::string, distribution::Binomial<int>> pulls;
        for (const auto& kv : win_probs_) {
            arms.emplace(kv.first, sampled_arm_t());
            pulls.emplace(kv.first, distribution::Binomial<int>(1, kv.second));
        }
        historical_info_t hi(std::move(arms));

        for (size_t r = 0; r < n_rounds_; ++r) {
            auto bandit = make_bandit(hi);
            const auto arm = bandit->choose_arm(gen);
            const bool win = pulls.at(arm).sample(gen) == 1;
            hi.update_historical_data(
                arm, sampled_arm_t(win ? 1 : 0, win ? 0 : 1, 1));
        }
        return hi;
    }

    /*
     * Runs n_reps independent experiments on n_threads threads.
     * Replication i uses an std::mt19937 seeded with seed + i,
     * so the result does not depend on n_threads.
     * n_threads is clamped to the hardware concurrency.
     * If any replication throws, the first exception caught is rethrown
     * after all threads join and no results are returned.
     */
    std::vector<historical_info_t> replicate(const make_bandit_t& make_bandit,
                                             size_t n_reps, size_t seed,
                                             size_t n_threads) const {
        if (n_threads <= 0) {
            throw std::invalid_argument("n_threads must be positive.");
        }

        size_t max_threads = std::thread::hardware_concurrency();
        if (max_threads > 0 && n_threads > max_threads) {
            n_threads = max_threads;
        }

        std::vector<historical_info_t> out(n_reps);
        std::exception_ptr err;

#pragma omp parallel for schedule(static) num_threads(n_threads)
        for (size_t i = 0; i < n_reps; ++i) {
            try {
                std::mt19937 gen(seed + i);
                out[i] = run(make_bandit, gen);
            } catch (...) {
#pragma omp critical
                {
                    if (!err) err = std::current_exception();
                }
            }
        }

        if (err) std::rethrow_exception(err);
        return out;
    }

    /*
     * Expected regret of the observations in hi:
     *      \sum_a total_a (p^* - p_a)
     * where p^* is the largest win probability.
     * Arms of hi that are not part of the experiment are ignored.
     */
    value_t expected_regret(const historical_info_t& hi) const {
        value_t best = 0;
        for (const auto& kv : win_probs_) {
            best = std::max(best, kv.second);
        }
        value_t regret = 0;
        for (const auto& kv : hi.arms_sampled()) {
            auto it = win_probs_.find(kv.first);
            if (it == win_probs_.end()) continue;
            const auto n = kv.second.total();
            regret += distribution::Binomial<int>::mean(n, best) -
                      distribution::Binomial<int>::mean(n, it->second);
        }
        return regret;
    }

    /*
     * Number of pulls of each arm (in arm name order) per replication.
     * Column i corresponds to reps[i].
     * Every replication must have the same arm names as reps[0].
     */
    static mat_type<value_t> pull_counts(
        const std::vector<historical_info_t>& reps) {
        const size_t n_arms = reps.empty() ? 0 : reps[0].num_arms();
        mat_type<value_t> out(n_arms, reps.size());
        for (size_t i = 0; i < reps.size(); ++i) {
            if (reps[i].num_arms() != n_arms) {
                throw std::invalid_argument(
                    "replication " + std::to_string(i) +
                    " has a different number of arms than replication 0.");
            }
            size_t j = 0;
            auto first = reps[0].arms_sampled().begin();
            for (const auto& kv : reps[i].arms_sampled()) {
                if (kv.first != first->first) {
                    throw std::invalid_argument(
                        "replication " + std::to_string(i) + " has arm " +
                        kv.first + " where replication 0 has " +
                        first->first + ".");
                }
                out(j++, i) = kv.second.total();
                ++first;
            }
        }
        return out;
    }
};

}  // namespace sim
}  // namespace banditry
