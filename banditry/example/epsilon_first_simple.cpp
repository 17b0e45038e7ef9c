#include <banditry_bits/bandit/epsilon/epsilon_first.hpp>
#include <banditry_bits/endpoint/bandit_epsilon.hpp>
#include <banditry_bits/sim/bernoulli_experiment.hpp>
#include <iostream>
#include <memory>
#include <random>

int main() {
    using namespace banditry;
    using value_t = double;
    using hi_t = data::HistoricalInfo<value_t>;
    using sampled_arm_t = typename hi_t::sampled_arm_t;
    using bandit_t = bandit::epsilon::EpsilonFirst<value_t>;
    using experiment_t = sim::BernoulliExperiment<value_t>;

    // configuration setting
    value_t epsilon = 0.1;
    value_t total_samples = 1000;
    size_t n_reps = 100;
    size_t n_threads = 4;
    size_t seed = 0;

    std::mt19937 gen(seed);

    // a single request over a fixed history
    endpoint::BanditEpsilonRequest<value_t> req;
    req.historical_info = hi_t({{"arm1", sampled_arm_t(20, 5, 25)},
                                {"arm2", sampled_arm_t(20, 10, 30)},
                                {"arm3", sampled_arm_t(0, 0, 0)}});
    req.hyperparameter_info = {{"epsilon", epsilon},
                               {"total_samples", 50}};

    auto resp = endpoint::bandit_epsilon(req, gen);
    std::cout << "historical_info: " << req.historical_info << std::endl;
    std::cout << "endpoint: " << resp.endpoint << std::endl;
    for (const auto& kv : resp.arms) {
        std::cout << "  " << kv.first << ": " << kv.second << std::endl;
    }
    std::cout << "winner: " << resp.winner << std::endl;

    // simulate experiments of length total_samples
    experiment_t experiment({{"arm1", 0.3}, {"arm2", 0.5}, {"arm3", 0.55}},
                     static_cast<size_t>(total_samples));
    auto make_bandit = [&](const hi_t& hi) {
        return std::make_unique<bandit_t>(hi, epsilon, total_samples);
    };
    auto reps = experiment.replicate(make_bandit, n_reps, seed, n_threads);

    value_t regret = 0;
    for (const auto& hi : reps) {
        regret += experiment.expected_regret(hi);
    }
    std::cout << "mean expected regret: " << regret / n_reps << std::endl;
    std::cout << "mean pulls per arm: "
              << experiment_t::pull_counts(reps).rowwise().mean().transpose()
              << std::endl;

    return 0;
}
