#include <benchmark/benchmark.h>

#include <banditry_bits/bandit/epsilon/epsilon_first.hpp>
#include <banditry_bits/data/historical_info.hpp>
#include <random>
#include <string>

namespace banditry {
namespace {

using value_t = double;
using hi_t = data::HistoricalInfo<value_t>;
using bandit_t = bandit::epsilon::EpsilonFirst<value_t>;

hi_t make_history(size_t n_arms, size_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> count(0, 1000);
    typename hi_t::arms_sampled_t arms;
    for (size_t i = 0; i < n_arms; ++i) {
        value_t win = count(gen);
        value_t loss = count(gen);
        arms.emplace("arm" + std::to_string(i),
                     typename hi_t::sampled_arm_t(win, loss, win + loss));
    }
    return hi_t(arms);
}

static void BM_epsilon_first_exploit(benchmark::State& state) {
    auto hi = make_history(state.range(0), 0);
    bandit_t b(hi, 0.1, 100);

    for (auto _ : state) {
        benchmark::DoNotOptimize(b.allocate_arms());
    }
}

static void BM_epsilon_first_explore(benchmark::State& state) {
    auto hi = make_history(state.range(0), 0);
    bandit_t b(hi, 1.0, 1e12);

    for (auto _ : state) {
        benchmark::DoNotOptimize(b.allocate_arms());
    }
}

static void BM_epsilon_first_choose_arm(benchmark::State& state) {
    auto hi = make_history(state.range(0), 0);
    bandit_t b(hi, 1.0, 1e12);
    const auto alloc = b.allocate_arms();
    std::mt19937 gen(0);

    for (auto _ : state) {
        benchmark::DoNotOptimize(bandit_t::choose_arm(alloc, gen));
    }
}

BENCHMARK(BM_epsilon_first_exploit)->RangeMultiplier(8)->Range(2, 4096);
BENCHMARK(BM_epsilon_first_explore)->RangeMultiplier(8)->Range(2, 4096);
BENCHMARK(BM_epsilon_first_choose_arm)->RangeMultiplier(8)->Range(2, 4096);

}  // namespace
}  // namespace banditry

BENCHMARK_MAIN();
