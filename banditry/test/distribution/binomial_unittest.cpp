#include <banditry_bits/distribution/binomial.hpp>
#include <random>
#include <testutil/base_fixture.hpp>

namespace banditry {
namespace distribution {

struct binomial_fixture : base_fixture {
   protected:
    using dist_t = Binomial<int>;
    std::mt19937 gen{3214};
};

TEST_F(binomial_fixture, ctor) {
    dist_t binom(10, 0.3);
    EXPECT_EQ(binom.n(), 10);
    EXPECT_DOUBLE_EQ(binom.p(), 0.3);
}

TEST_F(binomial_fixture, sample_degenerate) {
    dist_t never(1, 0.0);
    dist_t always(1, 1.0);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(never.sample(gen), 0);
        EXPECT_EQ(always.sample(gen), 1);
    }
}

TEST_F(binomial_fixture, sample_bernoulli_frequency) {
    dist_t bern(1, 0.25);
    const int n = 20000;
    int wins = 0;
    for (int i = 0; i < n; ++i) {
        auto x = bern.sample(gen);
        ASSERT_TRUE(x == 0 || x == 1);
        wins += x;
    }
    EXPECT_NEAR(static_cast<double>(wins) / n, 0.25, 0.02);
}

// ==============================================
// TEST mean
// ==============================================

using binomial_mean_input_t = std::tuple<double, double, double>;

struct binomial_mean_fixture
    : binomial_fixture,
      ::testing::WithParamInterface<binomial_mean_input_t> {};

TEST_P(binomial_mean_fixture, mean_test) {
    auto [n, p, e] = GetParam();
    EXPECT_DOUBLE_EQ(dist_t::mean(n, p), e);
}

INSTANTIATE_TEST_SUITE_P(BinomialMeanTest, binomial_mean_fixture,
                         testing::Values(binomial_mean_input_t({10, 0.5, 5}),
                                         binomial_mean_input_t({0, 0.3, 0}),
                                         binomial_mean_input_t({4, 0.25, 1})));

}  // namespace distribution
}  // namespace banditry
