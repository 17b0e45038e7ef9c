#include <banditry_bits/constant.hpp>
#include <banditry_bits/endpoint/bandit_epsilon.hpp>
#include <banditry_bits/util/exceptions.hpp>
#include <random>
#include <testutil/base_fixture.hpp>

namespace banditry {
namespace endpoint {

struct bandit_epsilon_fixture : base_fixture {
   protected:
    using request_t = BanditEpsilonRequest<value_t>;

    std::mt19937 gen{3214};

    request_t make_request() {
        request_t req;
        req.subtype = epsilon_subtype_first;
        req.historical_info = three_arm_history();
        req.hyperparameter_info = {{"epsilon", 0.1}, {"total_samples", 50}};
        return req;
    }
};

TEST_F(bandit_epsilon_fixture, default_request) {
    request_t req;
    EXPECT_EQ(req.subtype, epsilon_subtype_first);
    EXPECT_TRUE(req.historical_info.empty());
    EXPECT_TRUE(req.hyperparameter_info.empty());
}

TEST_F(bandit_epsilon_fixture, exploitation_response) {
    auto resp = bandit_epsilon(make_request(), gen);
    EXPECT_EQ(resp.endpoint, bandit_epsilon_endpoint);
    expect_allocation_near(resp.arms,
                           {{"arm1", 1.0}, {"arm2", 0.0}, {"arm3", 0.0}});
    EXPECT_EQ(resp.winner, "arm1");
}

TEST_F(bandit_epsilon_fixture, exploration_response) {
    auto req = make_request();
    req.hyperparameter_info["total_samples"] = 1000;
    auto resp = bandit_epsilon(req, gen);
    expect_allocation_near(
        resp.arms, {{"arm1", 1. / 3}, {"arm2", 1. / 3}, {"arm3", 1. / 3}});
    EXPECT_EQ(resp.arms.count(resp.winner), 1u);
}

TEST_F(bandit_epsilon_fixture, default_hyperparameters) {
    // 55 sampled >= 0.05 * 100
    auto req = make_request();
    req.hyperparameter_info.clear();
    auto resp = bandit_epsilon(req, gen);
    EXPECT_EQ(resp.winner, "arm1");
}

TEST_F(bandit_epsilon_fixture, unknown_subtype) {
    auto req = make_request();
    req.subtype = "greedy";
    EXPECT_THROW(bandit_epsilon(req, gen), unknown_subtype_error);
}

TEST_F(bandit_epsilon_fixture, invalid_hyperparameter) {
    auto req = make_request();
    req.hyperparameter_info["epsilon"] = -1;
    EXPECT_THROW(bandit_epsilon(req, gen), invalid_hyperparameter_error);
}

TEST_F(bandit_epsilon_fixture, invalid_historical_info) {
    auto req = make_request();
    req.historical_info.update_historical_data("arm3",
                                               sampled_arm_t(0, 0, -1));
    EXPECT_THROW(bandit_epsilon(req, gen), invalid_historical_info_error);
}

TEST_F(bandit_epsilon_fixture, empty_history) {
    auto req = make_request();
    req.historical_info = hi_t();
    EXPECT_THROW(bandit_epsilon(req, gen), empty_history_error);
}

TEST_F(bandit_epsilon_fixture, explicit_linker) {
    EpsilonLinker<value_t> linker;
    auto resp = bandit_epsilon(make_request(), gen, linker);
    EXPECT_EQ(resp.winner, "arm1");
}

}  // namespace endpoint
}  // namespace banditry
