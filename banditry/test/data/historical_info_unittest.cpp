#include <banditry_bits/data/historical_info.hpp>
#include <sstream>
#include <testutil/base_fixture.hpp>
#include <testutil/eigen_ext.hpp>

namespace banditry {
namespace data {

struct historical_info_fixture : base_fixture {};

TEST_F(historical_info_fixture, default_ctor) {
    hi_t hi;
    EXPECT_TRUE(hi.empty());
    EXPECT_EQ(hi.num_arms(), 0);
    EXPECT_DOUBLE_EQ(hi.num_sampled(), 0);
}

TEST_F(historical_info_fixture, ctor) {
    auto hi = three_arm_history();
    EXPECT_FALSE(hi.empty());
    EXPECT_EQ(hi.num_arms(), 3);
    EXPECT_DOUBLE_EQ(hi.num_sampled(), 55);
    EXPECT_EQ(hi.arms_sampled().at("arm2"), sampled_arm_t(20, 10, 30));
}

TEST_F(historical_info_fixture, arm_name_order) {
    arms_sampled_t arms;
    arms.emplace("b", sampled_arm_t());
    arms.emplace("c", sampled_arm_t());
    arms.emplace("a", sampled_arm_t());
    hi_t hi(arms);
    std::string names;
    for (const auto& kv : hi.arms_sampled()) names += kv.first;
    EXPECT_EQ(names, "abc");
}

TEST_F(historical_info_fixture, payoffs) {
    auto hi = three_arm_history();
    expect_double_eq_vec(hi.payoffs(), make_colvec({0.6, 1. / 3, 0.}));
}

TEST_F(historical_info_fixture, update_historical_data) {
    auto hi = three_arm_history();
    arms_sampled_t update;
    update.emplace("arm1", sampled_arm_t(1, 0, 1));
    update.emplace("arm4", sampled_arm_t(0, 2, 2));
    hi.update_historical_data(update);

    EXPECT_EQ(hi.num_arms(), 4);
    EXPECT_DOUBLE_EQ(hi.num_sampled(), 58);
    EXPECT_EQ(hi.arms_sampled().at("arm1"), sampled_arm_t(21, 5, 26));
    EXPECT_EQ(hi.arms_sampled().at("arm4"), sampled_arm_t(0, 2, 2));

    hi.update_historical_data("arm3", sampled_arm_t(0, 1, 1));
    EXPECT_EQ(hi.arms_sampled().at("arm3"), sampled_arm_t(0, 1, 1));
}

TEST_F(historical_info_fixture, validate) {
    EXPECT_NO_THROW(three_arm_history().validate());
    auto hi = three_arm_history();
    hi.update_historical_data("arm2", sampled_arm_t(-40, 0, 0));
    EXPECT_THROW(hi.validate(), invalid_historical_info_error);
}

TEST_F(historical_info_fixture, equality) {
    EXPECT_EQ(three_arm_history(), three_arm_history());
    auto hi = three_arm_history();
    hi.update_historical_data("arm3", sampled_arm_t(0, 0, 1));
    EXPECT_NE(hi, three_arm_history());
}

TEST_F(historical_info_fixture, stream) {
    arms_sampled_t arms;
    arms.emplace("a", sampled_arm_t(1, 0, 1));
    arms.emplace("b", sampled_arm_t(0, 1, 2));
    std::ostringstream ss;
    ss << hi_t(arms);
    EXPECT_EQ(ss.str(),
              "{a: {win: 1, loss: 0, total: 1}, b: {win: 0, loss: 1, total: "
              "2}}");
}

}  // namespace data
}  // namespace banditry
