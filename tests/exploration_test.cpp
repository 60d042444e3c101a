#include <cmath>
#include <gtest/gtest.h>
#include <vector>
#include <vigil/exploration.hpp>

using namespace vigil;

namespace {

ExplorationConfig seeded(double start, double end, std::size_t steps) {
    ExplorationConfig cfg;
    cfg.start = start;
    cfg.end = end;
    cfg.decay_steps = steps;
    cfg.seed = 99;
    return cfg;
}

} // namespace

TEST(ExplorationTest, LinearDecayReachesEnd) {
    ExplorationStrategy ex(seeded(0.2, 0.02, 10));
    EXPECT_DOUBLE_EQ(ex.current_epsilon(), 0.2);
    for (int i = 0; i < 5; ++i)
        ex.step();
    EXPECT_NEAR(ex.current_epsilon(), 0.11, 1e-12);
    for (int i = 0; i < 20; ++i)
        ex.step();
    EXPECT_NEAR(ex.current_epsilon(), 0.02, 1e-12);
}

TEST(ExplorationTest, ExponentialDecay) {
    ExplorationConfig cfg = seeded(0.4, 0.1, 2);
    cfg.schedule = DecaySchedule::Exponential;
    ExplorationStrategy ex(cfg);
    EXPECT_NEAR(ex.value_at(1), 0.2, 1e-12);
    EXPECT_NEAR(ex.value_at(2), 0.1, 1e-12);
    EXPECT_NEAR(ex.value_at(50), 0.1, 1e-12);
}

TEST(ExplorationTest, GreedyWhenEpsilonTiny) {
    ExplorationStrategy ex(seeded(1e-9, 1e-9, 1));
    for (int i = 0; i < 100; ++i) {
        auto c = ex.select_action({0.1, 0.9, 0.3});
        EXPECT_EQ(c.action, 1);
        EXPECT_FALSE(c.explored);
    }
    EXPECT_DOUBLE_EQ(ex.exploitation_ratio(), 1.0);
}

TEST(ExplorationTest, AlwaysExploresAtEpsilonOne) {
    ExplorationStrategy ex(seeded(1.0, 1.0, 1));
    for (int i = 0; i < 50; ++i)
        EXPECT_TRUE(ex.select_action({0.1, 0.9, 0.3}).explored);
    EXPECT_DOUBLE_EQ(ex.exploration_ratio(), 1.0);
}

TEST(ExplorationTest, RatiosBeforeAnyDecision) {
    ExplorationStrategy ex(seeded(0.2, 0.02, 100));
    EXPECT_DOUBLE_EQ(ex.exploration_ratio(), 0.2);
    EXPECT_DOUBLE_EQ(ex.exploitation_ratio(), 0.8);
    auto s = ex.statistics();
    EXPECT_EQ(s.total_actions, 0u);
    EXPECT_DOUBLE_EQ(s.decay_progress, 0.0);
}

TEST(ExplorationTest, SoftmaxTemperatureFavoursBestAction) {
    ExplorationConfig cfg = seeded(0.05, 0.05, 1);
    cfg.mode = ExplorationMode::SoftmaxTemperature;
    ExplorationStrategy ex(cfg);
    int best = 0;
    for (int i = 0; i < 200; ++i)
        if (ex.select_action({0.0, 1.0, 0.2}).action == 1)
            ++best;
    EXPECT_GT(best, 190);
}

TEST(ExplorationTest, StateRoundTrip) {
    ExplorationStrategy a(seeded(0.2, 0.02, 10));
    a.step();
    a.select_action({1.0, 2.0});
    ExplorationStrategy b(seeded(0.2, 0.02, 10));
    b.set_state(a.state());
    EXPECT_DOUBLE_EQ(b.current_epsilon(), a.current_epsilon());
    EXPECT_EQ(b.statistics().total_actions, 1u);
}

TEST(ExplorationTest, RejectsBadInput) {
    ExplorationStrategy ex(seeded(0.2, 0.02, 10));
    EXPECT_THROW(ex.select_action({}), ShapeError);
    EXPECT_THROW(ExplorationStrategy(seeded(0.1, 0.2, 10)), ConfigError);
    EXPECT_THROW(ExplorationStrategy(seeded(0.2, 0.02, 0)), ConfigError);
    EXPECT_THROW(parse_exploration_mode("boltzmann"), ConfigError);
    EXPECT_EQ(parse_exploration_mode("temperature"), ExplorationMode::SoftmaxTemperature);
}

TEST(ExplorationTest, EntropyGuidedTakesMostUncertainAction) {
    ExplorationConfig cfg = seeded(0.2, 0.02, 100);
    cfg.mode = ExplorationMode::EntropyGuided;
    ExplorationStrategy ex(cfg);
    ActionChoice c = ex.select_action({0.1, 0.8, 0.3, 0.6}, {0.2, 0.1, 0.9, 0.4});
    EXPECT_TRUE(c.explored);
    EXPECT_EQ(c.action, 2);
    EXPECT_THROW(ex.select_action({0.1, 0.8}, {0.2}), ShapeError);
}

TEST(ExplorationTest, EntropyGuidedExploitsConfidentPolicy) {
    ExplorationConfig cfg = seeded(0.2, 0.02, 100);
    cfg.mode = ExplorationMode::EntropyGuided;
    ExplorationStrategy ex(cfg);
    // A peaked policy has entropy near zero and low uncertainty everywhere.
    std::vector<double> q{0.0, 20.0, 0.0};
    EXPECT_LT(policy_entropy(q), 0.5);
    for (int i = 0; i < 20; ++i) {
        ActionChoice c = ex.select_action(q, {0.05, 0.1, 0.05});
        EXPECT_FALSE(c.explored);
        EXPECT_EQ(c.action, 1);
    }
    EXPECT_DOUBLE_EQ(ex.exploration_ratio(), 0.0);
}

TEST(ExplorationTest, EntropyGuidedFallsBackToEntropy) {
    ExplorationConfig cfg = seeded(0.2, 0.02, 100);
    cfg.mode = ExplorationMode::EntropyGuided;
    ExplorationStrategy ex(cfg);
    // Flat values over four actions: entropy ln(4) exceeds the threshold.
    std::vector<double> q{1.0, 1.0, 1.0, 1.0};
    EXPECT_NEAR(policy_entropy(q), std::log(4.0), 1e-6);
    for (int i = 0; i < 10; ++i) {
        ActionChoice c = ex.select_action(q);
        EXPECT_TRUE(c.explored);
        EXPECT_GE(c.action, 0);
        EXPECT_LT(c.action, 4);
    }
}

TEST(ExplorationTest, ModeNames) {
    EXPECT_EQ(parse_exploration_mode("entropy_guided"), ExplorationMode::EntropyGuided);
    EXPECT_STREQ(to_string(ExplorationMode::EntropyGuided), "entropy_guided");
    ExplorationConfig cfg;
    cfg.uncertainty_weight = -0.1;
    EXPECT_THROW(validate(cfg), ConfigError);
}

TEST(ExplorationTest, SelfTestCoversEveryMode) {
    ExplorationReport report = ExplorationStrategy::run_exploration_self_test();
    EXPECT_TRUE(report.passed);
    ASSERT_EQ(report.cases.size(), 3u);
    for (const auto& c : report.cases) {
        EXPECT_TRUE(c.valid_actions) << to_string(c.mode);
        EXPECT_GT(c.exploration_ratio, 0.0) << to_string(c.mode);
    }
    EXPECT_LT(report.cases[0].exploration_ratio, 0.5);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
