#include <algorithm>
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>
#include <vigil/lr_scheduler.hpp>

using namespace vigil;

namespace {

SchedulerConfig small_config() {
    SchedulerConfig cfg;
    cfg.initial_lr = 0.1;
    cfg.decay_factor = 0.5;
    cfg.patience = 3;
    cfg.min_lr = 0.01;
    cfg.window_size = 5;
    cfg.min_delta = 1e-4;
    return cfg;
}

SchedulerConfig cosine_config(ScheduleKind kind) {
    SchedulerConfig cfg = small_config();
    cfg.schedule = kind;
    cfg.warmup_steps = 10;
    cfg.total_steps = 110;
    cfg.restart_period = 10;
    cfg.restart_mult = 2.0;
    return cfg;
}

} // namespace

TEST(LRSchedulerTest, ImprovingLossKeepsRate) {
    LearningRateScheduler sched(small_config());
    for (int i = 0; i < 20; ++i)
        sched.step(1.0 - 0.01 * i);
    EXPECT_DOUBLE_EQ(sched.current_lr(), 0.1);
    EXPECT_EQ(sched.state().plateau_counter, 0u);
}

TEST(LRSchedulerTest, PlateauDecaysAfterPatience) {
    LearningRateScheduler sched(small_config());
    sched.step(1.0);
    sched.step(1.0);
    sched.step(1.0);
    EXPECT_DOUBLE_EQ(sched.current_lr(), 0.1);
    EXPECT_DOUBLE_EQ(sched.step(1.0), 0.05);
    EXPECT_EQ(sched.state().decay_count, 1u);
    EXPECT_EQ(sched.state().plateau_counter, 0u);
}

TEST(LRSchedulerTest, RateNeverDropsBelowMinimum) {
    LearningRateScheduler sched(small_config());
    for (int i = 0; i < 100; ++i)
        sched.step(2.0);
    EXPECT_DOUBLE_EQ(sched.current_lr(), 0.01);
}

TEST(LRSchedulerTest, NonFiniteLossIgnored) {
    LearningRateScheduler sched(small_config());
    sched.step(std::numeric_limits<double>::quiet_NaN());
    sched.step(std::numeric_limits<double>::infinity());
    EXPECT_EQ(sched.state().steps, 0u);
    EXPECT_TRUE(sched.state().window.empty());
}

TEST(LRSchedulerTest, WindowIsBounded) {
    LearningRateScheduler sched(small_config());
    for (int i = 0; i < 12; ++i)
        sched.step(1.0 / (i + 1));
    EXPECT_EQ(sched.state().window.size(), 5u);
}

TEST(LRSchedulerTest, TrendIsLeastSquaresSlope) {
    EXPECT_DOUBLE_EQ(loss_trend({1.0, 2.0, 3.0, 4.0}), 1.0);
    EXPECT_DOUBLE_EQ(loss_trend({4.0, 2.0, 0.0}), -2.0);
    EXPECT_DOUBLE_EQ(loss_trend({7.0}), 0.0);
}

TEST(LRSchedulerTest, DemoteUsesBaseRate) {
    LearningRateScheduler sched(small_config());
    EXPECT_DOUBLE_EQ(sched.demote(0.25), 0.025);
    // A weaker factor never raises the rate again.
    EXPECT_DOUBLE_EQ(sched.demote(0.5), 0.025);
    EXPECT_DOUBLE_EQ(sched.demote(0.0625), 0.01);
}

TEST(LRSchedulerTest, DecayIsLogged) {
    std::vector<std::string> lines;
    auto logger = std::make_shared<Logger>(
        [&](LogLevel level, const std::string& msg, const LogFields& fields) {
            lines.push_back(format_record(level, msg, fields));
        });
    LearningRateScheduler sched(small_config(), logger);
    for (int i = 0; i < 4; ++i)
        sched.step(1.0);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("learning rate reduced on plateau"), std::string::npos);
    EXPECT_NE(lines[0].find("new_lr=0.05"), std::string::npos);
}

TEST(LRSchedulerTest, InvalidConfigRejected) {
    SchedulerConfig cfg = small_config();
    cfg.min_lr = 1.0;
    EXPECT_THROW(LearningRateScheduler{cfg}, ConfigError);
    cfg = small_config();
    cfg.window_size = 1;
    EXPECT_THROW(LearningRateScheduler{cfg}, ConfigError);
}

TEST(LRSchedulerTest, WarmupThenCosine) {
    LearningRateScheduler sched(cosine_config(ScheduleKind::WarmupCosine));
    EXPECT_DOUBLE_EQ(sched.current_lr(), 0.01);
    EXPECT_EQ(sched.phase(), "warmup");
    for (int i = 0; i < 4; ++i)
        sched.step(1.0);
    EXPECT_NEAR(sched.current_lr(), 0.05, 1e-12);
    for (int i = 0; i < 6; ++i)
        sched.step(1.0);
    EXPECT_EQ(sched.phase(), "cosine");
    EXPECT_NEAR(sched.current_lr(), 0.1, 1e-12);
    for (int i = 0; i < 50; ++i)
        sched.step(1.0);
    EXPECT_NEAR(sched.current_lr(), 0.055, 1e-12);
    for (int i = 0; i < 100; ++i)
        sched.step(1.0);
    EXPECT_DOUBLE_EQ(sched.current_lr(), 0.01);
    // Loss-driven decay is off for step-count schedules.
    EXPECT_EQ(sched.state().decay_count, 0u);
}

TEST(LRSchedulerTest, CosineIgnoresNonFiniteLoss) {
    LearningRateScheduler sched(cosine_config(ScheduleKind::Cosine));
    EXPECT_DOUBLE_EQ(sched.current_lr(), 0.1);
    sched.step(std::numeric_limits<double>::quiet_NaN());
    EXPECT_EQ(sched.state().steps, 0u);
    for (int i = 0; i < 55; ++i)
        sched.step(0.5);
    EXPECT_NEAR(sched.current_lr(), 0.055, 1e-12);
}

TEST(LRSchedulerTest, WarmRestartsGrowCycles) {
    LearningRateScheduler sched(cosine_config(ScheduleKind::WarmRestarts));
    for (int i = 0; i < 5; ++i)
        sched.step(1.0);
    EXPECT_NEAR(sched.current_lr(), 0.055, 1e-12);
    for (int i = 0; i < 5; ++i)
        sched.step(1.0);
    EXPECT_EQ(sched.state().restart_count, 1u);
    EXPECT_EQ(sched.state().last_restart_step, 10u);
    EXPECT_NEAR(sched.current_lr(), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(sched.cycle_length(), 20.0);
    for (int i = 0; i < 10; ++i)
        sched.step(1.0);
    EXPECT_NEAR(sched.current_lr(), 0.055, 1e-12);
    for (int i = 0; i < 10; ++i)
        sched.step(1.0);
    EXPECT_EQ(sched.state().restart_count, 2u);
    EXPECT_EQ(sched.phase(), "cycle_2");
}

TEST(LRSchedulerTest, DemoteLowersCosinePeak) {
    LearningRateScheduler sched(cosine_config(ScheduleKind::Cosine));
    EXPECT_DOUBLE_EQ(sched.demote(0.5), 0.05);
    EXPECT_DOUBLE_EQ(sched.state().peak_lr, 0.05);
    sched.step(1.0);
    EXPECT_LE(sched.current_lr(), 0.05);
    EXPECT_GT(sched.current_lr(), 0.049);
}

TEST(LRSchedulerTest, ScheduleNames) {
    EXPECT_EQ(parse_schedule_kind("warmup_cosine"), ScheduleKind::WarmupCosine);
    EXPECT_EQ(parse_schedule_kind("warm_restarts"), ScheduleKind::WarmRestarts);
    EXPECT_STREQ(to_string(ScheduleKind::Cosine), "cosine");
    EXPECT_THROW(parse_schedule_kind("step"), ConfigError);
    SchedulerConfig cfg = cosine_config(ScheduleKind::WarmupCosine);
    cfg.warmup_steps = cfg.total_steps;
    EXPECT_THROW(LearningRateScheduler{cfg}, ConfigError);
    cfg = cosine_config(ScheduleKind::WarmRestarts);
    cfg.restart_mult = 0.5;
    EXPECT_THROW(LearningRateScheduler{cfg}, ConfigError);
}

TEST(LRSchedulerTest, ProgressionRecordsWarmupAndDecay) {
    SchedulerConfig cfg = cosine_config(ScheduleKind::WarmupCosine);
    cfg.warmup_steps = 100;
    cfg.total_steps = 1000;
    LearningRateScheduler sched(cfg);
    SchedulerProgression p = sched.test_progression(1000);
    EXPECT_EQ(p.schedule, ScheduleKind::WarmupCosine);
    ASSERT_GE(p.points.size(), 100u);
    EXPECT_EQ(p.points.front().step, 0u);
    EXPECT_EQ(p.points.front().phase, "warmup");
    double peak = 0.0;
    for (const auto& pt : p.points) {
        peak = std::max(peak, pt.lr);
        EXPECT_GE(pt.lr, cfg.min_lr);
    }
    EXPECT_NEAR(peak, cfg.initial_lr, 1e-3);
    EXPECT_DOUBLE_EQ(p.final_lr, cfg.min_lr);
    // The simulation leaves the scheduler itself untouched.
    EXPECT_EQ(sched.state().steps, 0u);
}

TEST(LRSchedulerTest, PlateauProgressionRecordsDecays) {
    LearningRateScheduler sched(small_config());
    SchedulerProgression p = sched.test_progression(200, 7);
    EXPECT_LT(p.final_lr, 0.1);
    EXPECT_GE(p.final_lr, 0.01);
    EXPECT_GT(p.points.size(), 20u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
