#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vigil/engine_config.hpp>

using namespace vigil;

TEST(EngineConfigTest, DefaultsAreValid) {
    EngineConfig cfg;
    EXPECT_NO_THROW(validate(cfg));
    EXPECT_EQ(cfg.training.batch_size, 32u);
    EXPECT_DOUBLE_EQ(cfg.training.max_grad_norm, 1.0);
    EXPECT_DOUBLE_EQ(cfg.optimizer.learning_rate, 0.001);
    EXPECT_EQ(cfg.watchdog.check_interval, 10u);
    EXPECT_EQ(cfg.watchdog.max_resets, 5u);
    EXPECT_DOUBLE_EQ(cfg.watchdog.reset_lr_factor, 0.25);
    EXPECT_EQ(cfg.buffer.capacity, 200000u);
}

TEST(EngineConfigTest, PartialOverride) {
    auto cfg = parse_engine_config(R"({
        "training": {"batchSize": 8, "regularization": {"enabled": false}},
        "watchdog": {"maxResets": 2},
        "exploration": {"mode": "softmax_temperature", "seed": 5}
    })");
    EXPECT_EQ(cfg.training.batch_size, 8u);
    EXPECT_FALSE(cfg.training.regularization.enabled);
    EXPECT_DOUBLE_EQ(cfg.training.regularization.lambda, 1e-4);
    EXPECT_EQ(cfg.training.epochs, 1000u);
    EXPECT_EQ(cfg.watchdog.max_resets, 2u);
    EXPECT_EQ(cfg.watchdog.check_interval, 10u);
    EXPECT_EQ(cfg.exploration.mode, ExplorationMode::SoftmaxTemperature);
    ASSERT_TRUE(cfg.exploration.seed.has_value());
    EXPECT_EQ(*cfg.exploration.seed, 5u);
}

TEST(EngineConfigTest, LearningRatesStayInAgreement) {
    auto cfg = parse_engine_config(R"({"optimizer": {"learningRate": 0.01}})");
    EXPECT_DOUBLE_EQ(cfg.scheduler.initial_lr, 0.01);

    cfg = parse_engine_config(R"({"scheduler": {"initialLR": 0.002}})");
    EXPECT_DOUBLE_EQ(cfg.optimizer.learning_rate, 0.002);

    cfg = parse_engine_config(
        R"({"optimizer": {"learningRate": 0.01}, "scheduler": {"initialLR": 0.01}})");
    EXPECT_DOUBLE_EQ(cfg.scheduler.initial_lr, 0.01);

    EXPECT_THROW(parse_engine_config(
                     R"({"optimizer": {"learningRate": 0.01}, "scheduler": {"initialLR": 0.002}})"),
                 ConfigError);
}

TEST(EngineConfigTest, CodeBuiltRateMismatchRejected) {
    EngineConfig cfg;
    cfg.optimizer.learning_rate = 0.05;
    EXPECT_THROW(validate(cfg), ConfigError);
    set_learning_rate(cfg, 0.05);
    EXPECT_NO_THROW(validate(cfg));
    EXPECT_DOUBLE_EQ(cfg.scheduler.initial_lr, 0.05);
}

TEST(EngineConfigTest, ScheduleAndNormOptionsParse) {
    auto cfg = parse_engine_config(R"({
        "training": {"gradNormType": "inf"},
        "scheduler": {"schedule": "warm_restarts", "restartPeriod": 50, "restartMult": 1.5},
        "exploration": {"mode": "entropy_guided", "entropyThreshold": 0.7}
    })");
    EXPECT_EQ(cfg.training.grad_norm_type, NormType::Inf);
    EXPECT_EQ(cfg.scheduler.schedule, ScheduleKind::WarmRestarts);
    EXPECT_EQ(cfg.scheduler.restart_period, 50u);
    EXPECT_DOUBLE_EQ(cfg.scheduler.restart_mult, 1.5);
    EXPECT_EQ(cfg.exploration.mode, ExplorationMode::EntropyGuided);
    EXPECT_DOUBLE_EQ(cfg.exploration.entropy_threshold, 0.7);
    EXPECT_DOUBLE_EQ(cfg.exploration.uncertainty_weight, 0.3);

    json j = cfg;
    EXPECT_EQ(j["scheduler"]["schedule"].get<std::string>(), "warm_restarts");
    EXPECT_EQ(j["training"]["gradNormType"].get<std::string>(), "inf");
    EXPECT_THROW(parse_engine_config(R"({"scheduler": {"schedule": "linear"}})"), ConfigError);
    EXPECT_THROW(parse_engine_config(R"({"training": {"gradNormType": "l0"}})"), ConfigError);
}

TEST(EngineConfigTest, JsonRoundTrip) {
    EngineConfig cfg;
    cfg.training.loss = LossKind::BinaryCrossEntropy;
    cfg.training.checkpoint_path = "run/model.json";
    cfg.buffer.seed = 17;
    cfg.initializer.mode = InitMode::Uniform;
    cfg.exploration.schedule = DecaySchedule::Exponential;
    json j = cfg;
    EngineConfig back;
    from_json(j, back);
    EXPECT_EQ(back.training.loss, LossKind::BinaryCrossEntropy);
    EXPECT_EQ(back.training.checkpoint_path, "run/model.json");
    ASSERT_TRUE(back.buffer.seed.has_value());
    EXPECT_EQ(*back.buffer.seed, 17u);
    EXPECT_EQ(back.initializer.mode, InitMode::Uniform);
    EXPECT_EQ(back.exploration.schedule, DecaySchedule::Exponential);
    EXPECT_FALSE(back.exploration.seed.has_value());
    EXPECT_EQ(j["watchdog"]["resetLRFactor"].get<double>(), 0.25);
}

TEST(EngineConfigTest, InvalidValuesRejected) {
    EXPECT_THROW(parse_engine_config(R"({"training": {"batchSize": 0}})"), ConfigError);
    EXPECT_THROW(parse_engine_config(R"({"training": {"validationSplit": 1.5}})"), ConfigError);
    EXPECT_THROW(parse_engine_config(R"({"watchdog": {"resetLRFactor": 2.0}})"), ConfigError);
    EXPECT_THROW(parse_engine_config(R"({"training": {"loss": "hinge"}})"), ConfigError);
    EXPECT_THROW(parse_engine_config(R"({"training": {"batchSize": "many"}})"), ConfigError);
    EXPECT_THROW(parse_engine_config("{not json"), ConfigError);
}

TEST(EngineConfigTest, LoadFromFile) {
    {
        std::ofstream out("engine_config_test.json");
        out << R"({"scheduler": {"patience": 4, "minLR": 1e-5}})";
    }
    auto cfg = load_engine_config("engine_config_test.json");
    EXPECT_EQ(cfg.scheduler.patience, 4u);
    EXPECT_DOUBLE_EQ(cfg.scheduler.min_lr, 1e-5);
    std::remove("engine_config_test.json");
    EXPECT_THROW(load_engine_config("engine_config_missing.json"), ConfigError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
