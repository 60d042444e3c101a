#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vigil/activations.hpp>

using namespace vigil;

TEST(ActivationsTest, LeakyReluSlopes) {
    EXPECT_DOUBLE_EQ(leaky_relu(2.0), 2.0);
    EXPECT_DOUBLE_EQ(leaky_relu(-2.0), -0.02);
    EXPECT_DOUBLE_EQ(activation_derivative(Activation::LeakyRelu, 3.0), 1.0);
    EXPECT_DOUBLE_EQ(activation_derivative(Activation::LeakyRelu, -3.0), kLeakySlope);
}

TEST(ActivationsTest, SigmoidStaysInsideOpenInterval) {
    EXPECT_DOUBLE_EQ(sigmoid(0.0), 0.5);
    double hi = sigmoid(50.0);
    double lo = sigmoid(-50.0);
    EXPECT_LT(hi, 1.0);
    EXPECT_GT(lo, 0.0);
    EXPECT_GT(activation_derivative(Activation::Sigmoid, 50.0), 0.0);
    // Huge inputs are clamped instead of overflowing exp.
    EXPECT_TRUE(std::isfinite(sigmoid(1e300)));
    EXPECT_TRUE(std::isfinite(sigmoid(-1e300)));
}

TEST(ActivationsTest, TanhAndLinear) {
    EXPECT_NEAR(tanh_act(0.5), std::tanh(0.5), 1e-15);
    EXPECT_NEAR(activation_derivative(Activation::Tanh, 0.0), 1.0, 1e-15);
    EXPECT_DOUBLE_EQ(linear(3.5), 3.5);
    EXPECT_DOUBLE_EQ(activation_derivative(Activation::Linear, -7.0), 1.0);
}

TEST(ActivationsTest, InputAndOutputClamping) {
    ActivationLimits lim{-10.0, 10.0};
    EXPECT_DOUBLE_EQ(linear(50.0, lim), 10.0);
    EXPECT_DOUBLE_EQ(linear(-50.0, lim), -10.0);
    EXPECT_DOUBLE_EQ(leaky_relu(1e9), 1e4);
    EXPECT_LE(linear(1e30, ActivationLimits{-1e30, 1e30}), kActivationOutputLimit);
}

TEST(ActivationsTest, NaNPassesThrough) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(std::isnan(leaky_relu(nan)));
    EXPECT_TRUE(std::isnan(sigmoid(nan)));
    EXPECT_TRUE(std::isnan(clamp_finite(nan, 0.0, 1.0)));
}

TEST(ActivationsTest, SoftmaxSumsToOne) {
    auto p = softmax({1.0, 2.0, 3.0});
    ASSERT_EQ(p.size(), 3u);
    EXPECT_NEAR(p[0] + p[1] + p[2], 1.0, 1e-12);
    EXPECT_GT(p[2], p[1]);
    EXPECT_GT(p[1], p[0]);

    auto big = softmax({1000.0, 1000.0});
    EXPECT_NEAR(big[0], 0.5, 1e-12);

    auto sharp = softmax({1.0, 2.0}, 0.01);
    EXPECT_GT(sharp[1], 0.99);
    EXPECT_TRUE(softmax({}).empty());
}

TEST(ActivationsTest, ParseNames) {
    EXPECT_EQ(parse_activation("leaky_relu"), Activation::LeakyRelu);
    EXPECT_EQ(parse_activation("sigmoid"), Activation::Sigmoid);
    EXPECT_EQ(parse_activation(to_string(Activation::Tanh)), Activation::Tanh);
    EXPECT_THROW(parse_activation("relu6"), ConfigError);
}

TEST(ActivationsTest, StabilitySelfTestPasses) {
    StabilityReport report = run_activation_stability_self_test();
    EXPECT_TRUE(report.passed);
    // Three input sets, four activations plus softmax each.
    ASSERT_EQ(report.cases.size(), 15u);
    EXPECT_EQ(report.cases[0].inputs, "extreme_values");
    EXPECT_EQ(report.cases[4].function, "softmax");
    for (const auto& c : report.cases)
        EXPECT_TRUE(c.passed) << c.inputs << " " << c.function;
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
