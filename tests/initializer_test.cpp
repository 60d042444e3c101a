#include <cmath>
#include <gtest/gtest.h>
#include <vigil/initializer.hpp>

using namespace vigil;

namespace {

double mean_of(const Matrix& m) {
    double s = 0.0;
    for (double v : m.data())
        s += v;
    return s / static_cast<double>(m.size());
}

double stddev_of(const Matrix& m) {
    double mu = mean_of(m);
    double s = 0.0;
    for (double v : m.data())
        s += (v - mu) * (v - mu);
    return std::sqrt(s / static_cast<double>(m.size()));
}

} // namespace

TEST(InitializerTest, ShapeMatchesFans) {
    XavierInitializer init(InitializerConfig{InitMode::Normal, 1.0, 42});
    Matrix w = init.initialize(10, 32);
    EXPECT_EQ(w.rows(), 10u);
    EXPECT_EQ(w.cols(), 32u);
}

TEST(InitializerTest, UniformStaysWithinLimit) {
    XavierInitializer init(InitializerConfig{InitMode::Uniform, 1.0, 1});
    Matrix w = init.initialize(20, 30);
    double limit = XavierInitializer::uniform_limit(20, 30, 1.0);
    for (double v : w.data()) {
        EXPECT_GE(v, -limit);
        EXPECT_LE(v, limit);
    }
}

TEST(InitializerTest, NormalVarianceMatchesXavier) {
    XavierInitializer init(InitializerConfig{InitMode::Normal, 1.0, 7});
    Matrix w = init.initialize(200, 200);
    double expected = XavierInitializer::normal_stddev(200, 200, 1.0);
    EXPECT_NEAR(mean_of(w), 0.0, 0.01);
    EXPECT_NEAR(stddev_of(w), expected, expected * 0.05);
}

TEST(InitializerTest, ConvLayersUseHeScaling) {
    XavierInitializer init(InitializerConfig{InitMode::Normal, 1.0, 9});
    Matrix w = init.initialize_layer(LayerKind::Conv, 100, 400);
    double he = XavierInitializer::he_stddev(100, 1.0);
    EXPECT_NEAR(stddev_of(w), he, he * 0.05);
}

TEST(InitializerTest, SameSeedSameWeights) {
    XavierInitializer a(InitializerConfig{InitMode::Normal, 1.0, 123});
    XavierInitializer b(InitializerConfig{InitMode::Normal, 1.0, 123});
    EXPECT_EQ(a.initialize(8, 4), b.initialize(8, 4));
    XavierInitializer c(InitializerConfig{InitMode::Normal, 1.0, 124});
    EXPECT_NE(a.initialize(8, 4), c.initialize(8, 4));
}

TEST(InitializerTest, RejectsInvalidArguments) {
    XavierInitializer init;
    EXPECT_THROW(init.initialize(0, 4), ConfigError);
    EXPECT_THROW(init.initialize(4, 0), ConfigError);
    EXPECT_THROW(init.initialize(4, 4, InitMode::Normal, -1.0), ConfigError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
