#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>

namespace {

void write_experiences(const char* path, int rows) {
    std::ofstream out(path);
    out << "# action,reward,f1,f2,f3\n";
    for (int i = 0; i < rows; ++i) {
        double r = (i % 3 == 0) ? -0.02 : 0.01;
        out << (r > 0 ? 1 : 2) << ',' << r << ',' << 0.01 * i << ',' << -0.5 + 0.02 * i << ','
            << (i % 2) << '\n';
    }
}

} // namespace

TEST(VigilCliTest, TrainWritesCheckpointAndInspectReadsIt) {
    write_experiences("cli_experiences.csv", 80);
    {
        std::ofstream cfg("cli_config.json");
        cfg << R"({"training": {"batchSize": 8, "logInterval": 0},
                   "initializer": {"seed": 1}, "buffer": {"seed": 2}})";
    }
    ASSERT_EQ(std::system("./vigil_cli train cli_experiences.csv --config cli_config.json "
                          "--epochs 2 -o cli_checkpoint.json --quiet > /dev/null"),
              0);
    std::ifstream check("cli_checkpoint.json");
    EXPECT_TRUE(check.good());
    EXPECT_EQ(std::system("./vigil_cli inspect cli_checkpoint.json > /dev/null"), 0);
    std::remove("cli_experiences.csv");
    std::remove("cli_config.json");
    std::remove("cli_checkpoint.json");
}

TEST(VigilCliTest, SelfTestPasses) {
    EXPECT_EQ(std::system("./vigil_cli selftest > /dev/null"), 0);
    EXPECT_EQ(std::system("./vigil_cli selftest | grep -q 'PASS clip_l2_extreme'"), 0);
    EXPECT_EQ(std::system("./vigil_cli selftest | grep -q 'PASS decoupled_weight_decay'"), 0);
    EXPECT_EQ(std::system("./vigil_cli selftest | grep -q 'PASS schedule_warmup_cosine'"), 0);
    EXPECT_EQ(std::system("./vigil_cli selftest | grep -q 'PASS exploration_entropy_guided'"), 0);
    EXPECT_NE(std::system("./vigil_cli selftest | grep -q FAIL"), 0);
}

TEST(VigilCliTest, ErrorsReturnNonZero) {
    EXPECT_NE(std::system("./vigil_cli > /dev/null 2>&1"), 0);
    EXPECT_NE(std::system("./vigil_cli inspect cli_missing.json > /dev/null 2>&1"), 0);
    write_experiences("cli_small.csv", 3);
    EXPECT_NE(std::system("./vigil_cli train cli_small.csv --quiet > /dev/null 2>&1"), 0);
    EXPECT_NE(std::system("./vigil_cli train cli_small.csv --bogus > /dev/null 2>&1"), 0);
    std::remove("cli_small.csv");
}

TEST(VigilCliTest, VersionFlag) { EXPECT_EQ(std::system("./vigil_cli --version > /dev/null"), 0); }

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
