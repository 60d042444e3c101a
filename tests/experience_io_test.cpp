#include <gtest/gtest.h>
#include <sstream>
#include <vigil/experience_io.hpp>

using namespace vigil;

TEST(ExperienceIOTest, ParsesRowsAndSkipsComments) {
    std::istringstream in("# action,reward,features\n"
                          "1,0.5,0.1,0.2\n"
                          "\n"
                          "2, -0.25 ,0.3,\"0.4\"\n");
    auto rows = read_experiences_csv(in);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].action, 1);
    EXPECT_DOUBLE_EQ(rows[0].reward, 0.5);
    EXPECT_EQ(rows[0].state, (std::vector<double>{0.1, 0.2}));
    EXPECT_EQ(rows[1].action, 2);
    EXPECT_DOUBLE_EQ(rows[1].reward, -0.25);
    EXPECT_DOUBLE_EQ(rows[1].state[1], 0.4);
    EXPECT_EQ(rows[1].timestamp, 4);
}

TEST(ExperienceIOTest, ReportsBadCell) {
    std::istringstream in("1,0.5,0.1\n1,abc,0.2\n");
    try {
        read_experiences_csv(in);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("row 2 column 2"), std::string::npos);
    }
}

TEST(ExperienceIOTest, RejectsInconsistentRows) {
    std::istringstream ragged("1,0.5,0.1,0.2\n1,0.5,0.1\n");
    EXPECT_THROW(read_experiences_csv(ragged), ConfigError);
    std::istringstream narrow("1,0.5\n");
    EXPECT_THROW(read_experiences_csv(narrow), ConfigError);
    std::istringstream action("3,0.5,0.1\n");
    EXPECT_THROW(read_experiences_csv(action), ConfigError);
    std::istringstream fractional("1.5,0.5,0.1\n");
    EXPECT_THROW(read_experiences_csv(fractional), ConfigError);
    EXPECT_THROW(read_experiences_csv(std::string("no_such_file.csv")), ConfigError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
