#include "commands/BenchCommand.hpp"
#include "commands/TestCommand.hpp"
#include "test_utils.hpp"

#include <nlohmann/json.hpp>

class BenchCommandTest : public CmdTestBase<BenchCommand> {
    protected:
    void SetUp() override {
        logger->set_verbosity(-4);
    }

    void TearDown() override {
        logger->set_verbosity(0);
    }
};

TEST_F(BenchCommandTest, text_output) {
    std::string output = run_cmd({ "-c", "10", "-k", "100", "-n", "1000" });
    EXPECT_THAT(output, HasSubstr("ops=1000 "));
    EXPECT_THAT(output, HasSubstr("size=10 "));
}

TEST_F(BenchCommandTest, json_output) {
    std::string output = run_cmd({ "-c", "50", "-k", "50", "-n", "2k", "--dist", "uniform", "--seed", "3", "--json", "--check" });
    auto j = nlohmann::json::parse(split(output, '\n').at(0));
    EXPECT_EQ(2000, j["ops"].get<int>());
    EXPECT_EQ("uniform", j["dist"].get<std::string>());
    EXPECT_EQ(0, j["evictions"].get<int>());
    EXPECT_EQ(2000, j["hits"].get<int>() + j["compiles"].get<int>());
}

TEST_F(BenchCommandTest, unknown_distribution_rejected) {
    BenchCommand cmd;
    EXPECT_THROW(cmd.parser().parse_args({ "cachedict", "--dist", "gauss" }), std::exception);
}

TEST(TestCommand, self_test_passes) {
    TestCommand cmd;
    EXPECT_EQ(0, cmd.run());
}
