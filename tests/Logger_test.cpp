#include "test_utils.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

class LoggerTest : public ::testing::Test {
    protected:
    std::ostringstream out;
    std::shared_ptr<spdlog::logger> sp;
    std::unique_ptr<Logger> wrapper;

    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        sink->set_pattern("%l %v");
        sp = std::make_shared<spdlog::logger>("test", sink);
        wrapper = std::make_unique<Logger>(sp);
    }
};

TEST_F(LoggerTest, verbosity_levels) {
    wrapper->set_verbosity(0);
    wrapper->debug("hidden");
    wrapper->info("shown");
    EXPECT_THAT(out.str(), Not(HasSubstr("hidden")));
    EXPECT_THAT(out.str(), HasSubstr("shown"));

    wrapper->set_verbosity(2);
    wrapper->trace("traced");
    EXPECT_THAT(out.str(), HasSubstr("traced"));

    wrapper->set_verbosity(-4);
    wrapper->critical("silenced");
    EXPECT_THAT(out.str(), Not(HasSubstr("silenced")));
}

TEST_F(LoggerTest, dedup_limit) {
    wrapper->set_dedup_limit(2);
    for (int i = 0; i < 5; i++) {
        wrapper->warn("bad line {}", i);
    }
    std::string s = out.str();
    EXPECT_THAT(s, HasSubstr("bad line 0"));
    EXPECT_THAT(s, HasSubstr("bad line 1"));
    EXPECT_THAT(s, HasSubstr("bad line 2 [repeated 2 times, suppressing]"));
    EXPECT_THAT(s, Not(HasSubstr("bad line 3")));
    EXPECT_EQ(5, wrapper->seen_count("bad line {}"));
}

TEST_F(LoggerTest, no_dedup_by_default) {
    for (int i = 0; i < 3; i++) {
        wrapper->error("err {}", i);
    }
    EXPECT_THAT(out.str(), HasSubstr("err 2"));
    EXPECT_EQ(0, wrapper->seen_count("err {}"));
}

TEST_F(LoggerTest, console_level_guard) {
    wrapper->set_verbosity(0);
    wrapper->with_console_level(spdlog::level::critical, [&]{
        wrapper->info("muted");
    });
    wrapper->info("audible");
    EXPECT_THAT(out.str(), Not(HasSubstr("muted")));
    EXPECT_THAT(out.str(), HasSubstr("audible"));
}
