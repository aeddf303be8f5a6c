#include "test_utils.hpp"
#include "workload/Replayer.hpp"

#include <nlohmann/json.hpp>

using testing::ElementsAre;

static TraceOp op(const std::string& line) {
    return *parse_trace_line(line, 1);
}

TEST(Replayer, basic_fixture) {
    Replayer replayer(2);
    replayer.set_check_invariants(true);
    TraceReader(find_fixture("basic.trace")).for_each([&](const TraceOp& op) { replayer.apply(op); });

    const ReplayStats& s = replayer.stats();
    EXPECT_EQ(5u, s.gets);
    EXPECT_EQ(3u, s.hits);
    EXPECT_EQ(2u, s.misses);
    EXPECT_EQ(4u, s.sets);
    EXPECT_EQ(1u, s.overwrites);
    EXPECT_EQ(1u, s.evictions);
    EXPECT_EQ(2u, s.dels);
    EXPECT_EQ(1u, s.del_misses);
    EXPECT_DOUBLE_EQ(0.6, s.hit_ratio());
    EXPECT_THAT(replayer.recency_order(), ElementsAre("a"));
    EXPECT_EQ("ALPHA", *replayer.cache().peek("a"));
}

TEST(Replayer, zero_capacity_counts_every_insert_as_eviction) {
    Replayer replayer(0);
    replayer.apply(op("set a 1"));
    replayer.apply(op("set b 2"));
    replayer.apply(op("get a"));

    EXPECT_EQ(2u, replayer.stats().evictions);
    EXPECT_EQ(1u, replayer.stats().misses);
    EXPECT_TRUE(replayer.cache().empty());
}

TEST(ReplayStats, hit_ratio_without_gets) {
    ReplayStats s;
    EXPECT_EQ(0.0, s.hit_ratio());
}

TEST(ReplayStats, json) {
    ReplayStats s;
    s.gets = 4;
    s.hits = 1;
    s.misses = 3;
    s.evictions = 2;

    auto j = nlohmann::json::parse(s.to_json());
    EXPECT_EQ(4, j["gets"].get<int>());
    EXPECT_EQ(1, j["hits"].get<int>());
    EXPECT_EQ(3, j["misses"].get<int>());
    EXPECT_EQ(2, j["evictions"].get<int>());
    EXPECT_DOUBLE_EQ(0.25, j["hit_ratio"].get<double>());
}

TEST(ReplayStats, to_string) {
    ReplayStats s;
    s.gets = 2;
    s.hits = 1;
    EXPECT_THAT(s.to_string(), HasSubstr("hit_ratio=50.00%"));
}
