/**
 * @file BenchCommand.cpp
 * @brief Memoization benchmark through the bounded LRU cache.
 */

#include "BenchCommand.hpp"
#include "workload/Bench.hpp"

REGISTER_COMMAND(BenchCommand);

BenchCommand::BenchCommand(bool reg) : Command(reg, "bench", "memoize a synthetic compile step and report hit ratio and throughput") {
    m_parser.add_argument("-c", "--capacity").default_value(std::string("1k")).help("max number of cache entries");
    m_parser.add_argument("-k", "--keys").default_value(std::string("10k")).help("number of distinct keys");
    m_parser.add_argument("-n", "--ops").default_value(std::string("1m")).help("number of lookups");
    m_parser.add_argument("-d", "--dist").default_value(std::string("zipf")).choices("uniform", "zipf").help("key distribution");
    m_parser.add_argument("--theta").default_value(0.99).scan<'g', double>().help("zipf skew");
    m_parser.add_argument("--seed").default_value((uint64_t)0).scan<'u', uint64_t>().help("random seed");
    m_parser.add_argument("--work").default_value(16U).scan<'u', unsigned>().help("hash rounds per simulated compilation");
    m_parser.add_argument("--json").flag().help("print result as JSON");
    m_parser.add_argument("--check").flag().help("verify cache invariants at the end");
}

int BenchCommand::run() {
    BenchConfig cfg;
    cfg.capacity = human2count(m_parser.get("--capacity"));
    cfg.num_keys = human2count(m_parser.get("--keys"));
    cfg.num_ops  = human2count(m_parser.get("--ops"));
    cfg.dist     = parse_distribution(m_parser.get("--dist"));
    cfg.theta    = m_parser.get<double>("--theta");
    cfg.seed     = m_parser.get<uint64_t>("--seed");
    cfg.work     = m_parser.get<unsigned>("--work");
    cfg.check    = m_parser.get<bool>("--check");

    if (cfg.capacity == 0) {
        logger->warn("capacity is 0, nothing will be cached");
    }

    BenchResult result = run_memo_bench(cfg);

    if (m_parser.get<bool>("--json")) {
        fmt::print("{}\n", result.to_json(cfg));
    } else {
        fmt::print("{}\n", result.to_string());
    }
    return 0;
}
