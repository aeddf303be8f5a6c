/**
 * @file ReplayCommand.cpp
 * @brief Replays a cache access trace against a bounded LRU cache.
 *
 * Prints the hit/miss/eviction counters, and optionally the final recency order
 * (most recently used first) and a JSON summary.
 */

#include "ReplayCommand.hpp"
#include "workload/Replayer.hpp"

REGISTER_COMMAND(ReplayCommand);

ReplayCommand::ReplayCommand(bool reg) : Command(reg, "replay", "replay a trace file (set/get/del lines) against the cache") {
    m_parser.add_argument("trace").help("trace file");
    m_parser.add_argument("-c", "--capacity").required().help("max number of cache entries (accepts k/m/g suffixes)");
    m_parser.add_argument("--dump").flag().help("print cached keys, most recently used first");
    m_parser.add_argument("--json").flag().help("print summary as JSON");
    m_parser.add_argument("--check").flag().help("verify cache invariants after every operation");
}

int ReplayCommand::run() {
    const std::string fname = m_parser.get("trace");
    const uint64_t capacity = human2count(m_parser.get("--capacity"));

    Replayer replayer(capacity);
    replayer.set_check_invariants(m_parser.get<bool>("--check"));

    try {
        TraceReader reader(fname);
        size_t nops = reader.for_each([&](const TraceOp& op) { replayer.apply(op); }, g_force);
        logger->info("{}: {} ops replayed, {} lines read, {} skipped", fname, nops, reader.lines_read(), reader.lines_skipped());
    } catch (const TraceError& e) {
        logger->error("{}: {}", fname, e.what());
        return 1;
    }

    const ReplayStats& stats = replayer.stats();
    if (m_parser.get<bool>("--json")) {
        fmt::print("{}\n", stats.to_json());
    } else {
        fmt::print("{}\n", stats.to_string());
    }

    if (m_parser.get<bool>("--dump")) {
        for (const auto& key : replayer.recency_order()) {
            fmt::print("{}\n", key);
        }
    }
    return 0;
}
