/**
 * @file Bench.cpp
 * @brief Memoization benchmark: an "expensive" compile step behind a bounded LRU cache.
 */

#include "Bench.hpp"
#include "Cache/CacheDict.hpp"
#include "utils/common.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

std::string BenchResult::to_string() const {
    return fmt::format("ops={} hits={} compiles={} hit_ratio={:.2f}% evictions={} size={} elapsed={} rate={}/s",
        ops, hits, compiles, hit_ratio() * 100, evictions, final_size, duration2human(elapsed), count2human((uint64_t)ops_per_sec()));
}

std::string BenchResult::to_json(const BenchConfig& cfg) const {
    const auto j = nlohmann::ordered_json{
        {"capacity", cfg.capacity},
        {"keys", cfg.num_keys},
        {"dist", distribution_name(cfg.dist)},
        {"theta", cfg.theta},
        {"seed", cfg.seed},
        {"ops", ops},
        {"hits", hits},
        {"compiles", compiles},
        {"hit_ratio", hit_ratio()},
        {"evictions", evictions},
        {"size", final_size},
        {"elapsed", elapsed},
        {"ops_per_sec", ops_per_sec()},
    };
    return j.dump();
}

// FNV-1a over the key, re-hashed `work` times
std::string compile_artifact(uint64_t key, unsigned work) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned round = 0; round <= work; round++) {
        for (int i = 0; i < 8; i++) {
            h ^= (key >> (i * 8)) & 0xff;
            h *= 0x100000001b3ULL;
        }
        key = h;
    }
    return fmt::format("{:016x}", h);
}

BenchResult run_memo_bench(const BenchConfig& cfg) {
    Workload workload(cfg.num_keys, cfg.dist, cfg.theta, cfg.seed);
    Cache::CacheDict<uint64_t, std::string> cache(cfg.capacity);
    BenchResult result;

    logger->debug("bench: capacity={} keys={} ops={} dist={} theta={} seed={}",
        cfg.capacity, cfg.num_keys, cfg.num_ops, distribution_name(cfg.dist), cfg.theta, cfg.seed);

    auto start = std::chrono::steady_clock::now();
    for (uint64_t i = 0; i < cfg.num_ops; i++) {
        uint64_t key = workload.next();
        bool compiled = false;
        bool was_full = cache.size() >= cache.max_size();
        cache.get_or_set(key, [&]() {
            compiled = true;
            return compile_artifact(key, cfg.work);
        });

        result.ops++;
        if (compiled) {
            result.compiles++;
            if (was_full) {
                result.evictions++;
            }
        } else {
            result.hits++;
        }
    }
    result.elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    result.final_size = cache.size();

    if (cfg.check && !cache.check_invariants()) {
        throw Cache::InvalidStateError("bench: cache invariants broken");
    }
    return result;
}
