#pragma once
#include <cstdint>
#include <string>

#include "Workload.hpp"

struct BenchConfig {
    uint64_t capacity = 1000;
    uint64_t num_keys = 10000;
    uint64_t num_ops = 1000000;
    KeyDistribution dist = KeyDistribution::Zipf;
    double theta = 0.99;
    uint64_t seed = 0;
    unsigned work = 16;    // rounds of hashing per simulated compilation
    bool check = false;    // verify cache invariants at the end
};

struct BenchResult {
    uint64_t ops = 0;
    uint64_t hits = 0;
    uint64_t compiles = 0;
    uint64_t evictions = 0;
    uint64_t final_size = 0;
    double elapsed = 0; // seconds

    double hit_ratio() const { return ops ? (double)hits / ops : 0.0; }
    double ops_per_sec() const { return elapsed > 0 ? ops / elapsed : 0.0; }

    std::string to_string() const;
    std::string to_json(const BenchConfig& cfg) const;
};

// the expensive function being memoized: deterministic, depends only on key and work
std::string compile_artifact(uint64_t key, unsigned work);

// memoize compile_artifact() through a CacheDict over a synthetic key stream
BenchResult run_memo_bench(const BenchConfig& cfg);
