#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "Cache/CacheDict.hpp"
#include "Trace.hpp"

struct ReplayStats {
    uint64_t gets = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t sets = 0;
    uint64_t overwrites = 0;
    uint64_t evictions = 0;
    uint64_t dels = 0;
    uint64_t del_misses = 0;

    double hit_ratio() const { return gets ? (double)hits / gets : 0.0; }

    std::string to_string() const;
    std::string to_json() const;
};

// drives a string->string cache with trace ops and counts what happened
class Replayer {
    public:
    using cache_type = Cache::CacheDict<std::string, std::string>;

    explicit Replayer(size_t capacity) : m_cache(capacity) {}

    void apply(const TraceOp& op);

    // verify cache invariants after every op, throws Cache::InvalidStateError on the first violation
    void set_check_invariants(bool check) { m_check = check; }

    const ReplayStats& stats() const { return m_stats; }
    const cache_type& cache() const { return m_cache; }

    // keys from most to least recently used
    std::vector<std::string> recency_order() const;

    private:
    cache_type m_cache;
    ReplayStats m_stats;
    bool m_check = false;
};
