/**
 * @file Replayer.cpp
 * @brief Applies trace operations to a CacheDict and collects hit/miss/eviction counters.
 */

#include "Replayer.hpp"
#include "utils/common.hpp"

#include <nlohmann/json.hpp>

std::string ReplayStats::to_string() const {
    return fmt::format("gets={} hits={} misses={} hit_ratio={:.2f}% sets={} overwrites={} evictions={} dels={} del_misses={}",
        gets, hits, misses, hit_ratio() * 100, sets, overwrites, evictions, dels, del_misses);
}

std::string ReplayStats::to_json() const {
    const auto j = nlohmann::ordered_json{
        {"gets", gets},
        {"hits", hits},
        {"misses", misses},
        {"hit_ratio", hit_ratio()},
        {"sets", sets},
        {"overwrites", overwrites},
        {"evictions", evictions},
        {"dels", dels},
        {"del_misses", del_misses},
    };
    return j.dump();
}

void Replayer::apply(const TraceOp& op) {
    switch (op.type) {
        case TraceOpType::Get: {
            m_stats.gets++;
            std::string value;
            if (m_cache.try_get(op.key, value)) {
                m_stats.hits++;
                logger->trace("line {}: hit {}", op.line, op.key);
            } else {
                m_stats.misses++;
                logger->trace("line {}: miss {}", op.line, op.key);
            }
            break;
        }

        case TraceOpType::Set:
            m_stats.sets++;
            if (m_cache.contains(op.key)) {
                m_stats.overwrites++;
            } else if (m_cache.size() >= m_cache.max_size()) {
                m_stats.evictions++;
                if (!m_cache.empty()) {
                    logger->trace("line {}: evicting {}", op.line, m_cache.recency().key(m_cache.recency().last()));
                }
            }
            m_cache.set(op.key, op.value);
            break;

        case TraceOpType::Del:
            m_stats.dels++;
            if (!m_cache.remove(op.key)) {
                m_stats.del_misses++;
            }
            break;
    }

    if (m_check && !m_cache.check_invariants()) {
        throw Cache::InvalidStateError(fmt::format("cache invariants broken after line {}: {}", op.line, op.to_string()));
    }
}

std::vector<std::string> Replayer::recency_order() const {
    return std::vector<std::string>(m_cache.recency().begin(), m_cache.recency().end());
}
