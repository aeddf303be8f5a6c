/**
 * @file Workload.cpp
 * @brief Synthetic key streams for cache benchmarks.
 */

#include "Workload.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

KeyDistribution parse_distribution(const std::string& name) {
    if (name == "uniform") return KeyDistribution::Uniform;
    if (name == "zipf") return KeyDistribution::Zipf;

    throw std::invalid_argument("Unknown key distribution: " + name);
}

const char* distribution_name(KeyDistribution dist) {
    return dist == KeyDistribution::Zipf ? "zipf" : "uniform";
}

Workload::Workload(uint64_t num_keys, KeyDistribution dist, double theta, uint64_t seed)
    : m_num_keys(num_keys), m_dist(dist), m_rng(seed), m_unit(0.0, 1.0)
{
    if (num_keys == 0) {
        throw std::invalid_argument("Workload: number of keys must be positive");
    }
    m_uniform = std::uniform_int_distribution<uint64_t>(0, num_keys - 1);

    if (dist == KeyDistribution::Zipf) {
        if (theta < 0 || std::isnan(theta)) {
            throw std::invalid_argument("Workload: zipf theta must be non-negative");
        }

        // P(k) ~ 1 / (k+1)^theta
        m_cdf.resize(num_keys);
        double sum = 0;
        for (uint64_t k = 0; k < num_keys; k++) {
            sum += 1.0 / std::pow((double)(k + 1), theta);
            m_cdf[k] = sum;
        }
        for (double& c : m_cdf) {
            c /= sum;
        }
        m_cdf.back() = 1.0;
    }
}

uint64_t Workload::next() {
    if (m_dist == KeyDistribution::Uniform) {
        return m_uniform(m_rng);
    }

    double u = m_unit(m_rng);
    auto it = std::lower_bound(m_cdf.begin(), m_cdf.end(), u);
    if (it == m_cdf.end()) {
        --it;
    }
    return it - m_cdf.begin();
}
