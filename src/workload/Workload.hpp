#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>

enum class KeyDistribution { Uniform, Zipf };

// "uniform" or "zipf", throws std::invalid_argument otherwise
KeyDistribution parse_distribution(const std::string& name);
const char* distribution_name(KeyDistribution dist);

// reproducible stream of keys in [0, num_keys)
class Workload {
    public:
    // theta is the zipf skew, ignored for uniform
    Workload(uint64_t num_keys, KeyDistribution dist, double theta = 0.99, uint64_t seed = 0);

    uint64_t next();

    uint64_t num_keys() const { return m_num_keys; }
    KeyDistribution distribution() const { return m_dist; }

    private:
    uint64_t m_num_keys;
    KeyDistribution m_dist;
    std::mt19937_64 m_rng;
    std::uniform_int_distribution<uint64_t> m_uniform;
    std::uniform_real_distribution<double> m_unit;
    std::vector<double> m_cdf; // zipf only, key 0 is the most popular
};
