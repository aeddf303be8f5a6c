/**
 * @file units.cpp
 * @brief Conversions between counts/durations and their human-readable form.
 *
 * Counts use decimal suffixes (k, m, g) since they are numbers of entries or
 * operations, not bytes.
 */

#include "units.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <spdlog/fmt/fmt.h>

/**
 * @brief Parses "4096", "10k", "2M", "1g" or "0x1000" into a number.
 *
 * @throws std::runtime_error If the suffix is unknown or the value overflows.
 * @throws std::invalid_argument If there are no digits.
 */
uint64_t human2count(const std::string& count) {
    if (count.length() > 2 && count[0] == '0' && (count[1]|0x20) == 'x') {
        return std::stoull(count, nullptr, 16);
    }

    size_t i = 0;
    while (i < count.length() && isdigit((unsigned char)count[i])) {
        i++;
    }
    if (i == 0) {
        throw std::invalid_argument("Not a number: " + count);
    }

    uint64_t number = std::stoull(count.substr(0, i));
    std::string suffix = count.substr(i);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(), ::tolower);

    uint64_t multiplier = 1;
    if (suffix == "k") {
        multiplier = 1000;
    } else if (suffix == "m") {
        multiplier = 1000 * 1000;
    } else if (suffix == "g") {
        multiplier = 1000 * 1000 * 1000;
    } else if (!suffix.empty()) {
        throw std::runtime_error("Unsupported suffix: " + suffix);
    }

    if (number > UINT64_MAX / multiplier) {
        throw std::runtime_error("Value out of range: " + count);
    }
    return number * multiplier;
}

/**
 * @brief Shortens a count while keeping at most 4 significant digits before the suffix.
 *
 * 999 -> "999", 12345 -> "12k", 3000000 -> "3000k", 30000000 -> "30M"
 */
std::string count2human(uint64_t count) {
    static const std::vector<const char*> suffixes { "", "k", "M", "G", "T" };

    size_t i = 0;
    while (i < suffixes.size() - 1 && count >= 10000) {
        count /= 1000;
        i++;
    }
    return std::to_string(count) + suffixes[i];
}

/**
 * @brief Formats an elapsed time: "850us", "12ms", "2.31s", "3m05s".
 */
std::string duration2human(double seconds) {
    if (seconds < 0) {
        seconds = 0;
    }
    if (seconds < 0.001) {
        return fmt::format("{}us", std::llround(seconds * 1e6));
    }
    if (seconds < 1) {
        return fmt::format("{}ms", std::llround(seconds * 1e3));
    }
    if (seconds < 60) {
        return fmt::format("{:.2f}s", seconds);
    }
    uint64_t whole = (uint64_t)seconds;
    return fmt::format("{}m{:02}s", whole / 60, whole % 60);
}
