#pragma once
#include <cstdint>
#include <string>

uint64_t human2count(const std::string& count);
std::string count2human(uint64_t count);

std::string duration2human(double seconds);
