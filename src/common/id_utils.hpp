#pragma once

#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace nudge {

inline std::string generateUuid()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    const uint64_t part1 = dist(gen);
    const uint64_t part2 = dist(gen);

    std::ostringstream out;
    out << std::hex;
    out << (part1 >> 32);
    out << "-";
    out << ((part1 >> 16) & 0xFFFF);
    out << "-";
    out << (part1 & 0xFFFF);
    out << "-";
    out << (part2 >> 48);
    out << "-";
    out << (part2 & 0xFFFFFFFFFFFFULL);
    return out.str();
}

} // namespace nudge
