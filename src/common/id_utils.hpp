#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace stratum {

// 32 lowercase hex characters; image and layer ids.
inline std::string generateHexId()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << std::setw(16) << dist(gen)
        << std::setw(16) << dist(gen);
    return out.str();
}

inline std::string shortId(const std::string &id)
{
    return id.substr(0, 12);
}

} // namespace stratum
