#pragma once
#include <cstdint>
#include <random>
#include <string>

namespace harvest {

// Lowercase hex suffix for session, checkpoint and plan ids
inline std::string random_hex(size_t length) {
    static constexpr char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out(length, '0');
    for (auto& c : out) c = hex[dist(rng)];
    return out;
}

} // namespace harvest
