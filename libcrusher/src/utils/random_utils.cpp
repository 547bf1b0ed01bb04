#include "../../include/random_utils.hpp"
#include <random>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<std::uint64_t> dist;
}

std::uint64_t crusher::RandomUtils::next_u64() {
    return dist(rng);
}

std::string crusher::RandomUtils::random_suffix() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::uint64_t value = next_u64();
    std::string out(16, '0');
    for (auto it = out.rbegin(); it != out.rend(); ++it) {
        *it = kHex[value & 0xF];
        value >>= 4;
    }
    return out;
}
