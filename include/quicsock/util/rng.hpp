#pragma once

#include <random>

namespace qs {

inline std::mt19937_64& rng() {
    static thread_local std::mt19937_64 generator(std::random_device{}());
    return generator;
}

/// Returns true with the given probability (0.0 to 1.0), used for packet loss simulation.
inline bool randomChance(float chance) {
    if (chance <= 0.0f) return false;

    auto& generator = rng();
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(generator) < chance;
}

}
