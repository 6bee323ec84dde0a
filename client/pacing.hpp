#pragma once

#include <chrono>
#include <random>

/**
 * @brief Pause between two iterations of a VU: a constant part plus a
 * uniformly drawn jitter in [0, jitter].
 *
 * Fixed(d) has no jitter, Between(lo, hi) is uniform in [lo, hi].
 */
struct ThinkTime {
    std::chrono::milliseconds base{0};
    std::chrono::milliseconds jitter{0};

    static ThinkTime None() { return ThinkTime{}; }

    static ThinkTime Fixed(std::chrono::milliseconds d) {
        return ThinkTime{d, std::chrono::milliseconds(0)};
    }

    static ThinkTime Between(std::chrono::milliseconds lo, std::chrono::milliseconds hi) {
        return ThinkTime{lo, hi > lo ? hi - lo : std::chrono::milliseconds(0)};
    }

    std::chrono::milliseconds Draw(std::mt19937& gen) const {
        if (jitter.count() <= 0) return base;
        std::uniform_int_distribution<long long> dist(0, jitter.count());
        return base + std::chrono::milliseconds(dist(gen));
    }
};
