#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace portfolio_opt {

// PCG random number generator (permuted congruential generator)
// Fast, reproducible across platforms, and splittable
class RNG {
public:
    RNG() : state_(0x853c49e6748fea9bULL), inc_(0xda3e39cb94b95bdbULL) {}
    explicit RNG(uint64_t seed) : state_(0), inc_(seed | 1) {
        (void)next();  // Discard for seeding
        state_ += seed;
        (void)next();  // Discard for seeding
    }

    // Generate next 32-bit random number
    [[nodiscard]] uint64_t next() {
        uint64_t oldstate = state_;
        state_ = oldstate * 6364136223846793005ULL + inc_;
        uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
        uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    // 64-bit value from two draws, used for seeds
    [[nodiscard]] uint64_t next_u64() {
        const uint64_t hi = next();
        const uint64_t lo = next();
        return (hi << 32) | lo;
    }

    // Generate random double in [0, 1)
    [[nodiscard]] double uniform() {
        return static_cast<double>(next()) / static_cast<double>(1ULL << 32);
    }

    // Generate random double in [min, max)
    [[nodiscard]] double uniform(double min, double max) {
        return min + uniform() * (max - min);
    }

    // Split the RNG (return a new independent RNG seeded from current state)
    [[nodiscard]] RNG split() {
        return RNG(next_u64());
    }

    // Get current state for serialization
    [[nodiscard]] uint64_t state() const { return state_; }
    [[nodiscard]] uint64_t increment() const { return inc_; }

private:
    uint64_t state_;
    uint64_t inc_;
};

// Seed for production jobs that do not ask for reproducibility
[[nodiscard]] inline uint64_t secure_seed() {
    std::random_device device;
    const uint64_t hi = device();
    const uint64_t lo = device();
    return (hi << 32) | lo;
}

// The requested seed, or a fresh secure one when none was given.
// The entropy source is only touched in the second case.
[[nodiscard]] inline uint64_t seed_or_secure(const std::optional<uint64_t>& seed) {
    return seed ? *seed : secure_seed();
}

}  // namespace portfolio_opt
