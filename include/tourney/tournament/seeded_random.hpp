#pragma once

/// @file seeded_random.hpp
/// @brief Reproducible pseudo-random source for seeding and shuffles.

#include <cstddef>
#include <cstdint>

namespace tourney::tournament {

/// Park-Miller minimal standard generator.
///
/// The same seed always yields the same sequence, which makes random
/// seedings reproducible across runs and platforms.
class SeededRandom {
public:
    static constexpr uint64_t kModulus = 2147483647;
    static constexpr uint64_t kMultiplier = 16807;

    /// A seed of 0 (or any multiple of the modulus) is replaced with 1.
    explicit SeededRandom(uint64_t seed);

    /// Generator seeded from std::random_device.
    static SeededRandom fromEntropy();

    /// Next value in [0, 1).
    double next();

    /// floor(next() * bound); bound must be positive.
    std::size_t nextIndex(std::size_t bound);

    [[nodiscard]] uint64_t state() const noexcept { return state_; }

private:
    uint64_t state_;
};

} // namespace tourney::tournament
