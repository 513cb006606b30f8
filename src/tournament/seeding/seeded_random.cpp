/// @file seeded_random.cpp
/// @brief Park-Miller generator.

#include "tourney/tournament/seeded_random.hpp"

#include <random>

namespace tourney::tournament {

SeededRandom::SeededRandom(uint64_t seed)
    : state_(seed % kModulus) {
    if (state_ == 0) {
        state_ = 1;
    }
}

SeededRandom SeededRandom::fromEntropy() {
    std::random_device device;
    return SeededRandom(static_cast<uint64_t>(device()));
}

double SeededRandom::next() {
    state_ = state_ * kMultiplier % kModulus;
    return static_cast<double>(state_ - 1) / static_cast<double>(kModulus - 1);
}

std::size_t SeededRandom::nextIndex(std::size_t bound) {
    auto index = static_cast<std::size_t>(next() * static_cast<double>(bound));
    return index < bound ? index : bound - 1;
}

} // namespace tourney::tournament
