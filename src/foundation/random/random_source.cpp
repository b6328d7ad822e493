/// @file random_source.cpp
/// @brief SeededRandomSource implementation.

#include "sgc/foundation/random_source.hpp"

namespace sgc::foundation {

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : seed_(seed), engine_(seed) {}

bool SeededRandomSource::chance(double probability) {
    if (probability <= 0.0) {
        return false;
    }
    if (probability >= 1.0) {
        return true;
    }
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_) < probability;
}

int32_t SeededRandomSource::uniformInt(int32_t lo, int32_t hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_int_distribution<int32_t> dist(lo, hi);
    return dist(engine_);
}

void SeededRandomSource::reseed(uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
}

} // namespace sgc::foundation
