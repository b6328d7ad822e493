#pragma once

/// @file random_source.hpp
/// @brief Injectable, seedable random source for turn resolution.
///
/// Every random decision of the rules (loot roll, loot type, candidate
/// shuffling) goes through an IRandomSource passed in explicitly, so a
/// fixed seed or a scripted fake reproduces a turn exactly.

#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace sgc::foundation {

/// Source of randomness consumed by the turn pipeline.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Return true with probability @p probability (clamped to [0, 1]).
    virtual bool chance(double probability) = 0;

    /// Uniform integer in the closed range [lo, hi].  Requires lo <= hi.
    virtual int32_t uniformInt(int32_t lo, int32_t hi) = 0;
};

/// Mersenne-Twister backed random source with an explicit seed.
///
/// Thread safety: None.  One instance belongs to one TurnEngine.
class SeededRandomSource final : public IRandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);

    bool chance(double probability) override;

    int32_t uniformInt(int32_t lo, int32_t hi) override;

    /// Re-seed, restarting the sequence.
    void reseed(uint64_t seed);

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

/// Fisher-Yates shuffle driven by an IRandomSource.
template <typename T>
void shuffle(std::vector<T>& values, IRandomSource& rng) {
    if (values.size() < 2) {
        return;
    }
    for (auto i = static_cast<int32_t>(values.size()) - 1; i > 0; --i) {
        auto j = rng.uniformInt(0, i);
        if (j != i) {
            std::swap(values[static_cast<std::size_t>(i)],
                      values[static_cast<std::size_t>(j)]);
        }
    }
}

} // namespace sgc::foundation
