// LevelForge Generation
// rng.hpp - Seeded random stream shared by one generation run

#pragma once

#include <cstdint>
#include <random>
#include <iterator>

namespace levelforge::gen {

// Deterministic pseudo-random stream. One instance belongs to exactly one
// generation call and is passed explicitly to every phase that needs it, so
// concurrent generations never share state.
class Rng {
public:
    explicit Rng(uint64_t seed);

    // Non-copyable (copying would fork the stream silently), movable
    Rng(const Rng&) = delete;
    Rng& operator=(const Rng&) = delete;
    Rng(Rng&&) noexcept = default;
    Rng& operator=(Rng&&) noexcept = default;

    [[nodiscard]] uint64_t seed() const { return seed_; }

    // Uniform double in [0, 1)
    [[nodiscard]] double next();

    // floor(next() * n); 0 when n <= 0
    [[nodiscard]] int32_t below(int32_t n);

    // Uniform integer in [lo, hi] (inclusive); lo when hi < lo
    [[nodiscard]] int32_t range(int32_t lo, int32_t hi);

    // True with probability p
    [[nodiscard]] bool chance(double p);

    [[nodiscard]] uint32_t next_u32();

    // Uniformly chosen element of an indexable container. Must not be empty.
    template <typename Container>
    [[nodiscard]] const auto& pick(const Container& items) {
        return items[static_cast<size_t>(below(static_cast<int32_t>(std::size(items))))];
    }

    // Fresh non-deterministic seed for configs that omit one
    [[nodiscard]] static uint64_t random_seed();

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

}  // namespace levelforge::gen
