// LevelForge Generation
// rng.cpp - Seeded random stream implementation

#include <levelforge/gen/rng.hpp>

#include <cmath>

namespace levelforge::gen {

Rng::Rng(uint64_t seed) : seed_(seed), engine_(seed) {}

double Rng::next() {
    // Top 53 bits give every representable double in [0, 1) at uniform spacing
    return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
}

int32_t Rng::below(int32_t n) {
    if (n <= 0) {
        return 0;
    }
    auto value = static_cast<int32_t>(std::floor(next() * static_cast<double>(n)));
    return value < n ? value : n - 1;
}

int32_t Rng::range(int32_t lo, int32_t hi) {
    if (hi < lo) {
        return lo;
    }
    return lo + below(hi - lo + 1);
}

bool Rng::chance(double p) {
    return next() < p;
}

uint32_t Rng::next_u32() {
    return static_cast<uint32_t>(engine_() >> 32);
}

uint64_t Rng::random_seed() {
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) | static_cast<uint64_t>(device());
}

}  // namespace levelforge::gen
