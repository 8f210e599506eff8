// LevelForge Generation
// ground.hpp - Background ground layer from a seeded noise field

#pragma once

#include "level.hpp"
#include "rng.hpp"

#include <cstdint>

namespace levelforge::gen {

struct GroundConfig {
    float scale = 0.15f;       // noise frequency per tile
    int32_t octaves = 2;
    float gain = 0.5f;
    float variant_threshold = 0.25f;  // noise above this picks the alternate tone
};

// Fills every background cell with the biome's base or alternate ground tag.
// The noise seed is drawn from rng, so the pass consumes exactly one value
// from the stream regardless of level size.
void paint_ground(Level& level, Rng& rng, const GroundConfig& config = {});

}  // namespace levelforge::gen
