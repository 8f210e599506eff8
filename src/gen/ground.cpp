// LevelForge Generation
// ground.cpp - Background ground layer using FastNoise2

#include <FastNoise/FastNoise.h>
#include <levelforge/core/logger.hpp>
#include <levelforge/gen/ground.hpp>
#include <levelforge/gen/tile.hpp>

#include <array>
#include <utility>

namespace levelforge::gen {

namespace {

// Base tone, alternate tone
constexpr std::array<std::pair<const char*, const char*>, BIOME_COUNT> GROUND_TAGS = {{
    {"dungeon_bedrock", "dungeon_bedrock_cracked"},
    {"cave_bedrock", "cave_bedrock_damp"},
    {"forest_soil", "forest_soil_mossy"},
    {"town_soil", "town_soil_packed"},
    {"castle_foundation", "castle_foundation_worn"},
}};

}  // namespace

void paint_ground(Level& level, Rng& rng, const GroundConfig& config) {
    const auto& registry = TileRegistry::instance();
    const auto& tags = GROUND_TAGS[static_cast<size_t>(level.biome)];
    TileId base = registry.find_id(tags.first).value_or(TILE_NONE);
    TileId alternate = registry.find_id(tags.second).value_or(TILE_NONE);

    auto seed = static_cast<int>(rng.next_u32() & 0x7FFFFFFFu);

    auto simplex = FastNoise::New<FastNoise::Simplex>();
    auto fractal = FastNoise::New<FastNoise::FractalFBm>();
    fractal->SetSource(simplex);
    fractal->SetOctaveCount(config.octaves);
    fractal->SetGain(config.gain);

    size_t alternate_count = 0;
    auto& layer = level.layer(LayerId::Background);
    for (int32_t y = 0; y < level.dimensions.height; ++y) {
        for (int32_t x = 0; x < level.dimensions.width; ++x) {
            float value = fractal->GenSingle2D(static_cast<float>(x) * config.scale,
                                               static_cast<float>(y) * config.scale, seed);
            bool use_alternate = value > config.variant_threshold;
            layer.at({x, y}) = use_alternate ? alternate : base;
            if (use_alternate) {
                ++alternate_count;
            }
        }
    }

    LEVELFORGE_LOG_TRACE(core::log_category::GENERATION, "Ground pass: {} of {} cells use '{}'", alternate_count,
                         layer.size(), tags.second);
}

}  // namespace levelforge::gen
