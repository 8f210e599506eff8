// LevelForge Generation
// types.cpp - Biome and layer name conversions

#include <levelforge/gen/types.hpp>

namespace levelforge::gen {

namespace {
constexpr std::array<const char*, BIOME_COUNT> BIOME_NAMES = {"dungeon", "cave", "forest", "town", "castle"};

constexpr std::array<const char*, LAYER_COUNT> LAYER_NAMES = {"background",  "terrain",  "structures",
                                                              "interactive", "lighting", "effects"};
}  // namespace

const char* biome_type_to_string(BiomeType type) {
    auto index = static_cast<size_t>(type);
    if (index >= BIOME_COUNT) {
        return "unknown";
    }
    return BIOME_NAMES[index];
}

BiomeType biome_type_from_string(std::string_view name) {
    for (size_t i = 0; i < BIOME_COUNT; ++i) {
        if (name == BIOME_NAMES[i]) {
            return static_cast<BiomeType>(i);
        }
    }
    return BiomeType::Dungeon;  // Default fallback
}

bool is_known_biome(std::string_view name) {
    for (const char* known : BIOME_NAMES) {
        if (name == known) {
            return true;
        }
    }
    return false;
}

const char* layer_id_to_string(LayerId layer) {
    auto index = static_cast<size_t>(layer);
    if (index >= LAYER_COUNT) {
        return "unknown";
    }
    return LAYER_NAMES[index];
}

bool layer_id_from_string(std::string_view name, LayerId& out) {
    for (size_t i = 0; i < LAYER_COUNT; ++i) {
        if (name == LAYER_NAMES[i]) {
            out = static_cast<LayerId>(i);
            return true;
        }
    }
    return false;
}

}  // namespace levelforge::gen
