// LevelForge Generation
// types.hpp - Tile coordinates, biome and layer enums, tile flags

#pragma once

#include <glm/vec2.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace levelforge::gen {

// ============================================================================
// Coordinates
// ============================================================================

// Tile coordinate: x = column, y = row
using TilePos = glm::ivec2;

// 4-neighborhood offsets (west, east, north, south)
inline constexpr std::array<glm::ivec2, 4> CARDINAL_OFFSETS = {{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}};

// 8-neighborhood offsets, row-major around the center
inline constexpr std::array<glm::ivec2, 8> NEIGHBOR_OFFSETS = {
    {{-1, -1}, {0, -1}, {1, -1}, {-1, 0}, {1, 0}, {-1, 1}, {0, 1}, {1, 1}}};

// ============================================================================
// Biomes
// ============================================================================

enum class BiomeType : uint8_t {
    Dungeon = 0,
    Cave,
    Forest,
    Town,
    Castle,
    Count
};

inline constexpr size_t BIOME_COUNT = static_cast<size_t>(BiomeType::Count);

[[nodiscard]] const char* biome_type_to_string(BiomeType type);

// Unknown names fall back to Dungeon
[[nodiscard]] BiomeType biome_type_from_string(std::string_view name);

// True when the name is one of the five recognized biomes
[[nodiscard]] bool is_known_biome(std::string_view name);

// ============================================================================
// Layers
// ============================================================================

enum class LayerId : uint8_t {
    Background = 0,
    Terrain,
    Structures,
    Interactive,
    Lighting,
    Effects,
    Count
};

inline constexpr size_t LAYER_COUNT = static_cast<size_t>(LayerId::Count);

inline constexpr std::array<LayerId, LAYER_COUNT> ALL_LAYERS = {LayerId::Background,  LayerId::Terrain,
                                                                LayerId::Structures,  LayerId::Interactive,
                                                                LayerId::Lighting,    LayerId::Effects};

[[nodiscard]] const char* layer_id_to_string(LayerId layer);
[[nodiscard]] bool layer_id_from_string(std::string_view name, LayerId& out);

// ============================================================================
// Tile Identification
// ============================================================================

// Tile type ID - references a registered TileType
using TileId = uint16_t;

// Unassigned cell
inline constexpr TileId TILE_NONE = 0;
inline constexpr TileId TILE_INVALID = 0xFFFF;

// ============================================================================
// Tile Property Flags
// ============================================================================

enum class TileFlags : uint32_t {
    None = 0,
    Walkable = 1 << 0,    // Floor an actor can stand on
    Blocking = 1 << 1,    // Obstacle (wall, tree, pillar)
    Liquid = 1 << 2,      // Water features
    Emissive = 1 << 3,    // Light source
    Treasure = 1 << 4,    // Chest or loot container
    Door = 1 << 5,        // Doorway marker
    Marker = 1 << 6,      // Level entrance or exit
    Ambient = 1 << 7      // Cosmetic effect overlay
};

inline TileFlags operator|(TileFlags a, TileFlags b) {
    return static_cast<TileFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline TileFlags operator&(TileFlags a, TileFlags b) {
    return static_cast<TileFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline TileFlags& operator|=(TileFlags& a, TileFlags b) {
    a = a | b;
    return a;
}

[[nodiscard]] inline bool has_flag(TileFlags flags, TileFlags flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

}  // namespace levelforge::gen

// ============================================================================
// Hash for using tile coordinates as set/map keys
// ============================================================================

namespace std {

template <>
struct hash<levelforge::gen::TilePos> {
    size_t operator()(const levelforge::gen::TilePos& pos) const noexcept {
        size_t h1 = std::hash<int32_t>{}(pos.x);
        size_t h2 = std::hash<int32_t>{}(pos.y);
        return h1 ^ (h2 * 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace std
