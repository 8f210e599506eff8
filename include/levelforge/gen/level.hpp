// LevelForge Generation
// level.hpp - Layered level model, entities and generation input

#pragma once

#include "grid.hpp"
#include "types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace levelforge::gen {

// ============================================================================
// Entities
// ============================================================================

enum class EntityKind : uint8_t {
    Enemy = 0,
    Npc
};

[[nodiscard]] const char* entity_kind_to_string(EntityKind kind);

// A placed actor. Enemies carry a difficulty tag, NPCs a line of dialogue.
struct Entity {
    std::string id;
    EntityKind kind = EntityKind::Enemy;
    std::string subtype;  // enemyType or npcType
    TilePos position{0, 0};
    std::string difficulty_level;  // enemies only
    std::string dialogue;          // npcs only

    [[nodiscard]] bool is_enemy() const { return kind == EntityKind::Enemy; }
    [[nodiscard]] bool is_npc() const { return kind == EntityKind::Npc; }

    bool operator==(const Entity& other) const = default;
};

// ============================================================================
// Level
// ============================================================================

struct Dimensions {
    int32_t width = 0;      // tiles
    int32_t height = 0;     // tiles
    int32_t tile_size = 0;  // pixels

    bool operator==(const Dimensions& other) const = default;
};

struct LevelMetadata {
    std::string generated_at;  // ISO-8601
    std::string version = "1.0";
    uint64_t seed = 0;
    std::vector<std::string> objectives;
    std::string description;
    std::optional<TilePos> start_point;
    std::optional<TilePos> end_point;

    bool operator==(const LevelMetadata& other) const = default;
};

// Cells hold registered tile ids; TILE_NONE is unassigned
using TileLayer = Grid<TileId>;

struct Level {
    std::string id;
    std::string name;
    BiomeType biome = BiomeType::Dungeon;
    std::string theme;
    std::string difficulty;
    Dimensions dimensions;
    std::array<TileLayer, LAYER_COUNT> layers;
    std::vector<Entity> entities;
    LevelMetadata metadata;

    [[nodiscard]] TileLayer& layer(LayerId id) { return layers[static_cast<size_t>(id)]; }
    [[nodiscard]] const TileLayer& layer(LayerId id) const { return layers[static_cast<size_t>(id)]; }

    [[nodiscard]] bool in_bounds(TilePos pos) const {
        return pos.x >= 0 && pos.y >= 0 && pos.x < dimensions.width && pos.y < dimensions.height;
    }

    // TILE_NONE for out-of-bounds positions
    [[nodiscard]] TileId tile(LayerId id, TilePos pos) const { return layer(id).get_or(pos, TILE_NONE); }

    // Ignores out-of-bounds positions
    void set_tile(LayerId id, TilePos pos, TileId tile);

    // Registry-backed cell queries
    [[nodiscard]] bool is_walkable(TilePos pos) const;
    [[nodiscard]] bool is_blocked(TilePos pos) const;

    [[nodiscard]] size_t count_walkable() const;
    [[nodiscard]] size_t count_enemies() const;
    [[nodiscard]] size_t count_npcs() const;

    bool operator==(const Level& other) const = default;
};

// ============================================================================
// Generation Input
// ============================================================================

struct LevelConfig {
    int32_t width = 32;
    int32_t height = 24;
    int32_t tile_size = 32;
    std::string biome_name = "dungeon";  // unrecognized names fall back to dungeon
    std::string theme = "medieval";
    std::string difficulty = "normal";
    std::optional<uint64_t> seed;  // drawn from std::random_device when absent
    std::optional<std::string> name;

    [[nodiscard]] BiomeType biome() const { return biome_type_from_string(biome_name); }

    bool operator==(const LevelConfig& other) const = default;
};

}  // namespace levelforge::gen
