// LevelForge Generation
// level.cpp - Level model queries

#include <levelforge/gen/level.hpp>
#include <levelforge/gen/tile.hpp>

#include <algorithm>

namespace levelforge::gen {

const char* entity_kind_to_string(EntityKind kind) {
    return kind == EntityKind::Npc ? "npc" : "enemy";
}

void Level::set_tile(LayerId id, TilePos pos, TileId tile) {
    auto& grid = layer(id);
    if (grid.in_bounds(pos)) {
        grid.at(pos) = tile;
    }
}

bool Level::is_walkable(TilePos pos) const {
    if (!in_bounds(pos)) {
        return false;
    }
    const auto& registry = TileRegistry::instance();
    return registry.is_walkable(tile(LayerId::Terrain, pos)) && !registry.is_blocking(tile(LayerId::Structures, pos));
}

bool Level::is_blocked(TilePos pos) const {
    return TileRegistry::instance().is_blocking(tile(LayerId::Structures, pos));
}

size_t Level::count_walkable() const {
    size_t count = 0;
    for (int32_t y = 0; y < dimensions.height; ++y) {
        for (int32_t x = 0; x < dimensions.width; ++x) {
            if (is_walkable({x, y})) {
                ++count;
            }
        }
    }
    return count;
}

size_t Level::count_enemies() const {
    return static_cast<size_t>(
        std::count_if(entities.begin(), entities.end(), [](const Entity& e) { return e.is_enemy(); }));
}

size_t Level::count_npcs() const {
    return static_cast<size_t>(
        std::count_if(entities.begin(), entities.end(), [](const Entity& e) { return e.is_npc(); }));
}

}  // namespace levelforge::gen
