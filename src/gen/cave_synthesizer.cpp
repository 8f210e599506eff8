// LevelForge Generation
// cave_synthesizer.cpp - Cellular automata cave pipeline

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/synthesizers.hpp>
#include <levelforge/gen/tile.hpp>

#include <algorithm>
#include <array>
#include <fmt/format.h>

namespace levelforge::gen {

namespace {

constexpr std::array<const char*, 4> FORMATIONS = {"stalactite", "stalagmite", "pillar", "flowstone"};
constexpr std::array<const char*, 5> ENEMY_TYPES = {"cave_spider", "goblin", "bat", "troll", "ooze"};

}  // namespace

// ============================================================================
// Cellular Automata
// ============================================================================

BoolGrid CaveSynthesizer::smooth(const BoolGrid& rock) {
    BoolGrid next(rock.width(), rock.height(), 0);
    for (int32_t y = 0; y < rock.height(); ++y) {
        for (int32_t x = 0; x < rock.width(); ++x) {
            TilePos pos{x, y};
            int32_t neighbors = 0;
            for (const auto& offset : NEIGHBOR_OFFSETS) {
                if (rock.get_or(pos + offset, 1) != 0) {
                    ++neighbors;
                }
            }
            bool is_rock = rock.at(pos) != 0;
            next.at(pos) = is_rock ? (neighbors >= ROCK_SURVIVAL_NEIGHBORS ? 1 : 0)
                                   : (neighbors >= ROCK_BIRTH_NEIGHBORS ? 1 : 0);
        }
    }
    return next;
}

void CaveSynthesizer::layout(SynthesisContext& ctx) {
    const int32_t width = ctx.level.dimensions.width;
    const int32_t height = ctx.level.dimensions.height;

    rock_ = BoolGrid(width, height, 0);
    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            rock_.at({x, y}) = ctx.rng.chance(INITIAL_ROCK_CHANCE) ? 1 : 0;
        }
    }

    for (int32_t i = 0; i < SMOOTHING_ITERATIONS; ++i) {
        rock_ = smooth(rock_);
    }

    // Solid border ring keeps every open cell's neighborhood in bounds
    for (int32_t x = 0; x < width; ++x) {
        rock_.at({x, 0}) = 1;
        rock_.at({x, height - 1}) = 1;
    }
    for (int32_t y = 0; y < height; ++y) {
        rock_.at({0, y}) = 1;
        rock_.at({width - 1, y}) = 1;
    }

    regions_ = geometry::classify_cave_regions(rock_);

    // Noise pockets are filled back in as rock
    for (const auto& pocket : regions_.noise) {
        for (const auto& cell : pocket.cells) {
            rock_.at(cell) = 1;
        }
    }
}

void CaveSynthesizer::terrain(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId floor = tile("cave_floor");
    const TileId wall = tile("cave_wall");
    const TileId water = tile("cave_water");

    for (int32_t y = 0; y < level.dimensions.height; ++y) {
        for (int32_t x = 0; x < level.dimensions.width; ++x) {
            TilePos pos{x, y};
            if (is_rock(pos)) {
                place_blocking(level, pos, wall);
            } else {
                level.set_tile(LayerId::Terrain, pos, floor);
            }
        }
    }

    int32_t water_count = ctx.rng.range(1, 3);
    for (int32_t i = 0; i < water_count; ++i) {
        auto result = place(ctx, [&](TilePos pos) { return is_rock(pos) || level.tile(LayerId::Terrain, pos) != floor; });
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            level.set_tile(LayerId::Terrain, placed->pos, water);
        }
    }
}

void CaveSynthesizer::structures(SynthesisContext& ctx) {
    Level& level = ctx.level;

    for (const auto& chamber : regions_.chambers) {
        int32_t formation_count = ctx.rng.range(3, 7);
        for (int32_t i = 0; i < formation_count; ++i) {
            TilePos pos = ctx.rng.pick(chamber.cells);
            TileId formation = tile(ctx.rng.pick(FORMATIONS));
            // A second draw on the same cell keeps the first formation
            if (level.tile(LayerId::Structures, pos) == TILE_NONE) {
                place_structure(level, pos, formation);
            }
        }
    }

    auto occupied = [&](TilePos pos) {
        return is_rock(pos) || level.tile(LayerId::Structures, pos) != TILE_NONE;
    };

    const TileId crystal = tile("crystal_cluster");
    int32_t crystal_count = ctx.rng.range(5, 12);
    for (int32_t i = 0; i < crystal_count; ++i) {
        auto result = place(ctx, occupied);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            level.set_tile(LayerId::Structures, placed->pos, crystal);
        }
    }

    const TileId mushroom = tile("cave_mushroom");
    int32_t mushroom_count = ctx.rng.range(10, 24);
    for (int32_t i = 0; i < mushroom_count; ++i) {
        auto result = place(ctx, occupied);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            level.set_tile(LayerId::Structures, placed->pos, mushroom);
        }
    }
}

void CaveSynthesizer::interactive(SynthesisContext& ctx) {
    const TileId chest = tile("treasure_chest");
    for (const auto& chamber : regions_.chambers) {
        if (!ctx.rng.chance(0.6)) {
            continue;
        }
        TilePos pos = ctx.rng.pick(chamber.cells);
        if (ctx.level.is_walkable(pos)) {
            ctx.level.set_tile(LayerId::Interactive, pos, chest);
        }
    }
}

void CaveSynthesizer::lighting(SynthesisContext& ctx) {
    Level& level = ctx.level;
    auto lit = [&](TilePos pos) { return is_rock(pos) || level.tile(LayerId::Lighting, pos) != TILE_NONE; };

    const TileId glow = tile("glowing_mushroom");
    int32_t glow_count = ctx.rng.range(6, 13);
    for (int32_t i = 0; i < glow_count; ++i) {
        auto result = place(ctx, lit);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            level.set_tile(LayerId::Lighting, placed->pos, glow);
        }
    }

    const TileId crystal_light = tile("crystal_light");
    int32_t crystal_count = ctx.rng.range(3, 7);
    for (int32_t i = 0; i < crystal_count; ++i) {
        auto result = place(ctx, lit);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            level.set_tile(LayerId::Lighting, placed->pos, crystal_light);
        }
    }
}

void CaveSynthesizer::entities(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId floor = tile("cave_floor");
    auto not_floor = [&](TilePos pos) { return is_rock(pos) || level.tile(LayerId::Terrain, pos) != floor; };

    int32_t enemy_count = ctx.rng.range(4, 9);
    for (int32_t i = 0; i < enemy_count; ++i) {
        auto result = place(ctx, not_floor);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            add_enemy(level, fmt::format("cave_enemy_{}", i), ctx.rng.pick(ENEMY_TYPES), placed->pos,
                      ctx.config.difficulty);
        }
    }

    if (ctx.rng.chance(0.2)) {
        auto result = place(ctx, not_floor);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            add_npc(level, "cave_hermit", "cave_hermit", placed->pos, "These caves hold many secrets...");
        }
    }

    // Entry in the largest open region, exit at the far end of its reach
    const geometry::Component* largest = nullptr;
    for (const auto* group : {&regions_.chambers, &regions_.tunnels}) {
        for (const auto& component : *group) {
            if (largest == nullptr || component.size() > largest->size()) {
                largest = &component;
            }
        }
    }
    if (largest == nullptr) {
        LEVELFORGE_LOG_DEBUG(core::log_category::GENERATION, "Cave has no open region for an entry point");
        return;
    }

    std::optional<TilePos> entry;
    for (const auto& cell : largest->cells) {
        if (level.is_walkable(cell)) {
            entry = cell;
            break;
        }
    }
    if (!entry) {
        return;
    }
    mark_entry_exit(level, entry, farthest_reachable(level, *entry));
}

std::map<std::string, size_t> CaveSynthesizer::region_summary() const {
    return {{"chamber", regions_.chambers.size()},
            {"tunnel", regions_.tunnels.size()},
            {"noise", regions_.noise.size()}};
}

}  // namespace levelforge::gen
