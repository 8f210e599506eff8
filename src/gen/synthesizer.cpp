// LevelForge Generation
// synthesizer.cpp - Shared synthesis helpers and biome lookup table

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/ground.hpp>
#include <levelforge/gen/synthesizer.hpp>
#include <levelforge/gen/synthesizers.hpp>
#include <levelforge/gen/tile.hpp>
#include <levelforge/platform/timer.hpp>

#include <algorithm>
#include <cstdlib>
#include <deque>

namespace levelforge::gen {

const char* synthesis_phase_to_string(SynthesisPhase phase) {
    switch (phase) {
        case SynthesisPhase::Layout:
            return "layout";
        case SynthesisPhase::Terrain:
            return "terrain";
        case SynthesisPhase::Structures:
            return "structures";
        case SynthesisPhase::Interactive:
            return "interactive";
        case SynthesisPhase::Lighting:
            return "lighting";
        case SynthesisPhase::Entities:
            return "entities";
        case SynthesisPhase::Count:
            break;
    }
    return "unknown";
}

// ============================================================================
// Phase Dispatch
// ============================================================================

void Synthesizer::run_phase(SynthesisPhase phase, SynthesisContext& ctx) {
    platform::Timer timer;

    switch (phase) {
        case SynthesisPhase::Layout:
            layout(ctx);
            break;
        case SynthesisPhase::Terrain:
            paint_ground(ctx.level, ctx.rng);
            terrain(ctx);
            break;
        case SynthesisPhase::Structures:
            structures(ctx);
            break;
        case SynthesisPhase::Interactive:
            interactive(ctx);
            break;
        case SynthesisPhase::Lighting:
            lighting(ctx);
            break;
        case SynthesisPhase::Entities:
            entities(ctx);
            break;
        case SynthesisPhase::Count:
            return;
    }

    LEVELFORGE_LOG_DEBUG(core::log_category::GENERATION, "{} {} phase finished in {:.2f} ms",
                         biome_type_to_string(biome()), synthesis_phase_to_string(phase),
                         timer.elapsed_milliseconds());
}

void Synthesizer::run_all(SynthesisContext& ctx) {
    for (SynthesisPhase phase : ALL_SYNTHESIS_PHASES) {
        run_phase(phase, ctx);
    }
}

// ============================================================================
// Tile Helpers
// ============================================================================

TileId Synthesizer::tile(std::string_view name) {
    auto id = TileRegistry::instance().find_id(name);
    if (!id) {
        LEVELFORGE_LOG_ERROR(core::log_category::GENERATION, "Unknown tile tag '{}'", name);
        return TILE_NONE;
    }
    return *id;
}

geometry::Rect Synthesizer::bounds(const Level& level) {
    return geometry::Rect{0, 0, level.dimensions.width, level.dimensions.height};
}

void Synthesizer::paint_floor(Level& level, TilePos pos, TileId floor) {
    if (!level.in_bounds(pos) || level.is_blocked(pos)) {
        return;
    }
    level.set_tile(LayerId::Terrain, pos, floor);
}

void Synthesizer::place_blocking(Level& level, TilePos pos, TileId structure) {
    if (!level.in_bounds(pos)) {
        return;
    }
    level.set_tile(LayerId::Structures, pos, structure);
    level.set_tile(LayerId::Terrain, pos, TILE_NONE);
}

void Synthesizer::place_structure(Level& level, TilePos pos, TileId structure) {
    if (TileRegistry::instance().is_blocking(structure)) {
        place_blocking(level, pos, structure);
    } else {
        level.set_tile(LayerId::Structures, pos, structure);
    }
}

void Synthesizer::clear_to_floor(Level& level, TilePos pos, TileId floor) {
    if (!level.in_bounds(pos)) {
        return;
    }
    level.set_tile(LayerId::Structures, pos, TILE_NONE);
    level.set_tile(LayerId::Terrain, pos, floor);
}

void Synthesizer::infer_walls(Level& level, TileId wall) {
    const auto& registry = TileRegistry::instance();
    const int32_t width = level.dimensions.width;
    const int32_t height = level.dimensions.height;

    // Collect first so newly placed walls do not influence the scan
    std::vector<TilePos> walls;
    std::vector<TilePos> edge_cells;
    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            TilePos pos{x, y};
            if (!registry.is_walkable(level.tile(LayerId::Terrain, pos))) {
                continue;
            }
            for (const auto& offset : NEIGHBOR_OFFSETS) {
                TilePos neighbor = pos + offset;
                if (!level.in_bounds(neighbor)) {
                    edge_cells.push_back(pos);
                } else if (level.tile(LayerId::Terrain, neighbor) == TILE_NONE && !level.is_blocked(neighbor)) {
                    walls.push_back(neighbor);
                }
            }
        }
    }

    for (const auto& pos : walls) {
        place_blocking(level, pos, wall);
    }
    for (const auto& pos : edge_cells) {
        place_blocking(level, pos, wall);
    }

    // Edge cells turned into walls may expose their own floor neighbors
    if (!edge_cells.empty()) {
        infer_walls(level, wall);
    }
}

geometry::PlacementResult Synthesizer::place(SynthesisContext& ctx, const geometry::ExclusionPredicate& excluded) {
    return geometry::try_place(ctx.rng, bounds(ctx.level), excluded, ctx.settings.max_placement_attempts);
}

// ============================================================================
// Entity Helpers
// ============================================================================

void Synthesizer::add_enemy(Level& level, std::string id, std::string subtype, TilePos pos, std::string level_tag) {
    Entity entity;
    entity.id = std::move(id);
    entity.kind = EntityKind::Enemy;
    entity.subtype = std::move(subtype);
    entity.position = pos;
    entity.difficulty_level = std::move(level_tag);
    level.entities.push_back(std::move(entity));
}

void Synthesizer::add_npc(Level& level, std::string id, std::string subtype, TilePos pos, std::string dialogue) {
    Entity entity;
    entity.id = std::move(id);
    entity.kind = EntityKind::Npc;
    entity.subtype = std::move(subtype);
    entity.position = pos;
    entity.dialogue = std::move(dialogue);
    level.entities.push_back(std::move(entity));
}

// ============================================================================
// Entry and Exit
// ============================================================================

std::optional<TilePos> Synthesizer::nearest_walkable(const Level& level, TilePos near) {
    const int32_t max_radius = level.dimensions.width + level.dimensions.height;
    for (int32_t radius = 0; radius <= max_radius; ++radius) {
        for (int32_t dy = -radius; dy <= radius; ++dy) {
            for (int32_t dx = -radius; dx <= radius; ++dx) {
                if (std::max(std::abs(dx), std::abs(dy)) != radius) {
                    continue;
                }
                TilePos pos{near.x + dx, near.y + dy};
                if (level.is_walkable(pos)) {
                    return pos;
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<TilePos> Synthesizer::farthest_reachable(const Level& level, TilePos start) {
    if (!level.is_walkable(start)) {
        return std::nullopt;
    }

    Grid<int32_t> distance(level.dimensions.width, level.dimensions.height, -1);
    std::deque<TilePos> queue;
    distance.at(start) = 0;
    queue.push_back(start);
    TilePos farthest = start;

    while (!queue.empty()) {
        TilePos pos = queue.front();
        queue.pop_front();
        if (distance.at(pos) > distance.at(farthest)) {
            farthest = pos;
        }
        for (const auto& offset : CARDINAL_OFFSETS) {
            TilePos next = pos + offset;
            if (level.is_walkable(next) && distance.at(next) < 0) {
                distance.at(next) = distance.at(pos) + 1;
                queue.push_back(next);
            }
        }
    }

    return farthest;
}

void Synthesizer::mark_entry_exit(Level& level, std::optional<TilePos> entry, std::optional<TilePos> exit) {
    if (entry) {
        entry = nearest_walkable(level, *entry);
    }
    if (exit) {
        exit = nearest_walkable(level, *exit);
    }

    level.metadata.start_point = entry;
    level.metadata.end_point = exit;

    // Exit first so a single-cell level keeps its entrance tag
    if (exit) {
        level.set_tile(LayerId::Interactive, *exit, tile("level_exit"));
    }
    if (entry) {
        level.set_tile(LayerId::Interactive, *entry, tile("level_entrance"));
    }
}

// ============================================================================
// Biome Lookup Table
// ============================================================================

namespace {

using SynthesizerFactory = std::unique_ptr<Synthesizer> (*)();

template <typename T>
std::unique_ptr<Synthesizer> make() {
    return std::make_unique<T>();
}

constexpr std::array<SynthesizerFactory, BIOME_COUNT> SYNTHESIZER_TABLE = {
    &make<DungeonSynthesizer>, &make<CaveSynthesizer>, &make<ForestSynthesizer>,
    &make<TownSynthesizer>,    &make<CastleSynthesizer>,
};

}  // namespace

std::unique_ptr<Synthesizer> create_synthesizer(BiomeType biome) {
    auto index = static_cast<size_t>(biome);
    if (index >= SYNTHESIZER_TABLE.size()) {
        index = static_cast<size_t>(BiomeType::Dungeon);
    }
    return SYNTHESIZER_TABLE[index]();
}

}  // namespace levelforge::gen
