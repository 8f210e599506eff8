// LevelForge Generation
// forest_synthesizer.cpp - Clearing and trail forest pipeline

#include <levelforge/gen/synthesizers.hpp>
#include <levelforge/gen/tile.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <fmt/format.h>

namespace levelforge::gen {

namespace {

constexpr std::array<const char*, 5> CLEARING_TYPES = {"normal", "pond", "ruins", "camp", "shrine"};
constexpr std::array<const char*, 5> TREE_TYPES = {"oak_tree", "pine_tree", "birch_tree", "willow_tree",
                                                   "ancient_tree"};
constexpr std::array<const char*, 5> VEGETATION_TYPES = {"bush", "flowers", "mushrooms", "ferns", "berries"};
constexpr std::array<const char*, 6> STRUCTURE_TYPES = {"ruins", "campsite", "shrine", "statue", "well", "wagon"};
constexpr std::array<const char*, 6> ENEMY_TYPES = {"wolf", "bandit", "spider", "bear", "goblin", "boar"};

constexpr double TREE_COVERAGE = 0.15;
constexpr double VEGETATION_COVERAGE = 0.08;

}  // namespace

bool ForestSynthesizer::in_clearing(TilePos pos) const {
    return std::any_of(clearings_.begin(), clearings_.end(),
                       [&](const TypedRegion& clearing) { return clearing.rect.contains(pos); });
}

void ForestSynthesizer::layout(SynthesisContext& ctx) {
    const int32_t width = ctx.level.dimensions.width;
    const int32_t height = ctx.level.dimensions.height;
    const geometry::Rect map = bounds(ctx.level);

    int32_t clearing_count = ctx.rng.range(2, 5);
    clearings_.clear();
    for (int32_t i = 0; i < clearing_count; ++i) {
        geometry::Rect rect;
        rect.x = ctx.rng.below(std::max(1, width - 6)) + 3;
        rect.y = ctx.rng.below(std::max(1, height - 6)) + 3;
        rect.width = ctx.rng.range(3, 6);
        rect.height = ctx.rng.range(3, 6);
        clearings_.push_back(TypedRegion{fmt::format("clearing_{}", i), rect.clipped(map), ctx.rng.pick(CLEARING_TYPES)});
    }

    paths_.clear();
    for (size_t i = 0; i + 1 < clearings_.size(); ++i) {
        paths_.push_back(Connector{clearings_[i].rect.center(), clearings_[i + 1].rect.center(), 1});
    }
}

void ForestSynthesizer::terrain(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId grass = tile("forest_grass");
    const TileId clearing = tile("forest_clearing");
    const TileId path = tile("forest_path");

    level.layer(LayerId::Terrain).fill(grass);

    for (const auto& region : clearings_) {
        region.rect.for_each_cell([&](TilePos pos) { paint_floor(level, pos, clearing); });
    }

    for (const auto& connector : paths_) {
        for (const auto& pos : geometry::rasterize_line(connector.start, connector.end, connector.width)) {
            paint_floor(level, pos, path);
        }
    }

    // Side trails wander between two random points at least four tiles apart
    int32_t trail_count = ctx.rng.range(1, 3);
    side_trails_ = 0;
    for (int32_t i = 0; i < trail_count; ++i) {
        for (int32_t attempt = 0; attempt < ctx.settings.max_placement_attempts; ++attempt) {
            TilePos start = bounds(level).random_cell(ctx.rng);
            TilePos end = bounds(level).random_cell(ctx.rng);
            if (std::abs(start.x - end.x) > 3 || std::abs(start.y - end.y) > 3) {
                for (const auto& pos : geometry::rasterize_line(start, end, 1)) {
                    paint_floor(level, pos, path);
                }
                ++side_trails_;
                break;
            }
        }
    }
}

void ForestSynthesizer::structures(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId path = tile("forest_path");
    const auto area = static_cast<double>(level.dimensions.width) * static_cast<double>(level.dimensions.height);

    auto excluded = [&](TilePos pos) {
        return in_clearing(pos) || level.tile(LayerId::Terrain, pos) == path ||
               level.tile(LayerId::Structures, pos) != TILE_NONE;
    };

    auto tree_count = static_cast<int32_t>(area * TREE_COVERAGE);
    for (int32_t i = 0; i < tree_count; ++i) {
        auto result = place(ctx, excluded);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            place_structure(level, placed->pos, tile(ctx.rng.pick(TREE_TYPES)));
        }
    }

    auto bush_count = static_cast<int32_t>(area * VEGETATION_COVERAGE);
    for (int32_t i = 0; i < bush_count; ++i) {
        auto result = place(ctx, excluded);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            place_structure(level, placed->pos, tile(ctx.rng.pick(VEGETATION_TYPES)));
        }
    }

    for (const auto& clearing : clearings_) {
        if (clearing.rect.empty() || !ctx.rng.chance(0.4)) {
            continue;
        }
        TileId structure = tile(ctx.rng.pick(STRUCTURE_TYPES));
        TilePos pos = clearing.rect.random_cell(ctx.rng);
        // Paths through the clearing stay open
        if (level.tile(LayerId::Terrain, pos) != path) {
            place_structure(level, pos, structure);
        }
    }

    int32_t scattered_count = ctx.rng.range(2, 5);
    for (int32_t i = 0; i < scattered_count; ++i) {
        auto result = place(ctx, excluded);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            place_structure(level, placed->pos, tile(ctx.rng.pick(STRUCTURE_TYPES)));
        }
    }
}

void ForestSynthesizer::interactive(SynthesisContext& ctx) {
    const TileId chest = tile("treasure_chest");
    for (const auto& clearing : clearings_) {
        if (clearing.rect.empty() || !ctx.rng.chance(0.5)) {
            continue;
        }
        TilePos pos = clearing.rect.random_cell(ctx.rng);
        if (!ctx.level.is_blocked(pos)) {
            ctx.level.set_tile(LayerId::Interactive, pos, chest);
        }
    }
}

void ForestSynthesizer::lighting(SynthesisContext& ctx) {
    Level& level = ctx.level;

    const TileId campfire = tile("campfire");
    for (const auto& clearing : clearings_) {
        if (clearing.rect.empty() || !ctx.rng.chance(0.3)) {
            continue;
        }
        level.set_tile(LayerId::Lighting, clearing.rect.random_cell(ctx.rng), campfire);
    }

    const TileId torch = tile("torch");
    int32_t torch_count = ctx.rng.range(4, 9);
    for (int32_t i = 0; i < torch_count; ++i) {
        auto result = place(ctx, [&](TilePos pos) { return level.tile(LayerId::Lighting, pos) != TILE_NONE; });
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            level.set_tile(LayerId::Lighting, placed->pos, torch);
        }
    }
}

void ForestSynthesizer::entities(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId path = tile("forest_path");
    const TileId clearing_floor = tile("forest_clearing");

    int32_t enemy_count = ctx.rng.range(3, 7);
    for (int32_t i = 0; i < enemy_count; ++i) {
        auto result = place(ctx, [&](TilePos pos) {
            return !level.is_walkable(pos) || level.tile(LayerId::Terrain, pos) == path ||
                   level.tile(LayerId::Structures, pos) != TILE_NONE;
        });
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            add_enemy(level, fmt::format("forest_enemy_{}", i), ctx.rng.pick(ENEMY_TYPES), placed->pos,
                      ctx.config.difficulty);
        }
    }

    if (ctx.rng.chance(0.25)) {
        auto result = place(ctx, [&](TilePos pos) {
            return level.tile(LayerId::Terrain, pos) != clearing_floor || level.is_blocked(pos);
        });
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            add_npc(level, "forest_druid", "druid", placed->pos, "The forest has many secrets...");
        }
    }

    if (!clearings_.empty()) {
        mark_entry_exit(level, clearings_.front().rect.center(), clearings_.back().rect.center());
    }
}

std::map<std::string, size_t> ForestSynthesizer::region_summary() const {
    return {{"clearing", clearings_.size()}, {"path", paths_.size()}, {"trail", side_trails_}};
}

}  // namespace levelforge::gen
