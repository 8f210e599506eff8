// LevelForge Generation
// castle_synthesizer.cpp - Fortification template castle pipeline

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/synthesizers.hpp>
#include <levelforge/gen/tile.hpp>

#include <algorithm>
#include <array>
#include <fmt/format.h>

namespace levelforge::gen {

namespace {

constexpr std::array<const char*, 5> SECTION_TYPES = {"barracks", "armory", "dining_hall", "library", "chapel"};
constexpr std::array<const char*, 5> DECORATION_TYPES = {"castle_banner", "castle_statue", "castle_fountain",
                                                         "castle_bench", "castle_urn"};
constexpr std::array<const char*, 5> SERVANT_DIALOGUE = {
    "Welcome to the castle, milord.", "The lord is not receiving visitors right now.", "Please state your business.",
    "The castle has stood for centuries.", "Mind your manners in the presence of nobility."};

constexpr double MOSS_CHANCE = 0.1;

struct Furnishing {
    const char* section_type;
    const char* tile;
    int32_t min_count;
    int32_t max_count;
};

constexpr std::array<Furnishing, 3> FURNISHINGS = {{
    {"barracks", "castle_bed", 2, 4},
    {"armory", "weapon_rack", 1, 2},
    {"dining_hall", "dining_table", 1, 2},
}};

geometry::Rect shrink(const geometry::Rect& rect) {
    return geometry::Rect{rect.x + 1, rect.y + 1, std::max(0, rect.width - 2), std::max(0, rect.height - 2)};
}

}  // namespace

void CastleSynthesizer::layout(SynthesisContext& ctx) {
    const int32_t width = ctx.level.dimensions.width;
    const int32_t height = ctx.level.dimensions.height;
    const geometry::Rect map = bounds(ctx.level);

    wall_thickness_ = std::clamp(ctx.settings.castle_wall_thickness, 1, std::max(1, std::min(width, height) / 4));
    const int32_t t = wall_thickness_;
    const int32_t inner_width = width - 2 * t;
    const int32_t inner_height = height - 2 * t;
    const geometry::Rect inner{t, t, std::max(0, inner_width), std::max(0, inner_height)};

    towers_.clear();
    for (const TilePos corner : {TilePos{t, t}, TilePos{width - t - TOWER_SIZE, t}, TilePos{t, height - t - TOWER_SIZE},
                                 TilePos{width - t - TOWER_SIZE, height - t - TOWER_SIZE}}) {
        towers_.push_back(geometry::Rect{corner.x, corner.y, TOWER_SIZE, TOWER_SIZE}.clipped(inner));
    }

    keep_ = geometry::Rect{width / 2 - KEEP_SIZE / 2, height / 2 - KEEP_SIZE / 2, KEEP_SIZE, KEEP_SIZE}.clipped(map);

    courtyards_.clear();
    int32_t courtyard_count = ctx.rng.range(1, 2);
    for (int32_t i = 0; i < courtyard_count; ++i) {
        geometry::Rect rect;
        rect.x = t + 2 + ctx.rng.below(std::max(1, inner_width - 8));
        rect.y = t + 2 + ctx.rng.below(std::max(1, inner_height - 8));
        rect.width = ctx.rng.range(4, 7);
        rect.height = ctx.rng.range(4, 7);
        courtyards_.push_back(TypedRegion{fmt::format("courtyard_{}", i), rect.clipped(inner), "courtyard"});
    }

    sections_.clear();
    int32_t section_count = ctx.rng.range(2, 4);
    for (int32_t i = 0; i < section_count; ++i) {
        geometry::Rect rect;
        rect.x = t + 1 + ctx.rng.below(std::max(1, inner_width - 6));
        rect.y = t + 1 + ctx.rng.below(std::max(1, inner_height - 6));
        rect.width = ctx.rng.range(3, 5);
        rect.height = ctx.rng.range(3, 5);
        sections_.push_back(TypedRegion{fmt::format("section_{}", i), rect.clipped(inner), ctx.rng.pick(SECTION_TYPES)});
    }
}

void CastleSynthesizer::terrain(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const int32_t width = level.dimensions.width;
    const int32_t height = level.dimensions.height;
    const int32_t t = wall_thickness_;
    const TileId stone = tile("castle_stone");

    level.layer(LayerId::Terrain).fill(stone);

    // Outer curtain wall
    const TileId wall = tile("castle_wall");
    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            if (x < t || y < t || x >= width - t || y >= height - t) {
                place_blocking(level, {x, y}, wall);
            }
        }
    }

    const TileId tower = tile("castle_tower");
    for (const auto& rect : towers_) {
        rect.for_each_cell([&](TilePos pos) { place_blocking(level, pos, tower); });
    }

    // Keep: solid perimeter around an open hall
    const TileId keep_wall = tile("castle_keep");
    const TileId keep_floor = tile("castle_keep_floor");
    const geometry::Rect hall = shrink(keep_);
    keep_.for_each_cell([&](TilePos pos) {
        if (hall.contains(pos)) {
            clear_to_floor(level, pos, keep_floor);
        } else {
            place_blocking(level, pos, keep_wall);
        }
    });

    auto paint_on_stone = [&](const geometry::Rect& rect, TileId floor) {
        rect.for_each_cell([&](TilePos pos) {
            if (level.tile(LayerId::Terrain, pos) == stone) {
                paint_floor(level, pos, floor);
            }
        });
    };

    const TileId cobblestone = tile("castle_cobblestone");
    for (const auto& courtyard : courtyards_) {
        paint_on_stone(courtyard.rect, cobblestone);
    }
    const TileId section_floor = tile("castle_section_floor");
    for (const auto& section : sections_) {
        paint_on_stone(section.rect, section_floor);
    }

    const TileId mossy = tile("castle_stone_mossy");
    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            if (level.tile(LayerId::Terrain, {x, y}) == stone && ctx.rng.chance(MOSS_CHANCE)) {
                level.set_tile(LayerId::Terrain, {x, y}, mossy);
            }
        }
    }
}

void CastleSynthesizer::structures(SynthesisContext& ctx) {
    Level& level = ctx.level;

    // Tower doors face the castle interior
    const TileId door = tile("castle_door");
    const TileId stone = tile("castle_stone");
    for (const auto& rect : towers_) {
        if (rect.empty()) {
            continue;
        }
        TilePos pos = tower_door_of(rect, level.dimensions.height);
        clear_to_floor(level, pos, stone);
        level.set_tile(LayerId::Interactive, pos, door);
    }

    if (!keep_.empty()) {
        TilePos pos = door_of(keep_);
        clear_to_floor(level, pos, tile("castle_keep_floor"));
        level.set_tile(LayerId::Interactive, pos, tile("castle_main_door"));
    }

    const TileId section_floor = tile("castle_section_floor");
    for (const auto& section : sections_) {
        for (const auto& furnishing : FURNISHINGS) {
            if (section.type != furnishing.section_type || section.rect.empty()) {
                continue;
            }
            const TileId furniture = tile(furnishing.tile);
            int32_t count = ctx.rng.range(furnishing.min_count, furnishing.max_count);
            for (int32_t i = 0; i < count; ++i) {
                TilePos pos = section.rect.random_cell(ctx.rng);
                if (level.tile(LayerId::Terrain, pos) == section_floor) {
                    place_blocking(level, pos, furniture);
                }
            }
        }
    }

    const TileId cobblestone = tile("castle_cobblestone");
    int32_t decoration_count = ctx.rng.range(4, 9);
    for (int32_t i = 0; i < decoration_count; ++i) {
        auto result = place(ctx, [&](TilePos pos) {
            return level.tile(LayerId::Structures, pos) != TILE_NONE ||
                   level.tile(LayerId::Terrain, pos) != cobblestone;
        });
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            place_structure(level, placed->pos, tile(ctx.rng.pick(DECORATION_TYPES)));
        }
    }
}

void CastleSynthesizer::interactive(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId chest = tile("treasure_chest");

    const geometry::Rect hall = shrink(keep_);
    if (!hall.empty() && ctx.rng.chance(0.7)) {
        TilePos pos = hall.random_cell(ctx.rng);
        if (level.is_walkable(pos)) {
            level.set_tile(LayerId::Interactive, pos, chest);
        }
    }

    for (const auto& section : sections_) {
        if (section.rect.empty() || !ctx.rng.chance(0.2)) {
            continue;
        }
        TilePos pos = section.rect.random_cell(ctx.rng);
        if (level.is_walkable(pos)) {
            level.set_tile(LayerId::Interactive, pos, chest);
        }
    }
}

void CastleSynthesizer::lighting(SynthesisContext& ctx) {
    Level& level = ctx.level;

    const TileId wall = tile("castle_wall");
    const TileId wall_torch = tile("wall_torch");
    int32_t torch_count = ctx.rng.range(6, 13);
    for (int32_t i = 0; i < torch_count; ++i) {
        auto result = place(ctx, [&](TilePos pos) { return level.tile(LayerId::Structures, pos) != wall; });
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            level.set_tile(LayerId::Lighting, placed->pos, wall_torch);
        }
    }

    const TileId tower_light = tile("tower_light");
    for (const auto& rect : towers_) {
        if (!rect.empty()) {
            level.set_tile(LayerId::Lighting, tower_door_of(rect, level.dimensions.height), tower_light);
        }
    }

    const TileId lantern = tile("courtyard_lantern");
    for (const auto& courtyard : courtyards_) {
        if (courtyard.rect.empty()) {
            continue;
        }
        int32_t lantern_count = ctx.rng.range(1, 3);
        for (int32_t i = 0; i < lantern_count; ++i) {
            level.set_tile(LayerId::Lighting, courtyard.rect.random_cell(ctx.rng), lantern);
        }
    }

    const TileId interior = tile("interior_light");
    for (const auto& section : sections_) {
        if (section.rect.empty() || !ctx.rng.chance(0.6)) {
            continue;
        }
        level.set_tile(LayerId::Lighting, section.rect.random_cell(ctx.rng), interior);
    }
}

void CastleSynthesizer::entities(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId cobblestone = tile("castle_cobblestone");
    auto outside_courtyard = [&](TilePos pos) {
        return level.tile(LayerId::Terrain, pos) != cobblestone || level.tile(LayerId::Structures, pos) != TILE_NONE;
    };

    int32_t guard_count = ctx.rng.range(4, 9);
    for (int32_t i = 0; i < guard_count; ++i) {
        auto result = place(ctx, outside_courtyard);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            add_enemy(level, fmt::format("castle_guard_{}", i), "castle_guard", placed->pos, ctx.config.difficulty);
        }
    }

    int32_t servant_count = ctx.rng.range(2, 5);
    for (int32_t i = 0; i < servant_count; ++i) {
        auto result = place(ctx, outside_courtyard);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            add_npc(level, fmt::format("castle_servant_{}", i), "castle_servant", placed->pos,
                    ctx.rng.pick(SERVANT_DIALOGUE));
        }
    }

    // Hard castles always hold their lord; otherwise the keep is occupied 30% of the time
    bool spawn_boss = ctx.config.difficulty == "hard" || ctx.rng.chance(0.3);
    if (spawn_boss && !keep_.empty()) {
        TilePos center = keep_.center();
        if (level.is_walkable(center)) {
            add_enemy(level, "castle_boss", "castle_lord", center, "boss");
        } else {
            LEVELFORGE_LOG_DEBUG(core::log_category::GENERATION, "Keep center ({}, {}) is blocked, no boss placed",
                                 center.x, center.y);
        }
    }

    std::optional<TilePos> entry;
    if (!courtyards_.empty()) {
        entry = courtyards_.front().rect.center();
    }
    // Exit just inside the main door so the door keeps its own tag
    std::optional<TilePos> exit;
    if (!keep_.empty()) {
        exit = door_of(keep_) - TilePos{0, 1};
    }
    mark_entry_exit(level, entry, exit);
}

std::map<std::string, size_t> CastleSynthesizer::region_summary() const {
    return {{"tower", towers_.size()},
            {"keep", keep_.empty() ? size_t{0} : size_t{1}},
            {"courtyard", courtyards_.size()},
            {"section", sections_.size()}};
}

}  // namespace levelforge::gen
