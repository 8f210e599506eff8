// LevelForge Generation
// town_synthesizer.cpp - District and street town pipeline

#include <levelforge/gen/synthesizers.hpp>
#include <levelforge/gen/tile.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <fmt/format.h>

namespace levelforge::gen {

namespace {

constexpr std::array<const char*, 4> DISTRICT_TYPES = {"residential", "commercial", "market", "noble"};
constexpr std::array<const char*, 6> BUILDING_TYPES = {"house", "shop", "tavern", "inn", "blacksmith", "temple"};
constexpr std::array<const char*, 5> STRUCTURE_TYPES = {"town_well", "town_statue", "town_fountain", "town_cart",
                                                        "town_bench"};
constexpr std::array<const char*, 4> LIGHT_TYPES = {"street_lantern", "building_light", "torch", "candle"};
constexpr std::array<const char*, 5> TOWNSFOLK_DIALOGUE = {"Beautiful day, isn't it?", "Watch your step!",
                                                           "Have you seen the market?",
                                                           "The guards are extra vigilant today.",
                                                           "Welcome to our town!"};

// Door cell on one of the four sides (0 = top, 1 = right, 2 = bottom, 3 = left)
TilePos door_position(const geometry::Rect& rect, int32_t side) {
    switch (side) {
        case 0:
            return {rect.x + rect.width / 2, rect.y};
        case 1:
            return {rect.x + rect.width - 1, rect.y + rect.height / 2};
        case 2:
            return {rect.x + rect.width / 2, rect.y + rect.height - 1};
        default:
            return {rect.x, rect.y + rect.height / 2};
    }
}

int32_t round_half_up(double value) {
    return static_cast<int32_t>(std::floor(value + 0.5));
}

}  // namespace

void TownSynthesizer::layout(SynthesisContext& ctx) {
    const int32_t width = ctx.level.dimensions.width;
    const int32_t height = ctx.level.dimensions.height;
    const geometry::Rect map = bounds(ctx.level);

    districts_.clear();
    buildings_.clear();
    streets_.clear();

    int32_t district_count = ctx.rng.range(2, 4);
    for (int32_t i = 0; i < district_count; ++i) {
        geometry::Rect rect;
        rect.x = ctx.rng.below(std::max(1, width - 10)) + 5;
        rect.y = ctx.rng.below(std::max(1, height - 8)) + 4;
        rect.width = ctx.rng.range(6, 13);
        rect.height = ctx.rng.range(5, 10);
        districts_.push_back(TypedRegion{fmt::format("district_{}", i), rect.clipped(map), ctx.rng.pick(DISTRICT_TYPES)});
    }

    for (const auto& district : districts_) {
        int32_t building_count = ctx.rng.range(3, 6);
        for (int32_t i = 0; i < building_count; ++i) {
            geometry::Rect rect;
            rect.x = district.rect.x + ctx.rng.below(std::max(1, district.rect.width - 3)) + 1;
            rect.y = district.rect.y + ctx.rng.below(std::max(1, district.rect.height - 3)) + 1;
            rect.width = ctx.rng.range(2, 3);
            rect.height = ctx.rng.range(2, 3);
            buildings_.push_back(TypedRegion{fmt::format("building_{}_{}", district.id, i), rect.clipped(map),
                                             ctx.rng.pick(BUILDING_TYPES)});
        }
    }

    const int32_t street_width = std::max(1, ctx.settings.street_width);
    for (size_t i = 0; i + 1 < districts_.size(); ++i) {
        streets_.push_back(Connector{districts_[i].rect.center(), districts_[i + 1].rect.center(), street_width});
    }
}

void TownSynthesizer::terrain(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId street = tile("town_street");

    level.layer(LayerId::Terrain).fill(tile("town_dirt"));

    for (const auto& connector : streets_) {
        for (const auto& pos : geometry::rasterize_line(connector.start, connector.end, connector.width)) {
            paint_floor(level, pos, street);
        }
    }
}

void TownSynthesizer::structures(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId building_tile = tile("town_building");
    const TileId door = tile("town_door");
    const TileId window = tile("town_window");
    const TileId street = tile("town_street");

    // Streets run through buildings rather than the other way around
    auto on_street = [&](TilePos pos) { return level.tile(LayerId::Terrain, pos) == street; };

    for (const auto& building : buildings_) {
        if (building.rect.empty()) {
            continue;
        }
        building.rect.for_each_cell([&](TilePos pos) {
            if (!on_street(pos)) {
                place_blocking(level, pos, building_tile);
            }
        });

        TilePos door_pos = door_position(building.rect, ctx.rng.below(4));
        level.set_tile(LayerId::Interactive, door_pos, door);

        int32_t window_count = ctx.rng.range(1, 3);
        for (int32_t i = 0; i < window_count; ++i) {
            TilePos window_pos = building.rect.random_cell(ctx.rng);
            for (int32_t attempt = 1; attempt < 10 && window_pos == door_pos; ++attempt) {
                window_pos = building.rect.random_cell(ctx.rng);
            }
            if (!on_street(window_pos)) {
                place_blocking(level, window_pos, window);
            }
        }
    }

    const TileId dirt = tile("town_dirt");
    int32_t structure_count = ctx.rng.range(3, 7);
    for (int32_t i = 0; i < structure_count; ++i) {
        auto result = place(ctx, [&](TilePos pos) {
            return level.tile(LayerId::Terrain, pos) != dirt || level.tile(LayerId::Structures, pos) != TILE_NONE;
        });
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            place_structure(level, placed->pos, tile(ctx.rng.pick(STRUCTURE_TYPES)));
        }
    }

    const TileId stall = tile("market_stall");
    for (const auto& district : districts_) {
        if (district.rect.empty() || !ctx.rng.chance(0.4)) {
            continue;
        }
        TilePos pos = district.rect.random_cell(ctx.rng);
        if (level.tile(LayerId::Structures, pos) == TILE_NONE && !on_street(pos)) {
            place_blocking(level, pos, stall);
        }
    }
}

void TownSynthesizer::interactive(SynthesisContext& ctx) {
    const TileId chest = tile("treasure_chest");
    for (const auto& district : districts_) {
        if (district.rect.empty() || !ctx.rng.chance(0.15)) {
            continue;
        }
        TilePos pos = district.rect.random_cell(ctx.rng);
        if (ctx.level.tile(LayerId::Interactive, pos) == TILE_NONE) {
            ctx.level.set_tile(LayerId::Interactive, pos, chest);
        }
    }
}

void TownSynthesizer::lighting(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId lantern = tile("street_lantern");

    // Lanterns spaced along each street, jittered one tile off the centerline
    for (const auto& street : streets_) {
        int32_t lantern_count = ctx.rng.range(2, 5);
        for (int32_t i = 0; i < lantern_count; ++i) {
            double t = static_cast<double>(i) / static_cast<double>(lantern_count);
            int32_t x = round_half_up(street.start.x + (street.end.x - street.start.x) * t);
            int32_t y = round_half_up(street.start.y + (street.end.y - street.start.y) * t);
            int32_t offset_x = ctx.rng.below(3) - 1;
            int32_t offset_y = ctx.rng.below(3) - 1;
            level.set_tile(LayerId::Lighting, {x + offset_x, y + offset_y}, lantern);
        }
    }

    int32_t extra_count = ctx.rng.range(6, 13);
    for (int32_t i = 0; i < extra_count; ++i) {
        auto result = place(ctx, [&](TilePos pos) { return level.tile(LayerId::Lighting, pos) != TILE_NONE; });
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            level.set_tile(LayerId::Lighting, placed->pos, tile(ctx.rng.pick(LIGHT_TYPES)));
        }
    }
}

void TownSynthesizer::entities(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId street = tile("town_street");
    auto off_street = [&](TilePos pos) {
        return level.tile(LayerId::Terrain, pos) != street || level.tile(LayerId::Structures, pos) != TILE_NONE;
    };

    int32_t guard_count = ctx.rng.range(2, 5);
    for (int32_t i = 0; i < guard_count; ++i) {
        auto result = place(ctx, off_street);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            add_npc(level, fmt::format("town_guard_{}", i), "town_guard", placed->pos, "Stay out of trouble, citizen.");
        }
    }

    for (const auto& district : districts_) {
        if (district.rect.empty() || !ctx.rng.chance(0.3)) {
            continue;
        }
        TilePos pos = district.rect.random_cell(ctx.rng);
        if (level.is_walkable(pos)) {
            add_npc(level, fmt::format("town_merchant_{}", district.id), "merchant", pos, "Welcome to my shop!");
        }
    }

    int32_t townsfolk_count = ctx.rng.range(4, 9);
    for (int32_t i = 0; i < townsfolk_count; ++i) {
        auto result = place(ctx, off_street);
        if (auto* placed = std::get_if<geometry::Placed>(&result)) {
            add_npc(level, fmt::format("townsfolk_{}", i), "townsfolk", placed->pos,
                    ctx.rng.pick(TOWNSFOLK_DIALOGUE));
        }
    }

    if (!districts_.empty()) {
        mark_entry_exit(level, districts_.front().rect.center(), districts_.back().rect.center());
    }
}

std::map<std::string, size_t> TownSynthesizer::region_summary() const {
    return {{"district", districts_.size()}, {"building", buildings_.size()}, {"street", streets_.size()}};
}

}  // namespace levelforge::gen
