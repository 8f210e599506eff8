// LevelForge Generation
// dungeon_synthesizer.cpp - Room and corridor dungeon pipeline

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/synthesizers.hpp>
#include <levelforge/gen/tile.hpp>

#include <algorithm>
#include <array>
#include <fmt/format.h>

namespace levelforge::gen {

namespace {

constexpr int32_t MIN_ROOMS = 5;
constexpr int32_t MAX_ROOMS = 11;

constexpr std::array<const char*, 5> ROOM_TYPES = {"normal", "treasure", "boss", "puzzle", "rest"};
constexpr std::array<const char*, 5> ENEMY_TYPES = {"goblin", "skeleton", "orc", "spider", "rat"};
constexpr std::array<const char*, 4> NPC_TYPES = {"merchant", "quest_giver", "guard", "prisoner"};
constexpr std::array<const char*, 4> INTERACTIVE_ELEMENTS = {"lever", "switch", "rune", "portal"};
constexpr std::array<const char*, 5> NPC_DIALOGUE = {
    "Beware of the traps ahead!", "I have information about the treasure... for a price.",
    "The boss is stronger than you think.", "Take this key, it might help you.", "I was imprisoned here for years..."};

// Interior cell of a room (one tile in from the top-left), kept inside the rect
TilePos room_interior_cell(Rng& rng, const geometry::Rect& room) {
    int32_t x = room.x + 1 + rng.below(room.width - 2);
    int32_t y = room.y + 1 + rng.below(room.height - 2);
    return {std::min(x, room.x + room.width - 1), std::min(y, room.y + room.height - 1)};
}

}  // namespace

void DungeonSynthesizer::layout(SynthesisContext& ctx) {
    const int32_t width = ctx.level.dimensions.width;
    const int32_t height = ctx.level.dimensions.height;
    // Floors stay off the border ring so every wall lands in bounds
    const geometry::Rect interior{1, 1, width - 2, height - 2};

    int32_t room_count = ctx.rng.range(MIN_ROOMS, MAX_ROOMS);
    rooms_.clear();
    rooms_.reserve(static_cast<size_t>(room_count));

    for (int32_t i = 0; i < room_count; ++i) {
        geometry::Rect rect;
        rect.x = ctx.rng.below(std::max(1, width - 8)) + 4;
        rect.y = ctx.rng.below(std::max(1, height - 6)) + 3;
        rect.width = 4 + ctx.rng.below(6);
        rect.height = 3 + ctx.rng.below(4);
        rooms_.push_back(TypedRegion{fmt::format("room_{}", i), rect.clipped(interior), ctx.rng.pick(ROOM_TYPES)});
    }

    corridors_.clear();
    for (size_t i = 0; i + 1 < rooms_.size(); ++i) {
        Connector corridor;
        corridor.start = rooms_[i].rect.center();
        corridor.end = rooms_[i + 1].rect.center();
        corridor.width = 1 + ctx.rng.below(2);
        corridors_.push_back(corridor);
    }
}

void DungeonSynthesizer::terrain(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const geometry::Rect interior{1, 1, level.dimensions.width - 2, level.dimensions.height - 2};
    const TileId floor = tile("dungeon_floor");

    auto paint = [&](TilePos pos) {
        if (interior.contains(pos)) {
            paint_floor(level, pos, floor);
        }
    };

    for (const auto& room : rooms_) {
        room.rect.for_each_cell(paint);
    }

    // Horizontal leg along the start row, then vertical leg along the end column
    for (const auto& corridor : corridors_) {
        TilePos bend{corridor.end.x, corridor.start.y};
        for (const auto& pos : geometry::rasterize_line(corridor.start, bend, corridor.width)) {
            paint(pos);
        }
        for (const auto& pos : geometry::rasterize_line(bend, corridor.end, corridor.width)) {
            paint(pos);
        }
    }

    infer_walls(level, tile("dungeon_wall"));
}

void DungeonSynthesizer::structures(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId door = tile("dungeon_door");
    const TileId torch = tile("torch");
    const TileId chest = tile("treasure_chest");

    for (const auto& room : rooms_) {
        if (room.rect.empty()) {
            continue;
        }
        const auto& rect = room.rect;

        if (ctx.rng.chance(0.7)) {
            level.set_tile(LayerId::Interactive, {rect.x + rect.width / 2, rect.y}, door);
        }

        int32_t torch_count = ctx.rng.range(1, 3);
        for (int32_t i = 0; i < torch_count; ++i) {
            level.set_tile(LayerId::Lighting, room_interior_cell(ctx.rng, rect), torch);
        }

        if (ctx.rng.chance(0.4)) {
            level.set_tile(LayerId::Interactive, room_interior_cell(ctx.rng, rect), chest);
        }
    }
}

void DungeonSynthesizer::interactive(SynthesisContext& ctx) {
    for (const auto& room : rooms_) {
        if (room.rect.empty() || !ctx.rng.chance(0.3)) {
            continue;
        }
        TileId element = tile(ctx.rng.pick(INTERACTIVE_ELEMENTS));
        ctx.level.set_tile(LayerId::Interactive, room_interior_cell(ctx.rng, room.rect), element);
    }
}

void DungeonSynthesizer::lighting(SynthesisContext& ctx) {
    Level& level = ctx.level;
    const TileId floor = tile("dungeon_floor");
    const TileId ambient = tile("ambient_dark");

    for (int32_t y = 0; y < level.dimensions.height; ++y) {
        for (int32_t x = 0; x < level.dimensions.width; ++x) {
            if (level.tile(LayerId::Terrain, {x, y}) == floor) {
                level.set_tile(LayerId::Effects, {x, y}, ambient);
            }
        }
    }
}

void DungeonSynthesizer::entities(SynthesisContext& ctx) {
    Level& level = ctx.level;

    for (const auto& room : rooms_) {
        if (room.rect.empty()) {
            continue;
        }

        int32_t enemy_count = ctx.rng.below(4);
        for (int32_t i = 0; i < enemy_count; ++i) {
            TilePos pos = room_interior_cell(ctx.rng, room.rect);
            std::string subtype = ctx.rng.pick(ENEMY_TYPES);
            if (level.is_walkable(pos)) {
                add_enemy(level, fmt::format("enemy_{}_{}", room.id, i), std::move(subtype), pos, ctx.config.difficulty);
            }
        }

        if (ctx.rng.chance(0.1)) {
            TilePos pos = room_interior_cell(ctx.rng, room.rect);
            std::string subtype = ctx.rng.pick(NPC_TYPES);
            std::string dialogue = ctx.rng.pick(NPC_DIALOGUE);
            if (level.is_walkable(pos)) {
                add_npc(level, fmt::format("npc_{}", room.id), std::move(subtype), pos, std::move(dialogue));
            }
        }
    }

    if (!rooms_.empty()) {
        mark_entry_exit(level, rooms_.front().rect.center(), rooms_.back().rect.center());
    }
}

std::map<std::string, size_t> DungeonSynthesizer::region_summary() const {
    return {{"room", rooms_.size()}, {"corridor", corridors_.size()}};
}

}  // namespace levelforge::gen
