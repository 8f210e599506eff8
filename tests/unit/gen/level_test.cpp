// LevelForge Generation Tests
// level_test.cpp - Level model queries

#include <gtest/gtest.h>

#include <levelforge/gen/level.hpp>
#include <levelforge/gen/tile.hpp>

namespace levelforge::gen {
namespace {

class LevelTest : public ::testing::Test {
protected:
    Level level_;
    TileId floor_ = TILE_NONE;
    TileId wall_ = TILE_NONE;
    TileId flowers_ = TILE_NONE;

    void SetUp() override {
        const auto& registry = TileRegistry::instance();
        floor_ = *registry.find_id("dungeon_floor");
        wall_ = *registry.find_id("dungeon_wall");
        flowers_ = *registry.find_id("flowers");

        level_.dimensions = Dimensions{8, 6, 32};
        for (auto& layer : level_.layers) {
            layer = TileLayer(8, 6, TILE_NONE);
        }
    }
};

TEST_F(LevelTest, OutOfBoundsReadsAsUnassigned) {
    EXPECT_EQ(level_.tile(LayerId::Terrain, {-1, 0}), TILE_NONE);
    EXPECT_EQ(level_.tile(LayerId::Terrain, {8, 0}), TILE_NONE);
    EXPECT_FALSE(level_.in_bounds({0, 6}));
    EXPECT_TRUE(level_.in_bounds({7, 5}));
}

TEST_F(LevelTest, SetTileIgnoresOutOfBounds) {
    level_.set_tile(LayerId::Terrain, {20, 20}, floor_);
    level_.set_tile(LayerId::Terrain, {2, 3}, floor_);
    EXPECT_EQ(level_.tile(LayerId::Terrain, {2, 3}), floor_);
    EXPECT_EQ(level_.count_walkable(), 1u);
}

// Test: Walkability needs walkable terrain and no blocking structure
TEST_F(LevelTest, WalkabilityRules) {
    TilePos pos{4, 2};
    EXPECT_FALSE(level_.is_walkable(pos));

    level_.set_tile(LayerId::Terrain, pos, floor_);
    EXPECT_TRUE(level_.is_walkable(pos));

    level_.set_tile(LayerId::Structures, pos, flowers_);
    EXPECT_TRUE(level_.is_walkable(pos));
    EXPECT_FALSE(level_.is_blocked(pos));

    level_.set_tile(LayerId::Structures, pos, wall_);
    EXPECT_FALSE(level_.is_walkable(pos));
    EXPECT_TRUE(level_.is_blocked(pos));
}

TEST_F(LevelTest, EntityCounts) {
    Entity goblin;
    goblin.id = "enemy_room_0_0";
    goblin.kind = EntityKind::Enemy;
    Entity merchant;
    merchant.id = "npc_room_0";
    merchant.kind = EntityKind::Npc;

    level_.entities = {goblin, goblin, merchant};
    EXPECT_EQ(level_.count_enemies(), 2u);
    EXPECT_EQ(level_.count_npcs(), 1u);
    EXPECT_STREQ(entity_kind_to_string(EntityKind::Npc), "npc");
    EXPECT_STREQ(entity_kind_to_string(EntityKind::Enemy), "enemy");
}

TEST_F(LevelTest, ConfigBiomeResolution) {
    LevelConfig config;
    EXPECT_EQ(config.biome(), BiomeType::Dungeon);
    config.biome_name = "castle";
    EXPECT_EQ(config.biome(), BiomeType::Castle);
    config.biome_name = "swamp";
    EXPECT_EQ(config.biome(), BiomeType::Dungeon);
}

}  // namespace
}  // namespace levelforge::gen
