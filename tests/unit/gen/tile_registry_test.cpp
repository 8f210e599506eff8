// LevelForge Generation Tests
// tile_registry_test.cpp - Tile vocabulary and flag lookups

#include <gtest/gtest.h>

#include <levelforge/gen/tile.hpp>

#include <set>
#include <string>

namespace levelforge::gen {
namespace {

class TileRegistryTest : public ::testing::Test {
protected:
    const TileRegistry& registry_ = TileRegistry::instance();
};

TEST_F(TileRegistryTest, NoneIsUnregistered) {
    EXPECT_EQ(registry_.get(TILE_NONE), nullptr);
    EXPECT_TRUE(registry_.name_of(TILE_NONE).empty());
    EXPECT_FALSE(registry_.is_walkable(TILE_NONE));
    EXPECT_FALSE(registry_.is_blocking(TILE_NONE));
}

TEST_F(TileRegistryTest, LookupByName) {
    auto id = registry_.find_id("dungeon_floor");
    ASSERT_TRUE(id.has_value());
    EXPECT_NE(*id, TILE_NONE);
    EXPECT_EQ(registry_.name_of(*id), "dungeon_floor");

    const TileType* type = registry_.get("dungeon_floor");
    ASSERT_NE(type, nullptr);
    EXPECT_EQ(type->get_id(), *id);
    EXPECT_EQ(type->get_layer(), LayerId::Terrain);
}

TEST_F(TileRegistryTest, UnknownNames) {
    EXPECT_FALSE(registry_.find_id("lava_floor").has_value());
    EXPECT_EQ(registry_.get("lava_floor"), nullptr);
    EXPECT_EQ(registry_.get(TILE_INVALID), nullptr);
}

// Test: Flags of representative tags in each layer
TEST_F(TileRegistryTest, FlagsPerLayer) {
    EXPECT_TRUE(registry_.get("cave_floor")->is_walkable());
    EXPECT_TRUE(registry_.get("cave_water")->is_liquid());
    EXPECT_TRUE(registry_.get("dungeon_wall")->is_blocking());
    EXPECT_TRUE(registry_.get("oak_tree")->is_blocking());
    EXPECT_FALSE(registry_.get("flowers")->is_blocking());
    EXPECT_TRUE(registry_.get("treasure_chest")->is_treasure());
    EXPECT_TRUE(registry_.get("castle_main_door")->is_door());
    EXPECT_TRUE(registry_.get("level_entrance")->is_marker());
    EXPECT_TRUE(registry_.get("torch")->is_emissive());
    EXPECT_EQ(registry_.get("forest_mist")->get_layer(), LayerId::Effects);
    EXPECT_EQ(registry_.get("castle_foundation")->get_layer(), LayerId::Background);
}

TEST_F(TileRegistryTest, NoTagIsBothWalkableAndBlocking) {
    registry_.for_each([](const TileType& type) {
        EXPECT_FALSE(type.is_walkable() && type.is_blocking()) << type.get_name();
    });
}

TEST_F(TileRegistryTest, NamesAreUniqueAndIdsDense) {
    std::set<std::string> names;
    size_t visited = 0;
    registry_.for_each([&](const TileType& type) {
        names.insert(type.get_name());
        EXPECT_EQ(registry_.get(type.get_id()), &type);
        ++visited;
    });
    EXPECT_EQ(visited, registry_.count());
    EXPECT_EQ(names.size(), registry_.count());
    EXPECT_GT(registry_.count(), 90u);
}

}  // namespace
}  // namespace levelforge::gen
