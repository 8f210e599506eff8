// LevelForge Generation Tests
// serialization_test.cpp - JSON shape of levels, configs and reports

#include <gtest/gtest.h>

#include <levelforge/gen/serialization.hpp>
#include <levelforge/gen/tile.hpp>

namespace levelforge::gen {
namespace {

using json = nlohmann::json;

class SerializationTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto& registry = TileRegistry::instance();

        level_.id = "0f8fad5b-d9cb-469f-a165-70867728950e";
        level_.name = "Shadowed Halls";
        level_.biome = BiomeType::Cave;
        level_.theme = "medieval";
        level_.difficulty = "hard";
        level_.dimensions = Dimensions{3, 2, 16};
        for (auto& layer : level_.layers) {
            layer = TileLayer(3, 2, TILE_NONE);
        }
        level_.set_tile(LayerId::Terrain, {0, 0}, *registry.find_id("cave_floor"));
        level_.set_tile(LayerId::Terrain, {1, 0}, *registry.find_id("cave_water"));
        level_.set_tile(LayerId::Structures, {2, 1}, *registry.find_id("cave_wall"));
        level_.set_tile(LayerId::Lighting, {0, 0}, *registry.find_id("crystal_light"));

        Entity bat;
        bat.id = "cave_enemy_0";
        bat.kind = EntityKind::Enemy;
        bat.subtype = "bat";
        bat.position = {0, 0};
        bat.difficulty_level = "hard";
        level_.entities.push_back(bat);

        Entity hermit;
        hermit.id = "cave_hermit";
        hermit.kind = EntityKind::Npc;
        hermit.subtype = "cave_hermit";
        hermit.position = {1, 0};
        hermit.dialogue = "These caves hold many secrets...";
        level_.entities.push_back(hermit);

        level_.metadata.generated_at = "2024-03-09T14:05:00.250Z";
        level_.metadata.seed = 7;
        level_.metadata.objectives = {"Find the exit"};
        level_.metadata.description = "A vast cavern system with untold secrets.";
        level_.metadata.start_point = TilePos{0, 0};
    }

    Level level_;
};

// ============================================================================
// Level
// ============================================================================

TEST_F(SerializationTest, LevelTopLevelShape) {
    json data = level_to_json(level_);

    EXPECT_EQ(data["id"], level_.id);
    EXPECT_EQ(data["name"], "Shadowed Halls");
    EXPECT_EQ(data["biomeType"], "cave");
    EXPECT_EQ(data["difficulty"], "hard");
    EXPECT_EQ(data["dimensions"]["width"], 3);
    EXPECT_EQ(data["dimensions"]["height"], 2);
    EXPECT_EQ(data["dimensions"]["tileSize"], 16);

    for (const char* name : {"background", "terrain", "structures", "interactive", "lighting", "effects"}) {
        ASSERT_TRUE(data["layers"].contains(name)) << name;
        EXPECT_EQ(data["layers"][name].size(), 2u);
        EXPECT_EQ(data["layers"][name][0].size(), 3u);
    }
}

TEST_F(SerializationTest, LayersUseTagsAndNull) {
    json data = level_to_json(level_);
    const json& terrain = data["layers"]["terrain"];

    EXPECT_EQ(terrain[0][0], "cave_floor");
    EXPECT_EQ(terrain[0][1], "cave_water");
    EXPECT_TRUE(terrain[0][2].is_null());
    EXPECT_EQ(data["layers"]["structures"][1][2], "cave_wall");
}

TEST_F(SerializationTest, EntitiesCarryKindSpecificFields) {
    json data = level_to_json(level_);
    ASSERT_EQ(data["entities"].size(), 2u);

    const json& enemy = data["entities"][0];
    EXPECT_EQ(enemy["type"], "enemy");
    EXPECT_EQ(enemy["enemyType"], "bat");
    EXPECT_EQ(enemy["difficultyLevel"], "hard");
    EXPECT_EQ(enemy["position"]["x"], 0);
    EXPECT_FALSE(enemy.contains("dialogue"));

    const json& npc = data["entities"][1];
    EXPECT_EQ(npc["type"], "npc");
    EXPECT_EQ(npc["npcType"], "cave_hermit");
    EXPECT_EQ(npc["dialogue"], "These caves hold many secrets...");
    EXPECT_FALSE(npc.contains("enemyType"));
}

TEST_F(SerializationTest, MetadataPointsNullWhenAbsent) {
    json data = level_to_json(level_);
    const json& metadata = data["metadata"];

    EXPECT_EQ(metadata["seed"], 7);
    EXPECT_EQ(metadata["version"], "1.0");
    EXPECT_EQ(metadata["startPoint"]["x"], 0);
    EXPECT_TRUE(metadata["endPoint"].is_null());
}

TEST_F(SerializationTest, LevelRoundTrips) {
    auto restored = level_from_json(level_to_json(level_));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, level_);
}

TEST_F(SerializationTest, LevelRejectsUnknownTag) {
    json data = level_to_json(level_);
    data["layers"]["terrain"][0][0] = "lava_moat";
    EXPECT_FALSE(level_from_json(data).has_value());
}

TEST_F(SerializationTest, LevelRejectsBadShape) {
    json data = level_to_json(level_);
    data["layers"]["effects"].erase(std::size_t{1});
    EXPECT_FALSE(level_from_json(data).has_value());

    json narrow = level_to_json(level_);
    narrow["layers"]["lighting"][0].erase(std::size_t{0});
    EXPECT_FALSE(level_from_json(narrow).has_value());
}

TEST_F(SerializationTest, LevelRejectsUnknownBiomeAndMissingFields) {
    json data = level_to_json(level_);
    data["biomeType"] = "swamp";
    EXPECT_FALSE(level_from_json(data).has_value());

    json missing = level_to_json(level_);
    missing.erase("dimensions");
    EXPECT_FALSE(level_from_json(missing).has_value());

    EXPECT_FALSE(level_from_json(json::array()).has_value());
}

// ============================================================================
// Level Config
// ============================================================================

TEST_F(SerializationTest, ConfigOmitsAbsentOptionals) {
    LevelConfig config;
    json data = level_config_to_json(config);
    EXPECT_EQ(data["width"], 32);
    EXPECT_EQ(data["biomeType"], "dungeon");
    EXPECT_FALSE(data.contains("seed"));
    EXPECT_FALSE(data.contains("name"));

    config.seed = 99;
    config.name = "Keep";
    data = level_config_to_json(config);
    EXPECT_EQ(data["seed"], 99);
    EXPECT_EQ(data["name"], "Keep");
}

TEST_F(SerializationTest, ConfigDefaultsForMissingFields) {
    auto config = level_config_from_json(json{{"width", 50}});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->width, 50);
    EXPECT_EQ(config->height, 24);
    EXPECT_EQ(config->biome_name, "dungeon");
    EXPECT_FALSE(config->seed.has_value());
}

TEST_F(SerializationTest, ConfigAcceptsLevelTypeAlias) {
    auto config = level_config_from_json(json{{"levelType", "forest"}, {"seed", 12}});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->biome(), BiomeType::Forest);
    EXPECT_EQ(config->seed, 12u);
}

TEST_F(SerializationTest, ConfigRejectsWrongTypes) {
    EXPECT_FALSE(level_config_from_json(json{{"width", "wide"}}).has_value());
    EXPECT_FALSE(level_config_from_json(json::array({1, 2})).has_value());
}

TEST_F(SerializationTest, ConfigRoundTrips) {
    LevelConfig config;
    config.width = 64;
    config.biome_name = "castle";
    config.difficulty = "easy";
    config.seed = 123456789012ULL;
    auto restored = level_config_from_json(level_config_to_json(config));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, config);
}

// ============================================================================
// Validation Report
// ============================================================================

TEST_F(SerializationTest, ReportShape) {
    ValidationReport report;
    report.has_start_point = true;
    report.is_connected = true;
    report.metrics.walkable_tiles = 120;
    report.issues.push_back(ValidationIssue{IssueSeverity::Major, "objectives", "Level has no end point"});
    report.warnings.push_back("Few entities: 2");
    report.score = 83;
    report.status = ValidationStatus::NeedsFixes;

    json data = validation_report_to_json(report);
    EXPECT_EQ(data["hasStartPoint"], true);
    EXPECT_EQ(data["hasEndPoint"], false);
    EXPECT_EQ(data["isConnected"], true);
    EXPECT_EQ(data["metrics"]["walkableTiles"], 120);
    EXPECT_TRUE(data["metrics"].contains("reachableFraction"));
    EXPECT_EQ(data["issues"][0]["severity"], "major");
    EXPECT_EQ(data["issues"][0]["category"], "objectives");
    EXPECT_EQ(data["warnings"][0], "Few entities: 2");
    EXPECT_EQ(data["score"], 83);
    EXPECT_EQ(data["status"], "needs_fixes");
}

}  // namespace
}  // namespace levelforge::gen
