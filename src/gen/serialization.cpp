// LevelForge Generation
// serialization.cpp - JSON mapping for levels, configs and validation reports

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/serialization.hpp>
#include <levelforge/gen/tile.hpp>

namespace levelforge::gen {

using json = nlohmann::json;

namespace {

json position_to_json(TilePos pos) {
    return json{{"x", pos.x}, {"y", pos.y}};
}

TilePos position_from_json(const json& data) {
    return TilePos{data.at("x").get<int32_t>(), data.at("y").get<int32_t>()};
}

json layer_to_json(const TileLayer& layer) {
    const auto& registry = TileRegistry::instance();
    json rows = json::array();
    for (int32_t y = 0; y < layer.height(); ++y) {
        json row = json::array();
        for (int32_t x = 0; x < layer.width(); ++x) {
            TileId id = layer.at({x, y});
            if (id == TILE_NONE) {
                row.push_back(nullptr);
            } else {
                row.push_back(std::string(registry.name_of(id)));
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

// Throws json::exception on shape or type errors; returns false on an unknown tag
bool layer_from_json(const json& rows, TileLayer& layer) {
    const auto& registry = TileRegistry::instance();
    if (!rows.is_array() || static_cast<int32_t>(rows.size()) != layer.height()) {
        LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Layer row count does not match level height");
        return false;
    }
    for (int32_t y = 0; y < layer.height(); ++y) {
        const json& row = rows[static_cast<size_t>(y)];
        if (!row.is_array() || static_cast<int32_t>(row.size()) != layer.width()) {
            LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Layer row {} does not match level width", y);
            return false;
        }
        for (int32_t x = 0; x < layer.width(); ++x) {
            const json& cell = row[static_cast<size_t>(x)];
            if (cell.is_null()) {
                continue;
            }
            auto name = cell.get<std::string>();
            auto id = registry.find_id(name);
            if (!id) {
                LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Unknown tile tag '{}' at ({}, {})", name, x, y);
                return false;
            }
            layer.at({x, y}) = *id;
        }
    }
    return true;
}

json entity_to_json(const Entity& entity) {
    json data{{"id", entity.id}, {"type", entity_kind_to_string(entity.kind)}, {"position", position_to_json(entity.position)}};
    if (entity.is_enemy()) {
        data["enemyType"] = entity.subtype;
        data["difficultyLevel"] = entity.difficulty_level;
    } else {
        data["npcType"] = entity.subtype;
        data["dialogue"] = entity.dialogue;
    }
    return data;
}

Entity entity_from_json(const json& data) {
    Entity entity;
    entity.id = data.at("id").get<std::string>();
    entity.position = position_from_json(data.at("position"));
    if (data.at("type").get<std::string>() == "npc") {
        entity.kind = EntityKind::Npc;
        entity.subtype = data.value("npcType", std::string{});
        entity.dialogue = data.value("dialogue", std::string{});
    } else {
        entity.kind = EntityKind::Enemy;
        entity.subtype = data.value("enemyType", std::string{});
        entity.difficulty_level = data.value("difficultyLevel", std::string{});
    }
    return entity;
}

}  // namespace

// ============================================================================
// Level
// ============================================================================

json level_to_json(const Level& level) {
    json layers = json::object();
    for (LayerId id : ALL_LAYERS) {
        layers[layer_id_to_string(id)] = layer_to_json(level.layer(id));
    }

    json entities = json::array();
    for (const auto& entity : level.entities) {
        entities.push_back(entity_to_json(entity));
    }

    json metadata{{"generatedAt", level.metadata.generated_at},
                  {"version", level.metadata.version},
                  {"seed", level.metadata.seed},
                  {"objectives", level.metadata.objectives},
                  {"description", level.metadata.description}};
    metadata["startPoint"] = level.metadata.start_point ? position_to_json(*level.metadata.start_point) : json(nullptr);
    metadata["endPoint"] = level.metadata.end_point ? position_to_json(*level.metadata.end_point) : json(nullptr);

    return json{{"id", level.id},
                {"name", level.name},
                {"biomeType", biome_type_to_string(level.biome)},
                {"theme", level.theme},
                {"difficulty", level.difficulty},
                {"dimensions",
                 {{"width", level.dimensions.width},
                  {"height", level.dimensions.height},
                  {"tileSize", level.dimensions.tile_size}}},
                {"layers", std::move(layers)},
                {"entities", std::move(entities)},
                {"metadata", std::move(metadata)}};
}

std::optional<Level> level_from_json(const json& data) {
    try {
        Level level;
        level.id = data.at("id").get<std::string>();
        level.name = data.at("name").get<std::string>();

        auto biome_name = data.at("biomeType").get<std::string>();
        if (!is_known_biome(biome_name)) {
            LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Unknown biome '{}' in level document", biome_name);
            return std::nullopt;
        }
        level.biome = biome_type_from_string(biome_name);
        level.theme = data.value("theme", std::string{});
        level.difficulty = data.value("difficulty", std::string{});

        const json& dims = data.at("dimensions");
        level.dimensions.width = dims.at("width").get<int32_t>();
        level.dimensions.height = dims.at("height").get<int32_t>();
        level.dimensions.tile_size = dims.at("tileSize").get<int32_t>();
        if (level.dimensions.width <= 0 || level.dimensions.height <= 0) {
            LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Level document has empty dimensions");
            return std::nullopt;
        }

        const json& layers = data.at("layers");
        for (LayerId id : ALL_LAYERS) {
            level.layer(id) = TileLayer(level.dimensions.width, level.dimensions.height, TILE_NONE);
            if (!layer_from_json(layers.at(layer_id_to_string(id)), level.layer(id))) {
                return std::nullopt;
            }
        }

        for (const auto& entry : data.at("entities")) {
            level.entities.push_back(entity_from_json(entry));
        }

        const json& metadata = data.at("metadata");
        level.metadata.generated_at = metadata.value("generatedAt", std::string{});
        level.metadata.version = metadata.value("version", std::string{"1.0"});
        level.metadata.seed = metadata.value("seed", uint64_t{0});
        level.metadata.objectives = metadata.value("objectives", std::vector<std::string>{});
        level.metadata.description = metadata.value("description", std::string{});
        if (auto it = metadata.find("startPoint"); it != metadata.end() && !it->is_null()) {
            level.metadata.start_point = position_from_json(*it);
        }
        if (auto it = metadata.find("endPoint"); it != metadata.end() && !it->is_null()) {
            level.metadata.end_point = position_from_json(*it);
        }
        return level;
    } catch (const json::exception& e) {
        LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Malformed level document: {}", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Level Config
// ============================================================================

json level_config_to_json(const LevelConfig& config) {
    json data{{"width", config.width},
              {"height", config.height},
              {"tileSize", config.tile_size},
              {"biomeType", config.biome_name},
              {"theme", config.theme},
              {"difficulty", config.difficulty}};
    if (config.seed) {
        data["seed"] = *config.seed;
    }
    if (config.name) {
        data["name"] = *config.name;
    }
    return data;
}

std::optional<LevelConfig> level_config_from_json(const json& data) {
    if (!data.is_object()) {
        LEVELFORGE_LOG_ERROR(core::log_category::CONFIG, "Level config must be a JSON object");
        return std::nullopt;
    }
    try {
        LevelConfig config;
        config.width = data.value("width", config.width);
        config.height = data.value("height", config.height);
        config.tile_size = data.value("tileSize", config.tile_size);
        if (data.contains("biomeType")) {
            config.biome_name = data.at("biomeType").get<std::string>();
        } else if (data.contains("levelType")) {
            config.biome_name = data.at("levelType").get<std::string>();
        }
        config.theme = data.value("theme", config.theme);
        config.difficulty = data.value("difficulty", config.difficulty);
        if (auto it = data.find("seed"); it != data.end() && !it->is_null()) {
            config.seed = it->get<uint64_t>();
        }
        if (auto it = data.find("name"); it != data.end() && !it->is_null()) {
            config.name = it->get<std::string>();
        }
        return config;
    } catch (const json::exception& e) {
        LEVELFORGE_LOG_ERROR(core::log_category::CONFIG, "Malformed level config: {}", e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Validation Report
// ============================================================================

json validation_report_to_json(const ValidationReport& report) {
    const LevelMetrics& m = report.metrics;

    json issues = json::array();
    for (const auto& issue : report.issues) {
        issues.push_back(json{{"severity", issue_severity_to_string(issue.severity)},
                              {"category", issue.category},
                              {"message", issue.message}});
    }

    return json{{"hasStartPoint", report.has_start_point},
                {"hasEndPoint", report.has_end_point},
                {"hasTreasures", report.has_treasures},
                {"hasEnemies", report.has_enemies},
                {"isConnected", report.is_connected},
                {"metrics",
                 {{"totalTiles", m.total_tiles},
                  {"walkableTiles", m.walkable_tiles},
                  {"reachableTiles", m.reachable_tiles},
                  {"reachableFraction", m.reachable_fraction},
                  {"areaCount", m.area_count},
                  {"isolatedAreas", m.isolated_areas},
                  {"largestArea", m.largest_area},
                  {"deadEnds", m.dead_ends},
                  {"junctions", m.junctions},
                  {"enemies", m.enemies},
                  {"npcs", m.npcs},
                  {"treasures", m.treasures},
                  {"lights", m.lights},
                  {"lightCoverage", m.light_coverage},
                  {"difficultyScore", m.difficulty_score}}},
                {"issues", std::move(issues)},
                {"warnings", report.warnings},
                {"score", report.score},
                {"status", validation_status_to_string(report.status)}};
}

}  // namespace levelforge::gen
