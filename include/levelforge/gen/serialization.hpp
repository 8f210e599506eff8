// LevelForge Generation
// serialization.hpp - JSON mapping for levels, configs and validation reports

#pragma once

#include "level.hpp"
#include "post_processor.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace levelforge::gen {

// ============================================================================
// Level
// ============================================================================

// Layers are emitted as {"terrain": [[tag|null, ...], ...], ...}, one array
// per row. Entities carry "type" ("enemy"/"npc"), "position" {x, y} and
// either enemyType/difficultyLevel or npcType/dialogue.
[[nodiscard]] nlohmann::json level_to_json(const Level& level);

// Returns nullopt (and logs) on a missing field, a malformed layer or an
// unregistered tile tag
[[nodiscard]] std::optional<Level> level_from_json(const nlohmann::json& data);

// ============================================================================
// Level Config
// ============================================================================

// The seed is omitted when absent
[[nodiscard]] nlohmann::json level_config_to_json(const LevelConfig& config);

// Missing fields keep their defaults. "levelType" is accepted in place of
// "biomeType". Returns nullopt when a present field has the wrong type.
[[nodiscard]] std::optional<LevelConfig> level_config_from_json(const nlohmann::json& data);

// ============================================================================
// Validation Report
// ============================================================================

[[nodiscard]] nlohmann::json validation_report_to_json(const ValidationReport& report);

}  // namespace levelforge::gen
