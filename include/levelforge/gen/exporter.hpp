// LevelForge Generation
// exporter.hpp - tpt_level_v1 interchange documents

#pragma once

#include "level.hpp"

#include <levelforge/core/clock.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace levelforge::gen {

inline constexpr const char* EXPORT_FORMAT = "tpt_level_v1";

struct ExportSettings {
    int indent = 2;  // negative = compact single line
};

// A document read back from disk
struct ExportedLevel {
    Level level;
    LevelConfig config;
    std::string export_date;
};

class Exporter {
public:
    explicit Exporter(ExportSettings settings = {}, core::WallClock clock = core::system_wall_clock());

    // {"level", "config", "exportDate", "format": "tpt_level_v1"}
    [[nodiscard]] nlohmann::json to_json(const Level& level, const LevelConfig& config) const;

    // to_json rendered with the configured indent
    [[nodiscard]] std::string to_string(const Level& level, const LevelConfig& config) const;

    // Creates parent directories; logs and returns false on failure
    bool export_to_file(const Level& level, const LevelConfig& config, const std::filesystem::path& path) const;

    // Rejects documents whose format tag is not tpt_level_v1
    [[nodiscard]] static std::optional<ExportedLevel> from_json(const nlohmann::json& document);
    [[nodiscard]] static std::optional<ExportedLevel> load_from_file(const std::filesystem::path& path);

    [[nodiscard]] const ExportSettings& settings() const { return settings_; }

private:
    ExportSettings settings_;
    core::WallClock clock_;
};

}  // namespace levelforge::gen
