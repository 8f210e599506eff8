// LevelForge Generation
// exporter.cpp - tpt_level_v1 interchange documents

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/exporter.hpp>
#include <levelforge/gen/serialization.hpp>
#include <levelforge/platform/file_io.hpp>

namespace levelforge::gen {

using json = nlohmann::json;

Exporter::Exporter(ExportSettings settings, core::WallClock clock)
    : settings_(settings), clock_(clock ? std::move(clock) : core::system_wall_clock()) {}

json Exporter::to_json(const Level& level, const LevelConfig& config) const {
    return json{{"level", level_to_json(level)},
                {"config", level_config_to_json(config)},
                {"exportDate", core::format_iso8601(clock_())},
                {"format", EXPORT_FORMAT}};
}

std::string Exporter::to_string(const Level& level, const LevelConfig& config) const {
    return to_json(level, config).dump(settings_.indent);
}

bool Exporter::export_to_file(const Level& level, const LevelConfig& config,
                              const std::filesystem::path& path) const {
    if (!platform::FileSystem::write_text(path, to_string(level, config))) {
        LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Failed to export '{}' to {}", level.name, path.string());
        return false;
    }
    LEVELFORGE_LOG_INFO(core::log_category::EXPORT, "Exported '{}' to {}", level.name, path.string());
    return true;
}

std::optional<ExportedLevel> Exporter::from_json(const json& document) {
    if (!document.is_object()) {
        LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Export document must be a JSON object");
        return std::nullopt;
    }

    auto format = document.find("format");
    if (format == document.end() || !format->is_string() || format->get<std::string>() != EXPORT_FORMAT) {
        LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Unsupported export format (expected {})", EXPORT_FORMAT);
        return std::nullopt;
    }

    auto level_it = document.find("level");
    auto config_it = document.find("config");
    if (level_it == document.end() || config_it == document.end()) {
        LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Export document lacks level or config");
        return std::nullopt;
    }

    auto level = level_from_json(*level_it);
    auto config = level_config_from_json(*config_it);
    if (!level || !config) {
        return std::nullopt;
    }

    ExportedLevel result;
    result.level = std::move(*level);
    result.config = std::move(*config);
    if (auto date = document.find("exportDate"); date != document.end() && date->is_string()) {
        result.export_date = date->get<std::string>();
    }
    return result;
}

std::optional<ExportedLevel> Exporter::load_from_file(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        return std::nullopt;
    }

    json document = json::parse(*content, nullptr, false);
    if (document.is_discarded()) {
        LEVELFORGE_LOG_ERROR(core::log_category::EXPORT, "Failed to parse {}", path.string());
        return std::nullopt;
    }
    return from_json(document);
}

}  // namespace levelforge::gen
