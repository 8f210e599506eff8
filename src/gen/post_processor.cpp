// LevelForge Generation
// post_processor.cpp - Balancing, decoration and validation

#include <levelforge/core/logger.hpp>
#include <levelforge/gen/geometry.hpp>
#include <levelforge/gen/post_processor.hpp>
#include <levelforge/gen/tile.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <fmt/format.h>
#include <numbers>

namespace levelforge::gen {

namespace {

constexpr std::array<const char*, BIOME_COUNT> BIOME_AMBIENCE = {"ambient_dark", "cave_drip", "forest_mist",
                                                                 "town_smoke", "castle_draft"};

BoolGrid walkable_mask(const Level& level) {
    BoolGrid mask(level.dimensions.width, level.dimensions.height, 0);
    for (int32_t y = 0; y < level.dimensions.height; ++y) {
        for (int32_t x = 0; x < level.dimensions.width; ++x) {
            mask.at({x, y}) = level.is_walkable({x, y}) ? 1 : 0;
        }
    }
    return mask;
}

void add_issue(ValidationReport& report, IssueSeverity severity, std::string category, std::string message) {
    report.issues.push_back(ValidationIssue{severity, std::move(category), std::move(message)});
}

int32_t compute_score(const ValidationReport& report) {
    int32_t score = 100;
    for (const auto& issue : report.issues) {
        switch (issue.severity) {
            case IssueSeverity::Critical:
                score -= 25;
                break;
            case IssueSeverity::Major:
                score -= 15;
                break;
            case IssueSeverity::Minor:
                score -= 5;
                break;
        }
    }
    score -= 2 * static_cast<int32_t>(report.warnings.size());
    return std::clamp(score, 0, 100);
}

ValidationStatus compute_status(const ValidationReport& report) {
    auto has_severity = [&](IssueSeverity severity) {
        return std::any_of(report.issues.begin(), report.issues.end(),
                           [&](const ValidationIssue& issue) { return issue.severity == severity; });
    };
    if (has_severity(IssueSeverity::Critical)) {
        return ValidationStatus::Invalid;
    }
    if (has_severity(IssueSeverity::Major)) {
        return ValidationStatus::NeedsFixes;
    }
    if (report.warnings.size() > 3) {
        return ValidationStatus::NeedsImprovements;
    }
    return ValidationStatus::Valid;
}

}  // namespace

const char* issue_severity_to_string(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::Critical:
            return "critical";
        case IssueSeverity::Major:
            return "major";
        case IssueSeverity::Minor:
            return "minor";
    }
    return "unknown";
}

const char* validation_status_to_string(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Valid:
            return "valid";
        case ValidationStatus::NeedsImprovements:
            return "needs_improvements";
        case ValidationStatus::NeedsFixes:
            return "needs_fixes";
        case ValidationStatus::Invalid:
            return "invalid";
    }
    return "unknown";
}

double enemy_density(std::string_view difficulty) {
    if (difficulty == "easy") {
        return 0.3;
    }
    if (difficulty == "hard") {
        return 0.7;
    }
    return 0.5;
}

double biome_difficulty_multiplier(BiomeType biome) {
    switch (biome) {
        case BiomeType::Dungeon:
            return 1.5;
        case BiomeType::Cave:
            return 1.3;
        case BiomeType::Forest:
            return 0.9;
        case BiomeType::Town:
            return 0.7;
        case BiomeType::Castle:
        case BiomeType::Count:
            break;
    }
    return 1.0;
}

// ============================================================================
// PostProcessor
// ============================================================================

PostProcessor::PostProcessor(PostProcessSettings settings) : settings_(std::move(settings)) {}

ValidationReport PostProcessor::process(Level& level, Rng& rng) const {
    size_t removed = balance_difficulty(level);
    if (removed > 0) {
        LEVELFORGE_LOG_DEBUG(core::log_category::VALIDATION, "Balancing removed {} enemies from '{}'", removed,
                             level.name);
    }
    decorate(level, rng);
    return validate(level);
}

size_t PostProcessor::balance_difficulty(Level& level) const {
    const double walkable = static_cast<double>(level.count_walkable());
    const auto cap = std::max<size_t>(3, static_cast<size_t>(std::ceil(walkable * enemy_density(level.difficulty) / 10.0)));

    size_t regular = 0;
    for (const auto& entity : level.entities) {
        if (entity.is_enemy() && entity.difficulty_level != "boss") {
            ++regular;
        }
    }
    if (regular <= cap) {
        return 0;
    }

    // Walk from the back so the earliest placements survive
    size_t excess = regular - cap;
    size_t removed = 0;
    for (auto it = level.entities.end(); it != level.entities.begin() && removed < excess;) {
        --it;
        if (it->is_enemy() && it->difficulty_level != "boss") {
            it = level.entities.erase(it);
            ++removed;
        }
    }
    return removed;
}

void PostProcessor::decorate(Level& level, Rng& rng) const {
    const auto& registry = TileRegistry::instance();
    const TileId glow = registry.find_id("light_glow").value_or(TILE_NONE);
    const TileId ambience = registry.find_id(BIOME_AMBIENCE[static_cast<size_t>(level.biome)]).value_or(TILE_NONE);

    for (int32_t y = 0; y < level.dimensions.height; ++y) {
        for (int32_t x = 0; x < level.dimensions.width; ++x) {
            TilePos pos{x, y};
            if (registry.is_emissive(level.tile(LayerId::Lighting, pos))) {
                level.set_tile(LayerId::Effects, pos, glow);
            } else if (level.tile(LayerId::Effects, pos) == TILE_NONE && level.is_walkable(pos) &&
                       rng.chance(settings_.ambient_chance)) {
                level.set_tile(LayerId::Effects, pos, ambience);
            }
        }
    }
}

ValidationReport PostProcessor::validate(const Level& level) const {
    const auto& registry = TileRegistry::instance();
    ValidationReport report;
    LevelMetrics& metrics = report.metrics;

    metrics.total_tiles = static_cast<size_t>(level.dimensions.width) * static_cast<size_t>(level.dimensions.height);

    // Walkable components
    BoolGrid mask = walkable_mask(level);
    auto areas = geometry::label_components(mask, 1);
    metrics.area_count = areas.size();
    for (const auto& area : areas) {
        metrics.walkable_tiles += area.size();
        metrics.largest_area = std::max(metrics.largest_area, area.size());
        if (area.size() < ISOLATED_AREA_SIZE) {
            ++metrics.isolated_areas;
        }
    }

    // Reachability from the start point (or the first walkable cell)
    std::optional<TilePos> origin = level.metadata.start_point;
    if ((!origin || !level.is_walkable(*origin)) && !areas.empty()) {
        origin = areas.front().seed;
    }
    if (origin && level.is_walkable(*origin)) {
        BoolGrid scratch = mask;
        metrics.reachable_tiles = geometry::flood_fill(scratch, *origin, 1, 2);
    }
    if (metrics.walkable_tiles > 0) {
        metrics.reachable_fraction =
            static_cast<double>(metrics.reachable_tiles) / static_cast<double>(metrics.walkable_tiles);
    }

    // Topology
    for (int32_t y = 0; y < level.dimensions.height; ++y) {
        for (int32_t x = 0; x < level.dimensions.width; ++x) {
            TilePos pos{x, y};
            if (mask.at(pos) == 0) {
                continue;
            }
            int32_t open = 0;
            for (const auto& offset : CARDINAL_OFFSETS) {
                if (mask.get_or(pos + offset, 0) != 0) {
                    ++open;
                }
            }
            if (open == 1) {
                ++metrics.dead_ends;
            } else if (open >= 3) {
                ++metrics.junctions;
            }
        }
    }

    size_t lights = 0;
    size_t treasures = 0;
    for (int32_t y = 0; y < level.dimensions.height; ++y) {
        for (int32_t x = 0; x < level.dimensions.width; ++x) {
            if (registry.is_emissive(level.tile(LayerId::Lighting, {x, y}))) {
                ++lights;
            }
            const TileType* interactive = registry.get(level.tile(LayerId::Interactive, {x, y}));
            if (interactive != nullptr && interactive->is_treasure()) {
                ++treasures;
            }
        }
    }
    metrics.treasures = treasures;
    metrics.lights = lights;
    if (metrics.walkable_tiles > 0) {
        const double lit_area = static_cast<double>(lights) * std::numbers::pi * settings_.light_radius *
                                settings_.light_radius;
        metrics.light_coverage = std::min(1.0, lit_area / static_cast<double>(metrics.walkable_tiles));
    }

    metrics.enemies = level.count_enemies();
    metrics.npcs = level.count_npcs();
    const double entity_count = static_cast<double>(level.entities.size());
    metrics.difficulty_score = (0.1 * entity_count + 0.05 * std::sqrt(static_cast<double>(metrics.total_tiles))) *
                               biome_difficulty_multiplier(level.biome);

    // Presence flags
    report.has_start_point = level.metadata.start_point.has_value();
    report.has_end_point = level.metadata.end_point.has_value();
    report.has_treasures = metrics.treasures > 0;
    report.has_enemies = metrics.enemies > 0;
    report.is_connected = metrics.walkable_tiles > settings_.connectivity_floor &&
                          metrics.reachable_fraction >= settings_.min_reachable_fraction;

    // Layout rules
    const double walkable_ratio = metrics.total_tiles > 0 ? static_cast<double>(metrics.walkable_tiles) /
                                                                static_cast<double>(metrics.total_tiles)
                                                          : 0.0;
    if (walkable_ratio < settings_.min_walkable_ratio) {
        add_issue(report, IssueSeverity::Major, "layout",
                  fmt::format("Insufficient walkable area: {:.1f}%", walkable_ratio * 100.0));
    }
    if (metrics.isolated_areas > settings_.max_isolated_areas) {
        report.warnings.push_back(fmt::format("Too many isolated areas: {}", metrics.isolated_areas));
    }
    if (metrics.reachable_fraction < settings_.min_reachable_fraction) {
        report.warnings.push_back(
            fmt::format("Only {:.1f}% of walkable tiles are reachable", metrics.reachable_fraction * 100.0));
    }
    if (metrics.dead_ends > settings_.max_dead_ends) {
        report.warnings.push_back(fmt::format("Many dead ends: {}", metrics.dead_ends));
    }

    // Gameplay rules
    if (level.entities.size() < settings_.min_entities) {
        report.warnings.push_back(fmt::format("Few entities: {}", level.entities.size()));
    } else if (level.entities.size() > settings_.max_entities) {
        add_issue(report, IssueSeverity::Major, "gameplay", fmt::format("Too many entities: {}", level.entities.size()));
    }
    if (metrics.difficulty_score > settings_.max_difficulty_score) {
        report.warnings.push_back(fmt::format("High difficulty score: {:.2f}", metrics.difficulty_score));
    }

    // Objectives
    if (!report.has_start_point) {
        add_issue(report, IssueSeverity::Major, "objectives", "Level has no start point");
    }
    if (!report.has_end_point) {
        add_issue(report, IssueSeverity::Major, "objectives", "Level has no end point");
    }

    // Lighting
    if (metrics.light_coverage < settings_.min_light_coverage) {
        report.warnings.push_back(fmt::format("Low light coverage: {:.1f}%", metrics.light_coverage * 100.0));
    }

    report.score = compute_score(report);
    report.status = compute_status(report);

    for (const auto& warning : report.warnings) {
        LEVELFORGE_LOG_WARN(core::log_category::VALIDATION, "{}: {}", level.name, warning);
    }
    LEVELFORGE_LOG_DEBUG(core::log_category::VALIDATION, "'{}' scored {} ({})", level.name, report.score,
                         validation_status_to_string(report.status));
    return report;
}

// ============================================================================
// Markdown Report
// ============================================================================

std::string render_markdown_report(const Level& level, const ValidationReport& report) {
    const auto& m = report.metrics;
    auto yes_no = [](bool value) { return value ? "yes" : "no"; };

    std::string out;
    out += fmt::format("# Validation Report: {}\n\n", level.name);
    out += fmt::format("- Biome: {}\n", biome_type_to_string(level.biome));
    out += fmt::format("- Status: {}\n", validation_status_to_string(report.status));
    out += fmt::format("- Score: {}/100\n\n", report.score);

    out += "## Checks\n\n";
    out += "| Check | Result |\n|---|---|\n";
    out += fmt::format("| Start point | {} |\n", yes_no(report.has_start_point));
    out += fmt::format("| End point | {} |\n", yes_no(report.has_end_point));
    out += fmt::format("| Treasures | {} |\n", yes_no(report.has_treasures));
    out += fmt::format("| Enemies | {} |\n", yes_no(report.has_enemies));
    out += fmt::format("| Connected | {} |\n\n", yes_no(report.is_connected));

    out += "## Metrics\n\n";
    out += fmt::format("- Walkable tiles: {} of {}\n", m.walkable_tiles, m.total_tiles);
    out += fmt::format("- Reachable from start: {} ({:.1f}%)\n", m.reachable_tiles, m.reachable_fraction * 100.0);
    out += fmt::format("- Areas: {} (isolated {}, largest {})\n", m.area_count, m.isolated_areas, m.largest_area);
    out += fmt::format("- Dead ends: {}, junctions: {}\n", m.dead_ends, m.junctions);
    out += fmt::format("- Enemies: {}, NPCs: {}, treasures: {}\n", m.enemies, m.npcs, m.treasures);
    out += fmt::format("- Lights: {} (coverage {:.1f}%)\n", m.lights, m.light_coverage * 100.0);
    out += fmt::format("- Difficulty score: {:.2f}\n", m.difficulty_score);

    if (!report.issues.empty()) {
        out += "\n## Issues\n\n";
        for (const auto& issue : report.issues) {
            out += fmt::format("- [{}] {}: {}\n", issue_severity_to_string(issue.severity), issue.category,
                               issue.message);
        }
    }
    if (!report.warnings.empty()) {
        out += "\n## Warnings\n\n";
        for (const auto& warning : report.warnings) {
            out += fmt::format("- {}\n", warning);
        }
    }
    return out;
}

}  // namespace levelforge::gen
