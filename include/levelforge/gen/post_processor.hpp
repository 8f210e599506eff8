// LevelForge Generation
// post_processor.hpp - Balancing, decoration and advisory validation

#pragma once

#include "level.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace levelforge::gen {

// ============================================================================
// Validation Report
// ============================================================================

enum class IssueSeverity : uint8_t {
    Critical = 0,
    Major,
    Minor
};

enum class ValidationStatus : uint8_t {
    Valid = 0,
    NeedsImprovements,
    NeedsFixes,
    Invalid
};

[[nodiscard]] const char* issue_severity_to_string(IssueSeverity severity);
[[nodiscard]] const char* validation_status_to_string(ValidationStatus status);

struct ValidationIssue {
    IssueSeverity severity = IssueSeverity::Minor;
    std::string category;  // "layout", "gameplay", "objectives", ...
    std::string message;
};

struct LevelMetrics {
    size_t total_tiles = 0;
    size_t walkable_tiles = 0;
    size_t reachable_tiles = 0;     // from the start point
    double reachable_fraction = 0.0;
    size_t area_count = 0;          // 4-connected walkable components
    size_t isolated_areas = 0;      // components under ISOLATED_AREA_SIZE
    size_t largest_area = 0;
    size_t dead_ends = 0;           // exactly one walkable 4-neighbor
    size_t junctions = 0;           // three or more walkable 4-neighbors
    size_t enemies = 0;
    size_t npcs = 0;
    size_t treasures = 0;
    size_t lights = 0;
    double light_coverage = 0.0;    // estimated lit area over walkable area
    double difficulty_score = 0.0;
};

// Advisory outcome; never raised as an error
struct ValidationReport {
    bool has_start_point = false;
    bool has_end_point = false;
    bool has_treasures = false;
    bool has_enemies = false;
    bool is_connected = false;

    LevelMetrics metrics;
    std::vector<ValidationIssue> issues;
    std::vector<std::string> warnings;
    int32_t score = 100;
    ValidationStatus status = ValidationStatus::Valid;
};

// ============================================================================
// Post Processor
// ============================================================================

struct PostProcessSettings {
    size_t connectivity_floor = 10;      // walkable count pre-filter
    double min_reachable_fraction = 0.8;

    // Validation thresholds
    double min_walkable_ratio = 0.3;
    size_t max_isolated_areas = 3;
    size_t min_entities = 5;
    size_t max_entities = 200;
    double max_difficulty_score = 2.0;
    size_t max_dead_ends = 10;
    double min_light_coverage = 0.4;
    double light_radius = 5.0;

    // Decoration
    double ambient_chance = 0.15;
};

inline constexpr size_t ISOLATED_AREA_SIZE = 50;

// Enemy density per walkable tile: easy 0.3, normal 0.5, hard 0.7
[[nodiscard]] double enemy_density(std::string_view difficulty);

// Relative threat of a biome in the difficulty score
[[nodiscard]] double biome_difficulty_multiplier(BiomeType biome);

class PostProcessor {
public:
    explicit PostProcessor(PostProcessSettings settings = {});

    // balance_difficulty, decorate, then validate
    [[nodiscard]] ValidationReport process(Level& level, Rng& rng) const;

    // Trims trailing regular enemies beyond the difficulty cap; the boss stays.
    // Returns the number removed.
    size_t balance_difficulty(Level& level) const;

    // light_glow around light sources and sparse biome ambience on floor
    void decorate(Level& level, Rng& rng) const;

    [[nodiscard]] ValidationReport validate(const Level& level) const;

    [[nodiscard]] const PostProcessSettings& settings() const { return settings_; }

private:
    PostProcessSettings settings_;
};

// Human-readable summary of a validation report
[[nodiscard]] std::string render_markdown_report(const Level& level, const ValidationReport& report);

}  // namespace levelforge::gen
