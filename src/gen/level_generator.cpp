// LevelForge Generation
// level_generator.cpp - End-to-end generation: scaffold, synthesis, post-processing

#include <levelforge/core/config.hpp>
#include <levelforge/core/logger.hpp>
#include <levelforge/gen/level_generator.hpp>
#include <levelforge/gen/scaffold.hpp>
#include <levelforge/platform/timer.hpp>

#include <algorithm>

namespace levelforge::gen {

const char* generation_status_to_string(GenerationStatus status) {
    switch (status) {
        case GenerationStatus::Completed:
            return "completed";
        case GenerationStatus::Cancelled:
            return "cancelled";
        case GenerationStatus::TimedOut:
            return "timed_out";
    }
    return "unknown";
}

GenerationSettings GenerationSettings::from_config(const core::Config& config) {
    using namespace core::config_section;
    using namespace core::config_key;

    GenerationSettings settings;
    settings.synthesis.max_placement_attempts =
        std::max(1, config.get_int(GENERATION, MAX_PLACEMENT_ATTEMPTS, settings.synthesis.max_placement_attempts));
    settings.synthesis.castle_wall_thickness =
        std::max(1, config.get_int(GENERATION, CASTLE_WALL_THICKNESS, settings.synthesis.castle_wall_thickness));
    settings.synthesis.street_width =
        std::max(1, config.get_int(GENERATION, STREET_WIDTH, settings.synthesis.street_width));

    settings.post_process.min_reachable_fraction =
        config.get_double(GENERATION, MIN_REACHABLE_FRACTION, settings.post_process.min_reachable_fraction);
    settings.post_process.connectivity_floor = static_cast<size_t>(std::max(
        0, config.get_int(GENERATION, CONNECTIVITY_FLOOR, static_cast<int>(settings.post_process.connectivity_floor))));

    settings.timeout = std::chrono::milliseconds(std::max(0, config.get_int(GENERATION, TIMEOUT_MS, 0)));
    return settings;
}

LevelGenerator::LevelGenerator(GenerationSettings settings, core::WallClock clock)
    : settings_(std::move(settings)), clock_(clock ? std::move(clock) : core::system_wall_clock()) {}

GenerationResult LevelGenerator::generate(const LevelConfig& config, const CancellationToken& token) const {
    validate_config(config);

    platform::Deadline deadline(settings_.timeout);
    GenerationResult result;
    result.config = config;
    if (!result.config.seed) {
        result.config.seed = Rng::random_seed();
    }

    if (!is_known_biome(config.biome_name)) {
        LEVELFORGE_LOG_WARN(core::log_category::GENERATION, "Unknown biome '{}', using dungeon", config.biome_name);
    }

    Rng rng(*result.config.seed);
    Level level = create_scaffold(result.config, rng, core::format_iso8601(clock_()));
    LEVELFORGE_LOG_INFO(core::log_category::GENERATION, "Generating {} level '{}' ({}x{}, seed {})",
                        biome_type_to_string(level.biome), level.name, level.dimensions.width,
                        level.dimensions.height, *result.config.seed);

    auto synthesizer = create_synthesizer(result.config.biome());
    SynthesisContext ctx{level, rng, result.config, settings_.synthesis};

    auto interrupted = [&]() -> std::optional<GenerationStatus> {
        if (token.is_cancelled()) {
            return GenerationStatus::Cancelled;
        }
        if (deadline.expired()) {
            return GenerationStatus::TimedOut;
        }
        return std::nullopt;
    };

    for (SynthesisPhase phase : ALL_SYNTHESIS_PHASES) {
        if (auto stop = interrupted()) {
            result.status = *stop;
            result.regions = synthesizer->region_summary();
            result.elapsed_ms = deadline.elapsed_milliseconds();
            LEVELFORGE_LOG_WARN(core::log_category::GENERATION, "Generation {} before {} phase",
                                generation_status_to_string(*stop), synthesis_phase_to_string(phase));
            return result;
        }
        synthesizer->run_phase(phase, ctx);
        result.completed_phases.push_back(phase);
    }

    // Last chance to abort before post-processing
    if (auto stop = interrupted()) {
        result.status = *stop;
        result.regions = synthesizer->region_summary();
        result.elapsed_ms = deadline.elapsed_milliseconds();
        LEVELFORGE_LOG_WARN(core::log_category::GENERATION, "Generation {} before post-processing",
                            generation_status_to_string(*stop));
        return result;
    }

    result.regions = synthesizer->region_summary();
    synthesizer.reset();

    PostProcessor post_processor(settings_.post_process);
    result.validation = post_processor.process(level, rng);
    result.level = std::move(level);
    result.status = GenerationStatus::Completed;
    result.elapsed_ms = deadline.elapsed_milliseconds();

    LEVELFORGE_LOG_INFO(core::log_category::GENERATION, "Generated '{}' in {:.2f} ms ({}, score {})",
                        result.level->name, result.elapsed_ms,
                        validation_status_to_string(result.validation.status), result.validation.score);
    return result;
}

std::future<GenerationResult> LevelGenerator::generate_async(LevelConfig config, CancellationToken token) const {
    // The task owns a copy so the future may outlive this generator
    return std::async(std::launch::async,
                      [generator = *this, config = std::move(config), token = std::move(token)]() {
                          return generator.generate(config, token);
                      });
}

}  // namespace levelforge::gen
