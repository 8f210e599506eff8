// LevelForge Generation
// level_generator.hpp - End-to-end generation: scaffold, synthesis, post-processing

#pragma once

#include "level.hpp"
#include "post_processor.hpp"
#include "synthesizer.hpp"

#include <levelforge/core/clock.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace levelforge::core {
class Config;
}

namespace levelforge::gen {

// ============================================================================
// Settings
// ============================================================================

struct GenerationSettings {
    SynthesisSettings synthesis;
    PostProcessSettings post_process;
    std::chrono::milliseconds timeout{0};  // 0 = no timeout

    // Reads the "generation" section; missing keys keep the defaults above
    [[nodiscard]] static GenerationSettings from_config(const core::Config& config);
};

// ============================================================================
// Cancellation
// ============================================================================

// Shared flag checked between synthesis phases. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool is_cancelled() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// ============================================================================
// Result
// ============================================================================

enum class GenerationStatus : uint8_t {
    Completed = 0,
    Cancelled,
    TimedOut
};

[[nodiscard]] const char* generation_status_to_string(GenerationStatus status);

struct GenerationResult {
    GenerationStatus status = GenerationStatus::Completed;
    std::optional<Level> level;           // only set when Completed
    ValidationReport validation;          // default-constructed unless Completed
    LevelConfig config;                   // input with the seed resolved
    std::map<std::string, size_t> regions;
    std::vector<SynthesisPhase> completed_phases;
    double elapsed_ms = 0.0;

    [[nodiscard]] bool ok() const { return status == GenerationStatus::Completed && level.has_value(); }
};

// ============================================================================
// Level Generator
// ============================================================================

class LevelGenerator {
public:
    explicit LevelGenerator(GenerationSettings settings = {}, core::WallClock clock = core::system_wall_clock());

    // Throws ConfigError on invalid dimensions. A cancelled or timed-out run
    // returns without a level; post-processing never starts after a timeout.
    [[nodiscard]] GenerationResult generate(const LevelConfig& config,
                                            const CancellationToken& token = CancellationToken()) const;

    // Runs generate() on a background task holding its own copy of the
    // generator. ConfigError surfaces from get().
    [[nodiscard]] std::future<GenerationResult> generate_async(LevelConfig config,
                                                               CancellationToken token = CancellationToken()) const;

    [[nodiscard]] const GenerationSettings& settings() const { return settings_; }

private:
    GenerationSettings settings_;
    core::WallClock clock_;
};

}  // namespace levelforge::gen
