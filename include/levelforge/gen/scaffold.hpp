// LevelForge Generation
// scaffold.hpp - Empty level allocation from a generation config

#pragma once

#include "level.hpp"
#include "rng.hpp"

#include <string>

namespace levelforge::gen {

// Throws ConfigError when width, height or tile size is not positive
void validate_config(const LevelConfig& config);

// Allocates six unassigned layers of config size, an empty entity list and
// metadata (objectives, description, seed, timestamp). The id and any
// generated name are drawn from rng so the result is reproducible.
// Throws ConfigError before allocating anything.
[[nodiscard]] Level create_scaffold(const LevelConfig& config, Rng& rng, const std::string& generated_at);

}  // namespace levelforge::gen
