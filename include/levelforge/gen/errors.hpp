// LevelForge Generation
// errors.hpp - Fatal generation errors

#pragma once

#include <stdexcept>
#include <string>

namespace levelforge::gen {

// Raised for invalid dimensions before any layer is allocated.
// Every other generation condition degrades gracefully instead of throwing.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace levelforge::gen
