// LevelForge Core
// config.hpp - Sectioned JSON settings store for engine and tool settings

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace levelforge::core {

// Settings grouped into named sections, persisted as a JSON object of objects
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Load/Save operations
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view content);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to loaded path
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;
    [[nodiscard]] std::string to_string() const;

    // Typed getters, returning the default on a missing key or type mismatch
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);
    bool remove_section(std::string_view section);

    // Change notification callback
    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    // Dirty tracking
    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* GENERATION = "generation";
    inline constexpr const char* EXPORT = "export";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // Generation section
    inline constexpr const char* MAX_PLACEMENT_ATTEMPTS = "max_placement_attempts";
    inline constexpr const char* TIMEOUT_MS = "timeout_ms";
    inline constexpr const char* MIN_REACHABLE_FRACTION = "min_reachable_fraction";
    inline constexpr const char* CASTLE_WALL_THICKNESS = "castle_wall_thickness";
    inline constexpr const char* STREET_WIDTH = "street_width";
    inline constexpr const char* CONNECTIVITY_FLOOR = "connectivity_floor";

    // Export section
    inline constexpr const char* INDENT = "indent";
    inline constexpr const char* DIRECTORY = "directory";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
}  // namespace config_key

}  // namespace levelforge::core
