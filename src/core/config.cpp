// LevelForge Core
// config.cpp - Sectioned JSON settings store implementation

#include <nlohmann/json.hpp>

#include <levelforge/core/config.hpp>
#include <levelforge/core/logger.hpp>
#include <levelforge/platform/file_io.hpp>

namespace levelforge::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    // Returns the value at section/key or nullptr when absent
    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
    }

    template<typename T>
    void set(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
        dirty = true;
        if (change_callback) {
            change_callback(section, key);
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        LEVELFORGE_LOG_ERROR(log_category::CONFIG, "Failed to read settings file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        LEVELFORGE_LOG_ERROR(log_category::CONFIG, "Settings file is not a JSON object: {}", path.string());
        return false;
    }

    impl_->path = path;
    LEVELFORGE_LOG_INFO(log_category::CONFIG, "Loaded settings from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view content) {
    try {
        auto parsed = json::parse(content);
        if (!parsed.is_object()) {
            return false;
        }
        impl_->data = std::move(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        LEVELFORGE_LOG_ERROR(log_category::CONFIG, "Failed to parse settings: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            LEVELFORGE_LOG_ERROR(log_category::CONFIG, "Failed to create settings directory: {}", parent.string());
            return false;
        }
    }

    if (!platform::FileSystem::write_text(path, to_string())) {
        LEVELFORGE_LOG_ERROR(log_category::CONFIG, "Failed to write settings file: {}", path.string());
        return false;
    }

    LEVELFORGE_LOG_INFO(log_category::CONFIG, "Saved settings to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        LEVELFORGE_LOG_ERROR(log_category::CONFIG, "Cannot save settings: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (!save(path)) {
        LEVELFORGE_LOG_WARN(log_category::CONFIG, "Failed to save default settings, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

std::string Config::to_string() const {
    return impl_->data.dump(4);
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    try {
        if (const json* value = impl_->find(section, key); value != nullptr && value->is_number()) {
            return value->get<int>();
        }
    } catch (const json::exception&) {
        // Type mismatch, return default
    }
    return default_value;
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    try {
        if (const json* value = impl_->find(section, key); value != nullptr && value->is_number()) {
            return value->get<double>();
        }
    } catch (const json::exception&) {
        // Type mismatch, return default
    }
    return default_value;
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    try {
        if (const json* value = impl_->find(section, key); value != nullptr) {
            return value->get<bool>();
        }
    } catch (const json::exception&) {
        // Type mismatch, return default
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key,
                               std::string_view default_value) const {
    try {
        if (const json* value = impl_->find(section, key); value != nullptr) {
            return value->get<std::string>();
        }
    } catch (const json::exception&) {
        // Type mismatch, return default
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->set(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->set(section, key, value);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->set(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->set(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(section);
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

bool Config::remove_section(std::string_view section) {
    if (!has_section(section)) {
        return false;
    }
    impl_->data.erase(std::string(section));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::GENERATION,
                        {{config_key::MAX_PLACEMENT_ATTEMPTS, 20},
                         {config_key::TIMEOUT_MS, 0},
                         {config_key::MIN_REACHABLE_FRACTION, 0.8},
                         {config_key::CASTLE_WALL_THICKNESS, 2},
                         {config_key::STREET_WIDTH, 2},
                         {config_key::CONNECTIVITY_FLOOR, 10}}},
                       {config_section::EXPORT, {{config_key::INDENT, 2}, {config_key::DIRECTORY, ""}}},
                       {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}}}};
    impl_->dirty = true;
}

}  // namespace levelforge::core
