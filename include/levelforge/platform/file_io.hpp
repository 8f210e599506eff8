// LevelForge Platform Layer
// file_io.hpp - File system helpers for settings, logs and exported levels

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace levelforge::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations. Failures are logged and
// reported through the return value, never thrown.
class FileSystem {
public:
    // Standard paths
    static fs::path get_user_data_directory();    // ~/.local/share/LevelForge on Linux
    static fs::path get_user_config_directory();  // ~/.config/LevelForge on Linux
    static fs::path get_temp_directory();

    // Text file operations. write_text creates missing parent directories.
    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    // Directory operations
    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool is_directory(const fs::path& path);
    static bool is_file(const fs::path& path);
    static bool remove_all(const fs::path& path);

private:
    FileSystem() = delete;  // Static class, no instances
};

}  // namespace levelforge::platform
