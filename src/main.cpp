// LevelForge - Procedural Level Generation Engine
// main.cpp - levelforge_cli entry point

#include <levelforge/core/config.hpp>
#include <levelforge/core/logger.hpp>
#include <levelforge/gen/errors.hpp>
#include <levelforge/gen/exporter.hpp>
#include <levelforge/gen/level_generator.hpp>
#include <levelforge/gen/serialization.hpp>
#include <levelforge/platform/file_io.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <charconv>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr const char* VERSION = "0.1.0";

struct CliOptions {
    std::optional<std::string> biome;
    std::optional<int32_t> width;
    std::optional<int32_t> height;
    std::optional<int32_t> tile_size;
    std::optional<uint64_t> seed;
    std::optional<std::string> theme;
    std::optional<std::string> difficulty;
    std::optional<std::string> name;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> settings_path;
    std::optional<std::filesystem::path> out_path;
    bool report = false;
    bool help = false;
};

void print_usage() {
    fmt::print(
        "levelforge_cli v{}\n"
        "Usage: levelforge_cli [options]\n"
        "  --biome <name>        dungeon, cave, forest, town or castle\n"
        "  --width <tiles>       level width (default 32)\n"
        "  --height <tiles>      level height (default 24)\n"
        "  --tile-size <px>      tile edge length (default 32)\n"
        "  --seed <number>       fixed seed for reproducible output\n"
        "  --theme <name>        free-form theme tag\n"
        "  --difficulty <name>   easy, normal or hard\n"
        "  --name <text>         level name (generated when omitted)\n"
        "  --config <file>       level config JSON; flags override its fields\n"
        "  --settings <file>     engine settings JSON\n"
        "  --out <file>          export the level as tpt_level_v1 JSON\n"
        "  --report              print the markdown validation report\n"
        "  --help                show this message\n",
        VERSION);
}

template<typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Returns nullopt after logging the offending argument
std::optional<CliOptions> parse_arguments(int argc, char* argv[]) {
    using levelforge::core::log_category::CLI;

    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.help = true;
            continue;
        }
        if (arg == "--report") {
            options.report = true;
            continue;
        }

        if (i + 1 >= argc) {
            LEVELFORGE_LOG_ERROR(CLI, "Missing value for {}", arg);
            return std::nullopt;
        }
        std::string_view value = argv[++i];

        bool valid = true;
        if (arg == "--biome") {
            options.biome = std::string(value);
        } else if (arg == "--width") {
            options.width = parse_number<int32_t>(value);
            valid = options.width.has_value();
        } else if (arg == "--height") {
            options.height = parse_number<int32_t>(value);
            valid = options.height.has_value();
        } else if (arg == "--tile-size") {
            options.tile_size = parse_number<int32_t>(value);
            valid = options.tile_size.has_value();
        } else if (arg == "--seed") {
            options.seed = parse_number<uint64_t>(value);
            valid = options.seed.has_value();
        } else if (arg == "--theme") {
            options.theme = std::string(value);
        } else if (arg == "--difficulty") {
            options.difficulty = std::string(value);
        } else if (arg == "--name") {
            options.name = std::string(value);
        } else if (arg == "--config") {
            options.config_path = std::filesystem::path(value);
        } else if (arg == "--settings") {
            options.settings_path = std::filesystem::path(value);
        } else if (arg == "--out") {
            options.out_path = std::filesystem::path(value);
        } else {
            LEVELFORGE_LOG_ERROR(CLI, "Unknown option {}", arg);
            return std::nullopt;
        }

        if (!valid) {
            LEVELFORGE_LOG_ERROR(CLI, "Invalid value '{}' for {}", value, arg);
            return std::nullopt;
        }
    }
    return options;
}

std::optional<levelforge::gen::LevelConfig> build_level_config(const CliOptions& options) {
    using namespace levelforge;

    gen::LevelConfig config;
    if (options.config_path) {
        auto content = platform::FileSystem::read_text(*options.config_path);
        if (!content) {
            return std::nullopt;
        }
        auto document = nlohmann::json::parse(*content, nullptr, false);
        if (document.is_discarded()) {
            LEVELFORGE_LOG_ERROR(core::log_category::CLI, "Failed to parse {}", options.config_path->string());
            return std::nullopt;
        }
        auto parsed = gen::level_config_from_json(document);
        if (!parsed) {
            return std::nullopt;
        }
        config = std::move(*parsed);
    }

    if (options.biome) config.biome_name = *options.biome;
    if (options.width) config.width = *options.width;
    if (options.height) config.height = *options.height;
    if (options.tile_size) config.tile_size = *options.tile_size;
    if (options.seed) config.seed = *options.seed;
    if (options.theme) config.theme = *options.theme;
    if (options.difficulty) config.difficulty = *options.difficulty;
    if (options.name) config.name = *options.name;
    return config;
}

void print_summary(const levelforge::gen::GenerationResult& result) {
    using namespace levelforge::gen;

    const Level& level = *result.level;
    const ValidationReport& report = result.validation;

    fmt::print("Level:      {} ({})\n", level.name, level.id);
    fmt::print("Biome:      {}\n", biome_type_to_string(level.biome));
    fmt::print("Size:       {}x{} @ {}px\n", level.dimensions.width, level.dimensions.height,
               level.dimensions.tile_size);
    fmt::print("Seed:       {}\n", level.metadata.seed);
    for (const auto& [kind, count] : result.regions) {
        fmt::print("Regions:    {} x{}\n", kind, count);
    }
    fmt::print("Entities:   {} enemies, {} npcs\n", level.count_enemies(), level.count_npcs());
    fmt::print("Connected:  {} ({} of {} walkable reachable)\n", report.is_connected ? "yes" : "no",
               report.metrics.reachable_tiles, report.metrics.walkable_tiles);
    fmt::print("Validation: {} (score {})\n", validation_status_to_string(report.status), report.score);
    fmt::print("Elapsed:    {:.2f} ms\n", result.elapsed_ms);
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace levelforge;

    core::LoggerConfig log_config;
    log_config.log_directory = platform::FileSystem::get_user_data_directory() / "logs";
    core::Logger::initialize(log_config);

    auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage();
        core::Logger::shutdown();
        return 2;
    }
    if (options->help) {
        print_usage();
        core::Logger::shutdown();
        return 0;
    }

    // Engine settings
    core::Config settings;
    if (options->settings_path) {
        if (!settings.load(*options->settings_path)) {
            LEVELFORGE_LOG_WARN(core::log_category::CLI, "Using default settings");
        }
    } else if (!settings.load_or_create_default(platform::FileSystem::get_user_config_directory() / "settings.json")) {
        LEVELFORGE_LOG_WARN(core::log_category::CLI, "Using default settings");
    }

    auto level_name = settings.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info");
    if (auto level = core::log_level_from_string(level_name)) {
        core::Logger::set_global_level(*level);
    } else {
        LEVELFORGE_LOG_WARN(core::log_category::CLI, "Unknown log level '{}'", level_name);
    }

    auto level_config = build_level_config(*options);
    if (!level_config) {
        core::Logger::shutdown();
        return 2;
    }

    gen::LevelGenerator generator(gen::GenerationSettings::from_config(settings));
    gen::GenerationResult result;
    try {
        result = generator.generate(*level_config);
    } catch (const gen::ConfigError& e) {
        LEVELFORGE_LOG_ERROR(core::log_category::CLI, "Invalid level config: {}", e.what());
        core::Logger::shutdown();
        return 2;
    }

    if (!result.ok()) {
        LEVELFORGE_LOG_ERROR(core::log_category::CLI, "Generation {} after {:.2f} ms",
                             gen::generation_status_to_string(result.status), result.elapsed_ms);
        core::Logger::shutdown();
        return 1;
    }

    print_summary(result);
    if (options->report) {
        fmt::print("\n{}", gen::render_markdown_report(*result.level, result.validation));
    }

    int exit_code = 0;
    if (options->out_path) {
        std::filesystem::path out = *options->out_path;
        auto directory = settings.get_string(core::config_section::EXPORT, core::config_key::DIRECTORY, "");
        if (out.is_relative() && !directory.empty()) {
            out = std::filesystem::path(directory) / out;
        }

        gen::ExportSettings export_settings;
        export_settings.indent = settings.get_int(core::config_section::EXPORT, core::config_key::INDENT, 2);
        gen::Exporter exporter(export_settings);
        if (!exporter.export_to_file(*result.level, result.config, out)) {
            exit_code = 1;
        } else {
            fmt::print("Exported:   {}\n", out.string());
        }
    }

    core::Logger::shutdown();
    return exit_code;
}
