#include <toolpipe/config/config_loader.hpp>

#include <toolpipe/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <iostream>

namespace toolpipe {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

Result<LogLevel, Error> ParseLevelSetting(const std::string& text,
                                          const std::string& source) {
    auto level = ParseLogLevel(text);
    if (!level) {
        return Result<LogLevel, Error>::Err(MakeConfigError(
            "Invalid " + source + " '" + text +
            "' (expected debug, info, warn or error)"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

Result<void, Error> ApplyYaml(const YAML::Node& root, AppConfig& config) {
    // -- Database --
    if (const auto db = root["database"]) {
        if (db["path"]) {
            config.database.path = db["path"].as<std::string>();
        }
        if (db["seed"]) {
            config.database.seed = db["seed"].as<bool>();
        }
    }

    // -- Logging --
    if (const auto logging = root["logging"]) {
        if (logging["level"]) {
            auto level = ParseLevelSetting(logging["level"].as<std::string>(),
                                           "logging.level");
            if (level.IsErr()) return Result<void, Error>::Err(level.Error());
            config.logging.level = level.Value();
        }
        if (logging["file"]) {
            config.logging.file = logging["file"].as<std::string>();
        }
        if (logging["json"]) {
            config.logging.json = logging["json"].as<bool>();
        }
    }

    // -- Protocol --
    if (const auto protocol = root["protocol"]) {
        if (protocol["version"]) {
            config.protocol.version = protocol["version"].as<std::string>();
        }
        if (protocol["max_frame_bytes"]) {
            const auto bytes = protocol["max_frame_bytes"].as<long long>();
            if (bytes <= 0) {
                return Result<void, Error>::Err(MakeConfigError(
                    "protocol.max_frame_bytes must be positive, got " +
                    std::to_string(bytes)));
            }
            config.protocol.max_frame_bytes = static_cast<std::size_t>(bytes);
        }
        if (protocol["capabilities"]) {
            config.protocol.capabilities.clear();
            for (const auto& cap : protocol["capabilities"]) {
                config.protocol.capabilities.insert(cap.as<std::string>());
            }
        }
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        const auto root = YAML::LoadFile(std::string(file_path));
        auto applied = ApplyYaml(root, config);
        if (applied.IsErr()) {
            return Result<AppConfig, Error>::Err(applied.Error());
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file '" + std::string(file_path) +
                            "': " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // -v is taken by --verbose, so --version is declared by hand.
    argparse::ArgumentParser program("toolpipe", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Tool server speaking newline-delimited JSON frames on stdin/stdout.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--db")
        .help("SQLite database path (default: toolpipe.db)");
    program.add_argument("--no-seed")
        .help("Do not create the sample tables in a new database")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");
    program.add_argument("--json-log")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("debug, info, warn or error (default: warn)");
    program.add_argument("-v", "--verbose")
        .help("Same as --log-level debug")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--max-frame-bytes")
        .help("Largest accepted frame in bytes (default: 4194304)")
        .scan<'i', int>();
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([](const std::string& /*unused*/) {
            std::cout << kServerName << " " << kVersion << std::endl;
            std::exit(0);
        });

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--db")) {
        config.database.path = *val;
    }
    if (program.get<bool>("--no-seed")) {
        config.database.seed = false;
    }
    if (auto val = program.present("--log-file")) {
        config.logging.file = *val;
    }
    if (program.get<bool>("--json-log")) {
        config.logging.json = true;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLevelSetting(*val, "--log-level");
        if (level.IsErr()) return Result<AppConfig, Error>::Err(level.Error());
        config.logging.level = level.Value();
    }
    if (program.get<bool>("--verbose")) {
        config.logging.level = LogLevel::Debug;
    }
    if (auto val = program.present<int>("--max-frame-bytes")) {
        if (*val <= 0) {
            return Result<AppConfig, Error>::Err(MakeConfigError(
                "--max-frame-bytes must be positive, got " + std::to_string(*val)));
        }
        config.protocol.max_frame_bytes = static_cast<std::size_t>(*val);
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    // Database
    if (cli_overrides.database.path != defaults.database.path) {
        merged.database.path = cli_overrides.database.path;
    }
    if (!cli_overrides.database.seed) {
        merged.database.seed = false;
    }

    // Logging
    if (cli_overrides.logging.level != defaults.logging.level) {
        merged.logging.level = cli_overrides.logging.level;
    }
    if (cli_overrides.logging.file.has_value()) {
        merged.logging.file = cli_overrides.logging.file;
    }
    if (cli_overrides.logging.json) {
        merged.logging.json = true;
    }

    // Protocol (version and capabilities come from the file only)
    if (cli_overrides.protocol.max_frame_bytes != defaults.protocol.max_frame_bytes) {
        merged.protocol.max_frame_bytes = cli_overrides.protocol.max_frame_bytes;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.database.path.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: database.path"));
    }
    if (config.logging.file.has_value() && config.logging.file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("logging.file must not be empty when set"));
    }
    if (config.protocol.max_frame_bytes < 64) {
        return Result<void, Error>::Err(
            MakeConfigError("protocol.max_frame_bytes must be at least 64, got " +
                            std::to_string(config.protocol.max_frame_bytes)));
    }
    auto version = ProtocolVersion::Parse(config.protocol.version);
    if (version.IsErr()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid protocol.version: " + version.Error().message));
    }
    for (const auto& cap : config.protocol.capabilities) {
        if (cap.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("protocol.capabilities contains an empty name"));
        }
        if (!IsSupportedCapability(cap)) {
            return Result<void, Error>::Err(MakeConfigError(
                "protocol.capabilities names '" + cap +
                "', which this server does not implement (supported: " +
                kToolsCapability + ")"));
        }
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// MakeServerProfile
// ---------------------------------------------------------------------------
ServerProfile MakeServerProfile(const AppConfig& config) {
    auto profile = DefaultServerProfile();
    profile.protocol_version = config.protocol.version;
    profile.capabilities = config.protocol.capabilities;
    return profile;
}

} // namespace toolpipe
