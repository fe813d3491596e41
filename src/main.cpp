#include <toolpipe/config/config_loader.hpp>
#include <toolpipe/core/log.hpp>
#include <toolpipe/core/terminal.hpp>
#include <toolpipe/core/version.hpp>
#include <toolpipe/db/database.hpp>
#include <toolpipe/db/db_tools.hpp>
#include <toolpipe/protocol/session.hpp>
#include <toolpipe/protocol/tool_registry.hpp>
#include <toolpipe/protocol/transport.hpp>

#include <nlohmann/json.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

namespace {

constexpr const char* kComponent = "main";

void PrintError(const toolpipe::Error& error, bool json_output) {
    if (json_output) {
        nlohmann::json j = {{"error", {{"kind", error.KindName()},
                                       {"operation", error.operation},
                                       {"message", error.message}}}};
        std::cerr << j.dump() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// CLI first (it may name the YAML file), then the file underneath it.
toolpipe::Result<toolpipe::AppConfig, toolpipe::Error> ResolveConfig(
    int argc, const char* const* argv) {
    using namespace toolpipe;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) return cli;

    AppConfig config = cli.Value();
    if (config.config_file.has_value()) {
        auto yaml = LoadFromYaml(*config.config_file);
        if (yaml.IsErr()) return yaml;
        config = MergeConfigs(yaml.Value(), cli.Value());
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) return Result<AppConfig, Error>::Err(valid.Error());
    return Result<AppConfig, Error>::Ok(std::move(config));
}

toolpipe::Result<void, toolpipe::Error> InitLogging(
    const toolpipe::AppConfig& config) {
    using namespace toolpipe;

    std::unique_ptr<ILogSink> sink;
    if (config.logging.file.has_value()) {
        auto file = FileSink::Open(*config.logging.file, config.logging.json);
        if (file.IsErr()) return Result<void, Error>::Err(file.Error());
        sink = std::move(file).Value();
    } else if (config.logging.json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        const bool use_color = !NoColorEnvSet() && IsStderrTty();
        sink = std::make_unique<ColorConsoleSink>(use_color);
    }
    InitGlobalLogger(std::move(sink), config.logging.level);
    return Result<void, Error>::Ok();
}

int Fail(const toolpipe::Error& error, bool json_output) {
    toolpipe::LogError(kComponent, error.ToString());
    PrintError(error, json_output);
    return error.ExitCode();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolpipe;

    // A client that goes away must surface as a write error, not a signal.
    std::signal(SIGPIPE, SIG_IGN);

    auto config_result = ResolveConfig(argc, argv);
    if (config_result.IsErr()) {
        PrintError(config_result.Error(), false);
        return config_result.Error().ExitCode();
    }
    const AppConfig config = std::move(config_result).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintError(logging.Error(), config.logging.json);
        return logging.Error().ExitCode();
    }
    LogInfo(kComponent, std::string(kServerName) + " " + kVersion + " starting");

    auto db_result = Database::Open(config.database.path);
    if (db_result.IsErr()) return Fail(db_result.Error(), config.logging.json);
    auto db = std::move(db_result).Value();

    if (config.database.seed) {
        auto seeded = CreateDatabase(*db);
        if (seeded.IsErr()) return Fail(seeded.Error(), config.logging.json);
    }

    ToolRegistry registry;
    auto registered = RegisterDatabaseTools(registry, *db);
    if (registered.IsErr()) return Fail(registered.Error(), config.logging.json);

    SessionOptions options;
    options.max_frame_bytes = config.protocol.max_frame_bytes;
    options.profile = MakeServerProfile(config);

    FdTransport transport(STDIN_FILENO, STDOUT_FILENO);
    Session session(registry, transport, std::move(options));
    auto ran = session.Run();
    if (ran.IsErr()) {
        // Session already logged the cause.
        return ran.Error().ExitCode();
    }

    LogInfo(kComponent, "Shutting down");
    return 0;
}
