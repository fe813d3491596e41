#pragma once

#include <toolpipe/config/app_config.hpp>
#include <toolpipe/core/result.hpp>

#include <string_view>

namespace toolpipe {

// Parse a YAML config file into an AppConfig. Absent keys keep defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. --help and --version print and exit.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields of cli_overrides that differ from the defaults
// replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that values are sane before anything is opened.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Server profile announced during the handshake.
ServerProfile MakeServerProfile(const AppConfig& config);

} // namespace toolpipe
