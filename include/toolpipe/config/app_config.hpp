#pragma once

#include <toolpipe/core/log.hpp>
#include <toolpipe/protocol/frame_codec.hpp>
#include <toolpipe/protocol/handshake.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace toolpipe {

struct DatabaseConfig {
    std::string path = "toolpipe.db";
    bool seed = true;
};

struct LoggingConfig {
    LogLevel level = LogLevel::Warn;
    std::optional<std::string> file; // stderr when unset
    bool json = false;
};

struct ProtocolConfig {
    std::string version = kProtocolVersion;
    std::size_t max_frame_bytes = kDefaultMaxFrameBytes;
    std::set<std::string> capabilities = {kToolsCapability};
};

struct AppConfig {
    std::optional<std::string> config_file;
    DatabaseConfig database;
    LoggingConfig logging;
    ProtocolConfig protocol;
};

} // namespace toolpipe
