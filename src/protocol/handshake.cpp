#include <toolpipe/protocol/handshake.hpp>

#include <toolpipe/core/log.hpp>
#include <toolpipe/core/version.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <vector>

namespace toolpipe {

namespace {

constexpr const char* kComponent = "handshake";

// Parses a non-empty run of digits. Returns -1 on anything else.
int ParseComponent(std::string_view text) {
    if (text.empty() || text.size() > 6) return -1;
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
        value = value * 10 + (c - '0');
    }
    return value;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ProtocolVersion
// ---------------------------------------------------------------------------
Result<ProtocolVersion, Error> ProtocolVersion::Parse(std::string_view text) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto dot = text.find('.', start);
        parts.push_back(text.substr(start, dot == std::string_view::npos
                                               ? std::string_view::npos
                                               : dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    if (parts.size() < 2 || parts.size() > 3) {
        return Result<ProtocolVersion, Error>::Err(Error::Make(
            ErrorCategory::VersionMismatch, "ProtocolVersion::Parse",
            "Malformed protocol version '" + std::string(text) +
                "', expected MAJOR.MINOR[.PATCH]"));
    }

    ProtocolVersion version;
    version.major = ParseComponent(parts[0]);
    version.minor = ParseComponent(parts[1]);
    version.patch = parts.size() == 3 ? ParseComponent(parts[2]) : 0;
    if (version.major < 0 || version.minor < 0 || version.patch < 0) {
        return Result<ProtocolVersion, Error>::Err(Error::Make(
            ErrorCategory::VersionMismatch, "ProtocolVersion::Parse",
            "Malformed protocol version '" + std::string(text) + "'"));
    }
    return Result<ProtocolVersion, Error>::Ok(version);
}

std::string ProtocolVersion::ToString() const {
    return std::to_string(major) + "." + std::to_string(minor);
}

bool IsSupportedCapability(std::string_view name) {
    return name == kToolsCapability;
}

ServerProfile DefaultServerProfile() {
    ServerProfile profile;
    profile.name = kServerName;
    profile.version = kVersion;
    return profile;
}

const char* HandshakeStateName(HandshakeState state) {
    switch (state) {
        case HandshakeState::Start:              return "Start";
        case HandshakeState::AwaitingClientInit: return "AwaitingClientInit";
        case HandshakeState::Negotiated:         return "Negotiated";
        case HandshakeState::Failed:             return "Failed";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// HandshakeCoordinator
// ---------------------------------------------------------------------------
HandshakeCoordinator::HandshakeCoordinator(const ToolRegistry& registry,
                                           ServerProfile profile)
    : registry_(registry), profile_(std::move(profile)) {}

void HandshakeCoordinator::Begin() {
    if (state_ == HandshakeState::Start) {
        state_ = HandshakeState::AwaitingClientInit;
    }
}

Result<HandshakeResponse, Error> HandshakeCoordinator::Fail(
    ErrorCategory category, const std::string& message) {
    // A second init after a successful negotiation does not undo it; the
    // session closes on the returned error either way.
    if (state_ != HandshakeState::Negotiated) {
        state_ = HandshakeState::Failed;
    }
    LogWarn(kComponent, message);
    return Result<HandshakeResponse, Error>::Err(
        Error::Make(category, "HandshakeCoordinator", message));
}

Result<HandshakeResponse, Error> HandshakeCoordinator::Handle(
    const Message& message) {
    const auto* init = std::get_if<HandshakeRequest>(&message);

    switch (state_) {
        case HandshakeState::Start:
            return Fail(ErrorCategory::ProtocolSequence,
                        "Handshake received before the session was opened");
        case HandshakeState::Negotiated:
            return Fail(ErrorCategory::ProtocolSequence,
                        init ? "Duplicate handshake: session is already negotiated"
                             : std::string("Unexpected '") +
                                   std::string(MessageTypeName(message)) +
                                   "' message for the handshake coordinator");
        case HandshakeState::Failed:
            return Fail(ErrorCategory::ProtocolSequence,
                        "Handshake already failed");
        case HandshakeState::AwaitingClientInit:
            break;
    }

    if (init == nullptr) {
        return Fail(ErrorCategory::ProtocolSequence,
                    "Expected 'init' as the first message, got '" +
                        std::string(MessageTypeName(message)) + "'");
    }

    auto server_version = ProtocolVersion::Parse(profile_.protocol_version);
    if (server_version.IsErr()) {
        return Fail(ErrorCategory::Internal,
                    "Server protocol version is invalid: " +
                        server_version.Error().message);
    }
    auto client_version = ProtocolVersion::Parse(init->protocol_version);
    if (client_version.IsErr()) {
        return Fail(ErrorCategory::VersionMismatch, client_version.Error().message);
    }
    if (!client_version.Value().CompatibleWith(server_version.Value())) {
        return Fail(ErrorCategory::VersionMismatch,
                    "Client protocol version " + init->protocol_version +
                        " is incompatible with server version " +
                        profile_.protocol_version);
    }

    ProtocolVersion negotiated = server_version.Value();
    negotiated.minor = std::min(client_version.Value().minor,
                                server_version.Value().minor);
    negotiated_version_ = negotiated.ToString();

    negotiated_capabilities_.clear();
    std::set_intersection(init->capabilities.begin(), init->capabilities.end(),
                          profile_.capabilities.begin(), profile_.capabilities.end(),
                          std::inserter(negotiated_capabilities_,
                                        negotiated_capabilities_.end()));

    state_ = HandshakeState::Negotiated;
    LogInfo(kComponent, "Negotiated protocol " + negotiated_version_ + " with " +
                            std::to_string(negotiated_capabilities_.size()) +
                            " shared capabilities, advertising " +
                            std::to_string(registry_.Size()) + " tools");

    HandshakeResponse response;
    response.protocol_version = negotiated_version_;
    response.capabilities = negotiated_capabilities_;
    response.server_info = ServerInfo{profile_.name, profile_.version};
    response.tools = registry_.List();
    return Result<HandshakeResponse, Error>::Ok(std::move(response));
}

} // namespace toolpipe
