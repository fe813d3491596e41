#pragma once

#include <toolpipe/core/result.hpp>
#include <toolpipe/protocol/message.hpp>
#include <toolpipe/protocol/tool_registry.hpp>

#include <set>
#include <string>
#include <string_view>

namespace toolpipe {

constexpr const char* kProtocolVersion = "1.0";

// The only capability this server implements. Calls are dispatched strictly
// in arrival order, so no concurrency capability exists.
constexpr const char* kToolsCapability = "tools";

[[nodiscard]] bool IsSupportedCapability(std::string_view name);

// ---------------------------------------------------------------------------
// ProtocolVersion: "MAJOR.MINOR" with an optional ".PATCH".
//
// Compatible means same major; the minor may differ and the session runs at
// the lower of the two.
// ---------------------------------------------------------------------------
struct ProtocolVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;

    static Result<ProtocolVersion, Error> Parse(std::string_view text);

    [[nodiscard]] bool CompatibleWith(const ProtocolVersion& other) const noexcept {
        return major == other.major;
    }

    [[nodiscard]] std::string ToString() const;
};

// What the server declares about itself during the handshake.
struct ServerProfile {
    std::string name;
    std::string version;
    std::string protocol_version = kProtocolVersion;
    std::set<std::string> capabilities = {kToolsCapability};
};

// Profile with the build's server name and version filled in.
ServerProfile DefaultServerProfile();

enum class HandshakeState {
    Start,
    AwaitingClientInit,
    Negotiated,
    Failed,
};

const char* HandshakeStateName(HandshakeState state);

// ---------------------------------------------------------------------------
// HandshakeCoordinator: one-time version/capability negotiation.
//
//   Start --Begin()--> AwaitingClientInit --init ok--> Negotiated
//                                         \--other--> Failed
//
// Handle() returns the init_ack to send, or:
//   ProtocolSequence  a non-init message before negotiation, or any init
//                     after it (a second handshake)
//   VersionMismatch   different major version or unparseable version
// The response lists the full tool catalog; nothing is advertised on
// failure.
// ---------------------------------------------------------------------------
class HandshakeCoordinator {
public:
    HandshakeCoordinator(const ToolRegistry& registry, ServerProfile profile);

    void Begin();

    [[nodiscard]] Result<HandshakeResponse, Error> Handle(const Message& message);

    [[nodiscard]] HandshakeState State() const noexcept { return state_; }
    [[nodiscard]] bool IsNegotiated() const noexcept {
        return state_ == HandshakeState::Negotiated;
    }

    [[nodiscard]] const std::string& NegotiatedVersion() const noexcept {
        return negotiated_version_;
    }
    [[nodiscard]] const std::set<std::string>& NegotiatedCapabilities() const noexcept {
        return negotiated_capabilities_;
    }

private:
    Result<HandshakeResponse, Error> Fail(ErrorCategory category,
                                          const std::string& message);

    const ToolRegistry& registry_;
    ServerProfile profile_;
    HandshakeState state_ = HandshakeState::Start;
    std::string negotiated_version_;
    std::set<std::string> negotiated_capabilities_;
};

} // namespace toolpipe
