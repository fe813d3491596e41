#pragma once

#include <toolpipe/protocol/schema.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolpipe {

// ---------------------------------------------------------------------------
// Protocol messages. One struct per wire `type`:
//
//   init        HandshakeRequest    client -> server
//   init_ack    HandshakeResponse   server -> client
//   list_tools  ToolListRequest     client -> server
//   tools       ToolListResponse    server -> client
//   call        CallRequest         client -> server
//   result      CallResponse        server -> client
//   error       ErrorNotice         server -> client, before a fatal close
//
// The handshake pair is singular per session and carries no correlation id.
// ---------------------------------------------------------------------------

struct HandshakeRequest {
    std::string protocol_version;
    std::set<std::string> capabilities;

    bool operator==(const HandshakeRequest& other) const {
        return protocol_version == other.protocol_version &&
               capabilities == other.capabilities;
    }
};

struct ServerInfo {
    std::string name;
    std::string version;

    bool operator==(const ServerInfo& other) const {
        return name == other.name && version == other.version;
    }
};

struct HandshakeResponse {
    std::string protocol_version;
    std::set<std::string> capabilities;
    ServerInfo server_info;
    std::vector<ToolDescriptor> tools;

    bool operator==(const HandshakeResponse& other) const {
        return protocol_version == other.protocol_version &&
               capabilities == other.capabilities &&
               server_info == other.server_info && tools == other.tools;
    }
};

struct ToolListRequest {
    std::optional<std::string> id;

    bool operator==(const ToolListRequest& other) const { return id == other.id; }
};

struct ToolListResponse {
    std::optional<std::string> id;
    std::vector<ToolDescriptor> tools;

    bool operator==(const ToolListResponse& other) const {
        return id == other.id && tools == other.tools;
    }
};

struct CallRequest {
    std::string id;
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();

    bool operator==(const CallRequest& other) const {
        return id == other.id && tool == other.tool && arguments == other.arguments;
    }
};

// Error descriptor of a failed call: {kind, message}.
struct CallError {
    std::string kind;
    std::string message;

    bool operator==(const CallError& other) const {
        return kind == other.kind && message == other.message;
    }
};

// ---------------------------------------------------------------------------
// CallResponse: either a result value or a CallError, never both.
// ---------------------------------------------------------------------------
class CallResponse {
public:
    static CallResponse Success(std::string id, nlohmann::json value);
    static CallResponse Failure(std::string id, std::string kind,
                                std::string message);

    [[nodiscard]] const std::string& Id() const noexcept { return id_; }
    [[nodiscard]] bool Ok() const noexcept { return outcome_.index() == 0; }

    // Precondition: Ok().
    [[nodiscard]] const nlohmann::json& Value() const;
    // Precondition: !Ok().
    [[nodiscard]] const CallError& Fault() const;

    bool operator==(const CallResponse& other) const {
        return id_ == other.id_ && outcome_ == other.outcome_;
    }

private:
    CallResponse(std::string id, std::variant<nlohmann::json, CallError> outcome)
        : id_(std::move(id)), outcome_(std::move(outcome)) {}

    std::string id_;
    std::variant<nlohmann::json, CallError> outcome_;
};

struct ErrorNotice {
    std::string kind;
    std::string message;
    std::optional<std::string> id;

    bool operator==(const ErrorNotice& other) const {
        return kind == other.kind && message == other.message && id == other.id;
    }
};

using Message = std::variant<HandshakeRequest, HandshakeResponse,
                             ToolListRequest, ToolListResponse,
                             CallRequest, CallResponse, ErrorNotice>;

/// The wire `type` string of a message ("init", "call", ...).
std::string_view MessageTypeName(const Message& message);

/// The correlation id a message carries, if any. The handshake pair has none.
std::optional<std::string> CorrelationId(const Message& message);

} // namespace toolpipe
