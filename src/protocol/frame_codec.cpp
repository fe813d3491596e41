#include <toolpipe/protocol/frame_codec.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace toolpipe {

namespace {

using json = nlohmann::json;

Error FrameError(const std::string& message) {
    return Error::Make(ErrorCategory::Framing, "FrameDecoder", message);
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

json StringArray(const std::set<std::string>& values) {
    json array = json::array();
    for (const auto& v : values) array.push_back(v);
    return array;
}

json ToolArray(const std::vector<ToolDescriptor>& tools) {
    json array = json::array();
    for (const auto& tool : tools) array.push_back(ToolDescriptorToJson(tool));
    return array;
}

json ToJson(const HandshakeRequest& m) {
    return {{"type", "init"},
            {"protocolVersion", m.protocol_version},
            {"clientCapabilities", StringArray(m.capabilities)}};
}

json ToJson(const HandshakeResponse& m) {
    return {{"type", "init_ack"},
            {"protocolVersion", m.protocol_version},
            {"serverCapabilities", StringArray(m.capabilities)},
            {"serverInfo", {{"name", m.server_info.name},
                            {"version", m.server_info.version}}},
            {"tools", ToolArray(m.tools)}};
}

json ToJson(const ToolListRequest& m) {
    json j = {{"type", "list_tools"}};
    if (m.id) j["id"] = *m.id;
    return j;
}

json ToJson(const ToolListResponse& m) {
    json j = {{"type", "tools"}, {"tools", ToolArray(m.tools)}};
    if (m.id) j["id"] = *m.id;
    return j;
}

json ToJson(const CallRequest& m) {
    return {{"type", "call"},
            {"id", m.id},
            {"tool", m.tool},
            {"arguments", m.arguments}};
}

json ToJson(const CallResponse& m) {
    json j = {{"type", "result"}, {"id", m.Id()}, {"ok", m.Ok()}};
    if (m.Ok()) {
        j["value"] = m.Value();
    } else {
        j["error"] = {{"kind", m.Fault().kind}, {"message", m.Fault().message}};
    }
    return j;
}

json ToJson(const ErrorNotice& m) {
    json j = {{"type", "error"}, {"kind", m.kind}, {"message", m.message}};
    if (m.id) j["id"] = *m.id;
    return j;
}

// ---------------------------------------------------------------------------
// Decoding helpers
// ---------------------------------------------------------------------------

Result<std::string, Error> RequireString(const json& j, const char* key,
                                         std::string_view type) {
    if (!j.contains(key) || !j[key].is_string()) {
        return Result<std::string, Error>::Err(FrameError(
            "'" + std::string(type) + "' message needs a string '" + key + "'"));
    }
    return Result<std::string, Error>::Ok(j[key].get<std::string>());
}

// Correlation ids are strings; integers are accepted and stringified.
std::optional<std::string> IdFromJson(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_unsigned()) return std::to_string(value.get<std::uint64_t>());
    if (value.is_number_integer()) return std::to_string(value.get<std::int64_t>());
    return std::nullopt;
}

Result<std::string, Error> RequireId(const json& j, std::string_view type) {
    std::optional<std::string> id;
    if (j.contains("id")) id = IdFromJson(j["id"]);
    if (!id) {
        return Result<std::string, Error>::Err(FrameError(
            "'" + std::string(type) + "' message needs a string 'id'"));
    }
    return Result<std::string, Error>::Ok(std::move(*id));
}

Result<std::optional<std::string>, Error> OptionalId(const json& j,
                                                     std::string_view type) {
    using R = Result<std::optional<std::string>, Error>;
    if (!j.contains("id") || j["id"].is_null()) {
        return R::Ok(std::optional<std::string>());
    }
    auto id = IdFromJson(j["id"]);
    if (!id) {
        return R::Err(FrameError("'" + std::string(type) +
                                 "' message has an invalid 'id'"));
    }
    return R::Ok(std::optional<std::string>(std::move(*id)));
}

Result<std::set<std::string>, Error> StringSet(const json& j, const char* key) {
    using R = Result<std::set<std::string>, Error>;
    std::set<std::string> values;
    if (!j.contains(key)) return R::Ok(std::move(values));
    const auto& array = j[key];
    if (!array.is_array()) {
        return R::Err(FrameError(std::string("'") + key + "' must be an array"));
    }
    for (const auto& entry : array) {
        if (!entry.is_string()) {
            return R::Err(FrameError(std::string("'") + key +
                                     "' must contain only strings"));
        }
        values.insert(entry.get<std::string>());
    }
    return R::Ok(std::move(values));
}

Result<std::vector<ToolDescriptor>, Error> ToolVector(const json& j) {
    using R = Result<std::vector<ToolDescriptor>, Error>;
    if (!j.contains("tools") || !j["tools"].is_array()) {
        return R::Err(FrameError("'tools' must be an array"));
    }
    std::vector<ToolDescriptor> tools;
    for (const auto& entry : j["tools"]) {
        auto tool = ToolDescriptorFromJson(entry);
        if (tool.IsErr()) {
            return R::Err(FrameError("invalid tool descriptor: " +
                                     tool.Error().message));
        }
        tools.push_back(std::move(tool).Value());
    }
    return R::Ok(std::move(tools));
}

// Each decoder below returns Result<Message, Error>.
using MessageResult = Result<Message, Error>;

MessageResult DecodeInit(const json& j) {
    auto version = RequireString(j, "protocolVersion", "init");
    if (version.IsErr()) return MessageResult::Err(version.Error());
    auto caps = StringSet(j, "clientCapabilities");
    if (caps.IsErr()) return MessageResult::Err(caps.Error());
    return MessageResult::Ok(Message(HandshakeRequest{
        std::move(version).Value(), std::move(caps).Value()}));
}

MessageResult DecodeInitAck(const json& j) {
    auto version = RequireString(j, "protocolVersion", "init_ack");
    if (version.IsErr()) return MessageResult::Err(version.Error());
    auto caps = StringSet(j, "serverCapabilities");
    if (caps.IsErr()) return MessageResult::Err(caps.Error());
    auto tools = ToolVector(j);
    if (tools.IsErr()) return MessageResult::Err(tools.Error());

    ServerInfo info;
    if (j.contains("serverInfo") && !j["serverInfo"].is_null()) {
        const auto& si = j["serverInfo"];
        if (!si.is_object()) {
            return MessageResult::Err(FrameError("'serverInfo' must be an object"));
        }
        for (const char* key : {"name", "version"}) {
            if (si.contains(key) && !si[key].is_string()) {
                return MessageResult::Err(FrameError(
                    "'serverInfo' needs a string '" + std::string(key) + "'"));
            }
        }
        if (si.contains("name")) info.name = si["name"].get<std::string>();
        if (si.contains("version")) info.version = si["version"].get<std::string>();
    }
    return MessageResult::Ok(Message(HandshakeResponse{
        std::move(version).Value(), std::move(caps).Value(), std::move(info),
        std::move(tools).Value()}));
}

MessageResult DecodeListTools(const json& j) {
    auto id = OptionalId(j, "list_tools");
    if (id.IsErr()) return MessageResult::Err(id.Error());
    return MessageResult::Ok(Message(ToolListRequest{std::move(id).Value()}));
}

MessageResult DecodeTools(const json& j) {
    auto id = OptionalId(j, "tools");
    if (id.IsErr()) return MessageResult::Err(id.Error());
    auto tools = ToolVector(j);
    if (tools.IsErr()) return MessageResult::Err(tools.Error());
    return MessageResult::Ok(Message(ToolListResponse{
        std::move(id).Value(), std::move(tools).Value()}));
}

MessageResult DecodeCall(const json& j) {
    auto id = RequireId(j, "call");
    if (id.IsErr()) return MessageResult::Err(id.Error());
    auto tool = RequireString(j, "tool", "call");
    if (tool.IsErr()) return MessageResult::Err(tool.Error());

    CallRequest call;
    call.id = std::move(id).Value();
    call.tool = std::move(tool).Value();
    if (j.contains("arguments") && !j["arguments"].is_null()) {
        call.arguments = j["arguments"];
    }
    return MessageResult::Ok(Message(std::move(call)));
}

MessageResult DecodeResult(const json& j) {
    auto id = RequireId(j, "result");
    if (id.IsErr()) return MessageResult::Err(id.Error());
    if (!j.contains("ok") || !j["ok"].is_boolean()) {
        return MessageResult::Err(FrameError("'result' message needs a boolean 'ok'"));
    }
    if (j["ok"].get<bool>()) {
        json value = j.contains("value") ? j["value"] : json();
        return MessageResult::Ok(Message(
            CallResponse::Success(std::move(id).Value(), std::move(value))));
    }
    if (!j.contains("error") || !j["error"].is_object()) {
        return MessageResult::Err(FrameError("failed 'result' needs an 'error' object"));
    }
    auto kind = RequireString(j["error"], "kind", "result");
    if (kind.IsErr()) return MessageResult::Err(kind.Error());
    auto message = RequireString(j["error"], "message", "result");
    if (message.IsErr()) return MessageResult::Err(message.Error());
    return MessageResult::Ok(Message(CallResponse::Failure(
        std::move(id).Value(), std::move(kind).Value(), std::move(message).Value())));
}

MessageResult DecodeErrorNotice(const json& j) {
    auto kind = RequireString(j, "kind", "error");
    if (kind.IsErr()) return MessageResult::Err(kind.Error());
    auto message = RequireString(j, "message", "error");
    if (message.IsErr()) return MessageResult::Err(message.Error());
    auto id = OptionalId(j, "error");
    if (id.IsErr()) return MessageResult::Err(id.Error());
    return MessageResult::Ok(Message(ErrorNotice{
        std::move(kind).Value(), std::move(message).Value(), std::move(id).Value()}));
}

bool IsBlank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public mapping
// ---------------------------------------------------------------------------
nlohmann::json MessageToJson(const Message& message) {
    return std::visit([](const auto& m) { return ToJson(m); }, message);
}

Result<Message, Error> MessageFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return MessageResult::Err(FrameError("frame is not a JSON object"));
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        return MessageResult::Err(FrameError("frame has no string 'type'"));
    }

    const auto type = j["type"].get<std::string>();
    if (type == "init") return DecodeInit(j);
    if (type == "init_ack") return DecodeInitAck(j);
    if (type == "list_tools") return DecodeListTools(j);
    if (type == "tools") return DecodeTools(j);
    if (type == "call") return DecodeCall(j);
    if (type == "result") return DecodeResult(j);
    if (type == "error") return DecodeErrorNotice(j);
    return MessageResult::Err(FrameError("unknown message type '" + type + "'"));
}

std::string EncodeFrame(const Message& message) {
    auto frame = MessageToJson(message).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    frame.push_back('\n');
    return frame;
}

// ---------------------------------------------------------------------------
// FrameDecoder
// ---------------------------------------------------------------------------
namespace {

// MessageFromJson, with any json exception reported as a Framing error.
MessageResult DecodeParsed(const json& j) {
    try {
        return MessageFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        return MessageResult::Err(FrameError(std::string("invalid frame: ") + e.what()));
    }
}

} // anonymous namespace

FrameDecoder::FrameDecoder(std::size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

void FrameDecoder::Feed(std::string_view bytes) {
    if (fault_) return;
    buffer_.append(bytes.data(), bytes.size());
}

FrameDecoder::NextResult FrameDecoder::Fail(Error error) {
    buffer_.clear();
    scan_pos_ = 0;
    fault_ = error;
    return NextResult::Err(std::move(error));
}

FrameDecoder::NextResult FrameDecoder::Next() {
    if (fault_) return NextResult::Err(*fault_);

    while (true) {
        const auto newline = buffer_.find('\n', scan_pos_);
        if (newline == std::string::npos) {
            scan_pos_ = buffer_.size();
            if (buffer_.size() > max_frame_bytes_) {
                return Fail(FrameError(
                    "frame exceeds " + std::to_string(max_frame_bytes_) +
                    " bytes without a terminator"));
            }
            return NextResult::Ok(std::optional<Message>());
        }

        std::string frame = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);
        scan_pos_ = 0;

        if (!frame.empty() && frame.back() == '\r') frame.pop_back();
        if (frame.size() > max_frame_bytes_) {
            return Fail(FrameError("frame of " + std::to_string(frame.size()) +
                                   " bytes exceeds limit of " +
                                   std::to_string(max_frame_bytes_)));
        }
        if (IsBlank(frame)) continue;

        // Anything nested past the limit is discarded while parsing, so a
        // hostile frame never becomes a deep tree.
        bool too_deep = false;
        const nlohmann::json::parser_callback_t depth_guard =
            [&too_deep](int depth, nlohmann::json::parse_event_t /*event*/,
                        nlohmann::json& /*parsed*/) {
                if (depth > kMaxFrameDepth) {
                    too_deep = true;
                    return false;
                }
                return true;
            };

        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(frame, depth_guard);
        } catch (const nlohmann::json::parse_error& e) {
            return Fail(FrameError(std::string("malformed JSON: ") + e.what()));
        }
        if (too_deep) {
            return Fail(FrameError("frame nests deeper than " +
                                   std::to_string(kMaxFrameDepth) + " levels"));
        }

        auto message = DecodeParsed(parsed);
        if (message.IsErr()) return Fail(std::move(message).Error());
        return NextResult::Ok(std::optional<Message>(std::move(message).Value()));
    }
}

bool FrameDecoder::HasPartialFrame() const {
    return !IsBlank(buffer_);
}

} // namespace toolpipe
