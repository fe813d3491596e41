#include <toolpipe/protocol/message.hpp>

#include <cassert>

namespace toolpipe {

CallResponse CallResponse::Success(std::string id, nlohmann::json value) {
    return CallResponse(std::move(id),
                        std::variant<nlohmann::json, CallError>(
                            std::in_place_index<0>, std::move(value)));
}

CallResponse CallResponse::Failure(std::string id, std::string kind,
                                   std::string message) {
    return CallResponse(std::move(id),
                        std::variant<nlohmann::json, CallError>(
                            std::in_place_index<1>,
                            CallError{std::move(kind), std::move(message)}));
}

const nlohmann::json& CallResponse::Value() const {
    assert(Ok() && "Value() called on a failed CallResponse");
    return std::get<0>(outcome_);
}

const CallError& CallResponse::Fault() const {
    assert(!Ok() && "Fault() called on a successful CallResponse");
    return std::get<1>(outcome_);
}

std::string_view MessageTypeName(const Message& message) {
    if (std::holds_alternative<HandshakeRequest>(message)) return "init";
    if (std::holds_alternative<HandshakeResponse>(message)) return "init_ack";
    if (std::holds_alternative<ToolListRequest>(message)) return "list_tools";
    if (std::holds_alternative<ToolListResponse>(message)) return "tools";
    if (std::holds_alternative<CallRequest>(message)) return "call";
    if (std::holds_alternative<CallResponse>(message)) return "result";
    return "error";
}

std::optional<std::string> CorrelationId(const Message& message) {
    if (const auto* call = std::get_if<CallRequest>(&message)) return call->id;
    if (const auto* result = std::get_if<CallResponse>(&message)) return result->Id();
    if (const auto* list = std::get_if<ToolListRequest>(&message)) return list->id;
    if (const auto* tools = std::get_if<ToolListResponse>(&message)) return tools->id;
    if (const auto* notice = std::get_if<ErrorNotice>(&message)) return notice->id;
    return std::nullopt;
}

} // namespace toolpipe
