#include <toolpipe/protocol/dispatcher.hpp>

#include <toolpipe/core/log.hpp>

#include <exception>

namespace toolpipe {

namespace {

constexpr const char* kComponent = "dispatcher";

// Runs the handler. Whatever goes wrong inside it comes back as an Error;
// nothing escapes to the session loop.
Result<nlohmann::json, Error> InvokeHandler(const RegisteredTool& tool,
                                            const nlohmann::json& arguments) {
    const auto& name = tool.descriptor.name;
    try {
        return tool.handler(arguments);
    } catch (const DomainError& e) {
        return Result<nlohmann::json, Error>::Err(
            Error::Make(ErrorCategory::Domain, name, e.what()));
    } catch (const std::exception& e) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorCategory::Domain, name,
            std::string("Failed to execute tool '") + name + "': " + e.what()));
    } catch (...) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorCategory::Domain, name,
            "Failed to execute tool '" + name + "': unknown exception"));
    }
}

} // anonymous namespace

CallResponse Dispatcher::Dispatch(const CallRequest& request) const {
    LogInfo(kComponent, "call " + request.id + ": " + request.tool);
    if (GlobalLogger().Enabled(LogLevel::Debug)) {
        LogDebug(kComponent, "call " + request.id + " arguments: " +
                                 request.arguments.dump(-1, ' ', false,
                                     nlohmann::json::error_handler_t::replace));
    }

    auto tool = registry_.Lookup(request.tool);
    if (tool.IsErr()) {
        LogWarn(kComponent, "call " + request.id + ": " + tool.Error().message);
        return CallResponse::Failure(request.id, tool.Error().KindName(),
                                     tool.Error().message);
    }
    const RegisteredTool& entry = *tool.Value();

    auto valid = entry.descriptor.input_schema.Validate(request.arguments);
    if (valid.IsErr()) {
        const auto message = "Invalid arguments for '" + request.tool + "': " +
                             valid.Error().message;
        LogWarn(kComponent, "call " + request.id + ": " + message);
        return CallResponse::Failure(request.id, valid.Error().KindName(), message);
    }

    auto outcome = InvokeHandler(entry, request.arguments);
    if (outcome.IsErr()) {
        // Whatever category the handler chose, to the client it is a
        // failure of the backing operation.
        auto error = std::move(outcome).Error();
        error.correlation_id = request.id;
        LogWarn(kComponent, "call failed: " + error.ToString());
        return CallResponse::Failure(request.id, "DomainError", error.message);
    }

    LogDebug(kComponent, "call " + request.id + " succeeded");
    return CallResponse::Success(request.id, std::move(outcome).Value());
}

ToolListResponse Dispatcher::ListTools(const ToolListRequest& request) const {
    LogInfo(kComponent, "list_tools: " + std::to_string(registry_.Size()) + " tools");
    return ToolListResponse{request.id, registry_.List()};
}

} // namespace toolpipe
