#pragma once

#include <toolpipe/protocol/message.hpp>
#include <toolpipe/protocol/tool_registry.hpp>

namespace toolpipe {

// ---------------------------------------------------------------------------
// Dispatcher: turns one CallRequest into exactly one CallResponse with the
// same id.
//
//   1. look up the tool                 -> UnknownToolError
//   2. validate arguments vs. schema    -> ArgumentValidationError
//   3. invoke the handler synchronously -> DomainError (returned or thrown)
//   4. wrap the value                   -> ok:true
//
// Per-call failures are always answered, never raised; the session
// continues after any of them.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    explicit Dispatcher(const ToolRegistry& registry) : registry_(registry) {}

    [[nodiscard]] CallResponse Dispatch(const CallRequest& request) const;

    [[nodiscard]] ToolListResponse ListTools(const ToolListRequest& request) const;

private:
    const ToolRegistry& registry_;
};

} // namespace toolpipe
