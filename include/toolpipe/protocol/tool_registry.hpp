#pragma once

#include <toolpipe/core/result.hpp>
#include <toolpipe/protocol/schema.hpp>

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolpipe {

// ---------------------------------------------------------------------------
// DomainError: what a tool handler throws when its backing operation fails.
// Handlers may equally return Result::Err; both reach the client as a
// DomainError response.
// ---------------------------------------------------------------------------
class DomainError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A tool handler receives arguments already validated against its schema.
using ToolHandler =
    std::function<Result<nlohmann::json, Error>(const nlohmann::json& arguments)>;

struct RegisteredTool {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

// ---------------------------------------------------------------------------
// ToolRegistry: the server's tool catalog.
//
// Populated once at startup. Sessions only ever see it as const&, so the
// catalog a client was shown cannot change under it.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Fails with DuplicateTool if the name is taken, ArgumentValidation if
    // the descriptor is ill-formed (empty name, repeated field names) or
    // the handler is empty.
    [[nodiscard]] Result<void, Error> Register(ToolDescriptor descriptor,
                                               ToolHandler handler);

    [[nodiscard]] Result<void, Error> Register(const std::string& name,
                                               const std::string& description,
                                               InputSchema input_schema,
                                               ToolHandler handler);

    // Fails with UnknownTool. The pointer stays valid for the registry's
    // lifetime.
    [[nodiscard]] Result<const RegisteredTool*, Error> Lookup(
        const std::string& name) const;

    // Registration order.
    [[nodiscard]] const std::vector<ToolDescriptor>& List() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;
    [[nodiscard]] std::size_t Size() const noexcept { return descriptors_.size(); }

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, RegisteredTool> tools_;
};

} // namespace toolpipe
