#include <toolpipe/protocol/tool_registry.hpp>

#include <set>

namespace toolpipe {

Result<void, Error> ToolRegistry::Register(ToolDescriptor descriptor,
                                           ToolHandler handler) {
    if (descriptor.name.empty()) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::ArgumentValidation, "ToolRegistry::Register",
            "Tool name must not be empty"));
    }
    if (!handler) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::ArgumentValidation, "ToolRegistry::Register",
            "Tool '" + descriptor.name + "' has no handler"));
    }
    std::set<std::string> field_names;
    for (const auto& field : descriptor.input_schema.Fields()) {
        if (!field_names.insert(field.name).second) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::ArgumentValidation, "ToolRegistry::Register",
                "Tool '" + descriptor.name + "' declares field '" +
                    field.name + "' twice"));
        }
    }
    if (tools_.count(descriptor.name) > 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::DuplicateTool, "ToolRegistry::Register",
            "Tool already registered: " + descriptor.name));
    }

    descriptors_.push_back(descriptor);
    auto name = descriptor.name;
    tools_.emplace(std::move(name),
                   RegisteredTool{std::move(descriptor), std::move(handler)});
    return Result<void, Error>::Ok();
}

Result<void, Error> ToolRegistry::Register(const std::string& name,
                                           const std::string& description,
                                           InputSchema input_schema,
                                           ToolHandler handler) {
    return Register(ToolDescriptor{name, description, std::move(input_schema)},
                    std::move(handler));
}

Result<const RegisteredTool*, Error> ToolRegistry::Lookup(
    const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return Result<const RegisteredTool*, Error>::Err(Error::Make(
            ErrorCategory::UnknownTool, "ToolRegistry::Lookup",
            "Unknown tool: " + name));
    }
    return Result<const RegisteredTool*, Error>::Ok(&it->second);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return tools_.count(name) > 0;
}

} // namespace toolpipe
