#include <slack_mcp/mcp/tool_registry.hpp>

#include <slack_mcp/core/log.hpp>
#include <slack_mcp/core/types.hpp>

namespace slack_mcp {

namespace {

Error MakeRegistrationError(const std::string& name, const std::string& message) {
    return Error{"RegisterTool", name, std::nullopt, message, std::nullopt,
                 ErrorCategory::Registration};
}

} // anonymous namespace

Result<void, Error> ToolRegistry::Register(std::unique_ptr<ITool> tool) {
    if (!tool) {
        return Result<void, Error>::Err(
            MakeRegistrationError("", "Cannot register a null tool"));
    }

    const std::string name = tool->Name();
    auto name_result = ToolName::Create(name);
    if (name_result.IsErr()) {
        return Result<void, Error>::Err(
            MakeRegistrationError(name, name_result.Error()));
    }
    if (by_name_.count(name) > 0) {
        return Result<void, Error>::Err(MakeRegistrationError(
            name, "Tool '" + name + "' is already registered"));
    }

    schemas_.push_back({name, tool->Description(), tool->InputSchema()});
    LogDebug("registry", "Registered tool: " + name);
    by_name_.emplace(name, std::shared_ptr<const ITool>(std::move(tool)));
    return Result<void, Error>::Ok();
}

Result<void, Error> ToolRegistry::Register(const std::string& name,
                                           const std::string& description,
                                           const nlohmann::json& input_schema,
                                           ToolHandler handler) {
    return Register(std::make_unique<FunctionTool>(
        name, description, input_schema, std::move(handler)));
}

std::shared_ptr<const ITool> ToolRegistry::Lookup(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return nullptr;
    return it->second;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return by_name_.count(name) > 0;
}

std::vector<std::string> ToolRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& schema : schemas_) {
        names.push_back(schema.name);
    }
    return names;
}

nlohmann::json ToolRegistry::Stats() const {
    return {{"totalTools", schemas_.size()}, {"toolNames", Names()}};
}

} // namespace slack_mcp
