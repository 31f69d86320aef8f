#pragma once

#include <slack_mcp/core/result.hpp>
#include <slack_mcp/mcp/tool.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// ToolRegistry - catalog of MCP tools.
//
// Populated once at startup, then only read. Lookup is O(1); enumeration
// follows registration order. No internal locking: const access from several
// threads is safe as long as nobody registers concurrently.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) noexcept = default;
    ToolRegistry& operator=(ToolRegistry&&) noexcept = default;

    // Fails (ErrorCategory::Registration) on a null tool, an invalid name,
    // or a name that is already registered. The registry is unchanged then.
    [[nodiscard]] Result<void, Error> Register(std::unique_ptr<ITool> tool);

    [[nodiscard]] Result<void, Error> Register(const std::string& name,
                                               const std::string& description,
                                               const nlohmann::json& input_schema,
                                               ToolHandler handler);

    // Empty when no tool has that name. Shared ownership lets a timed-out
    // call keep its tool alive after the caller has moved on.
    [[nodiscard]] std::shared_ptr<const ITool> Lookup(const std::string& name) const;

    [[nodiscard]] const std::vector<ToolSchema>& ListAll() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;
    [[nodiscard]] size_t Size() const noexcept { return schemas_.size(); }
    [[nodiscard]] std::vector<std::string> Names() const;

    // {"totalTools": N, "toolNames": [...]}
    [[nodiscard]] nlohmann::json Stats() const;

private:
    std::vector<ToolSchema> schemas_;
    std::unordered_map<std::string, std::shared_ptr<const ITool>> by_name_;
};

} // namespace slack_mcp
