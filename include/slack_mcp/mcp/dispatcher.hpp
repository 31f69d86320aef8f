#pragma once

#include <slack_mcp/core/result.hpp>
#include <slack_mcp/mcp/error_normalizer.hpp>
#include <slack_mcp/mcp/schema_validator.hpp>
#include <slack_mcp/mcp/tool_registry.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// ToolEnvelope - the tools/call result: one text content block, plus
// isError on failure.
// ---------------------------------------------------------------------------
struct ToolEnvelope {
    bool is_error = false;
    nlohmann::json content;  // [{"type":"text","text":...}]

    // {"content": [...]} or {"content": [...], "isError": true}
    [[nodiscard]] nlohmann::json ToJson() const;

    // The text of the single content block.
    [[nodiscard]] std::string Text() const;
};

struct DispatcherOptions {
    // Checked against each tool's input schema before it runs. nullptr
    // leaves argument checking to the tools.
    std::shared_ptr<const IArgumentValidator> validator;

    // Upper bound on one Execute(); zero means no limit.
    std::chrono::milliseconds call_timeout{0};

    // Timed calls run on helper threads. A helper outlives its call when the
    // tool overruns; at most this many may be alive at once, and further
    // timed calls fail until one finishes.
    size_t max_helper_threads = 32;

    // How long the destructor waits for outstanding helpers.
    std::chrono::milliseconds shutdown_grace{2000};
};

// ---------------------------------------------------------------------------
// Dispatcher - answers tools/list and tools/call against a read-only
// registry.
//
// CallTool never throws: every call yields exactly one envelope. Calls can
// run concurrently; the only shared state is the helper-thread count.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    explicit Dispatcher(const ToolRegistry& registry,
                        DispatcherOptions options = {});

    // Waits up to shutdown_grace for helper threads.
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // [{name, description, inputSchema}, ...] in registration order.
    [[nodiscard]] nlohmann::json ListTools() const;

    // Raw tools/call params: {"name": ..., "arguments": {...}}.
    [[nodiscard]] ToolEnvelope CallTool(const nlohmann::json& params) const noexcept;

    // Absent (null) arguments are treated as an empty object.
    [[nodiscard]] ToolEnvelope CallTool(const std::string& name,
                                        const nlohmann::json& arguments) const noexcept;

    // Resolution, validation and execution, without envelope shaping.
    [[nodiscard]] Result<nlohmann::json, DispatchFailure> Invoke(
        const std::string& name, const nlohmann::json& arguments) const;

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

    /// Helper threads still running, including ones whose call timed out.
    [[nodiscard]] size_t HelperThreads() const;

    /// Block until no helper thread is running or `timeout` passes.
    /// Returns true when none is left.
    bool WaitForHelpers(std::chrono::milliseconds timeout) const;

private:
    struct HelperCount;

    Result<nlohmann::json, DispatchFailure> ExecuteWithTimeout(
        std::shared_ptr<const ITool> tool, const nlohmann::json& arguments) const;

    const ToolRegistry& registry_;
    DispatcherOptions options_;
    std::shared_ptr<HelperCount> helpers_;
};

/// Success envelope: a string result is sent as-is, anything else as
/// pretty-printed JSON.
ToolEnvelope MakeSuccessEnvelope(const nlohmann::json& result);

/// Error envelope with {success:false, error, tool, timestamp}. `tool` is
/// omitted when empty.
ToolEnvelope MakeErrorEnvelope(const std::string& message,
                               const std::string& tool);

} // namespace slack_mcp
