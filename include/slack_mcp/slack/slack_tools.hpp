#pragma once

#include <slack_mcp/core/result.hpp>
#include <slack_mcp/mcp/tool_registry.hpp>
#include <slack_mcp/slack/i_slack_client.hpp>

#include <memory>

namespace slack_mcp {

// Register the Slack tool set (slack_send_message, slack_list_channels, ...).
// Every tool holds a reference on `slack`, so a call abandoned by the
// dispatcher's timeout can still finish. Fails on the first tool that cannot
// be registered.
[[nodiscard]] Result<void, Error> RegisterSlackTools(
    ToolRegistry& registry, std::shared_ptr<ISlackClient> slack);

} // namespace slack_mcp
