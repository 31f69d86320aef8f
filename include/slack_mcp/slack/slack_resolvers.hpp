#pragma once

#include <slack_mcp/core/result.hpp>
#include <slack_mcp/slack/i_slack_client.hpp>

#include <string>

namespace slack_mcp {

// "C0123ABCD", "#general" or "general" -> conversation ID. Names are looked
// up with conversations.list (public and private channels, paginated).
[[nodiscard]] Result<std::string, Error> ResolveChannelId(
    ISlackClient& slack, const std::string& reference);

// "U0123ABCD", "@jane" or "jane" -> user ID. Names match the user's handle,
// real name or display name via users.list.
[[nodiscard]] Result<std::string, Error> ResolveUserId(
    ISlackClient& slack, const std::string& reference);

// Message destination: a channel reference, or a user reference ("@jane",
// "U0123ABCD") for which a direct message conversation is opened.
[[nodiscard]] Result<std::string, Error> ResolveConversationId(
    ISlackClient& slack, const std::string& reference);

} // namespace slack_mcp
