#pragma once

#include <slack_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace slack_mcp {

// Human-readable text for a Slack platform error code ("channel_not_found",
// "missing_scope", ...). nullopt for codes without a curated message.
[[nodiscard]] std::optional<std::string> FriendlySlackMessage(std::string_view code);

// "<friendly text> (<code>)", or "Slack API error: <code> (<code>)" for
// unknown codes.
[[nodiscard]] std::string DescribeSlackError(const std::string& code);

[[nodiscard]] ErrorCategory CategoryForSlackError(std::string_view code);

// True for codes worth retrying after a delay (rate limits, transient
// server-side failures).
[[nodiscard]] bool IsRetryableSlackError(std::string_view code);

// Error for an `"ok": false` response of `method`.
[[nodiscard]] Error MakeSlackApiError(const std::string& method,
                                      const std::string& code);

} // namespace slack_mcp
