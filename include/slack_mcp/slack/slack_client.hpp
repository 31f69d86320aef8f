#pragma once

#include <slack_mcp/core/types.hpp>
#include <slack_mcp/slack/i_slack_client.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace slack_mcp {

constexpr const char* kDefaultSlackApiUrl = "https://slack.com/api";
constexpr const char* kUserTokenMissingMessage =
    "User token not configured. Set SLACK_USER_TOKEN environment variable.";

// ---------------------------------------------------------------------------
// SlackClientOptions - HTTP behaviour of SlackClient.
// ---------------------------------------------------------------------------
struct SlackClientOptions {
    std::string api_url = kDefaultSlackApiUrl;
    std::chrono::milliseconds timeout{30000};
    int max_retries = 3;
    // First retry delay; doubled on every further attempt.
    std::chrono::milliseconds base_backoff{1000};
    // Upper bound on any single wait, including a server-sent Retry-After.
    std::chrono::milliseconds max_backoff{30000};
};

// ---------------------------------------------------------------------------
// SlackClient - ISlackClient over cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header.
//
// Features:
//   - form-encoded POST to <api_url>/<method> with a Bearer token
//   - separate bot and (optional) user credentials
//   - retry on HTTP 429 (Retry-After honoured), 5xx, transport errors and
//     retryable Slack error codes, with exponential backoff
//   - Slack error codes mapped to friendly messages
// ---------------------------------------------------------------------------
class SlackClient : public ISlackClient {
public:
    SlackClient(SlackToken bot_token,
                std::optional<SlackToken> user_token,
                const SlackClientOptions& options = {});

    ~SlackClient() override;

    SlackClient(const SlackClient&) = delete;
    SlackClient& operator=(const SlackClient&) = delete;
    SlackClient(SlackClient&&) = delete;
    SlackClient& operator=(SlackClient&&) = delete;

    [[nodiscard]] Result<nlohmann::json, Error> Call(
        const std::string& method,
        const nlohmann::json& params,
        TokenKind token = TokenKind::Bot) override;

    [[nodiscard]] bool HasUserToken() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace slack_mcp
