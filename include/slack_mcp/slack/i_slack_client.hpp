#pragma once

#include <slack_mcp/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace slack_mcp {

// Which credential a Web API call is made with. search.* and a few profile
// methods only accept a user token.
enum class TokenKind {
    Bot,
    User,
};

// ---------------------------------------------------------------------------
// ISlackClient - abstract Slack Web API client.
//
// Tools depend on this interface rather than on the HTTP client, so they can
// be tested offline against MockSlackClient.
//
// Call() returns the decoded response body of a successful (`"ok": true`)
// call. HTTP failures and `"ok": false` responses come back as Err with a
// client-safe message. Implementations must allow concurrent calls.
// ---------------------------------------------------------------------------
class ISlackClient {
public:
    virtual ~ISlackClient() = default;

    // Non-copyable, non-movable (polymorphic base).
    ISlackClient(const ISlackClient&) = delete;
    ISlackClient& operator=(const ISlackClient&) = delete;
    ISlackClient(ISlackClient&&) = delete;
    ISlackClient& operator=(ISlackClient&&) = delete;

    [[nodiscard]] virtual Result<nlohmann::json, Error> Call(
        const std::string& method,
        const nlohmann::json& params,
        TokenKind token = TokenKind::Bot) = 0;

    [[nodiscard]] virtual bool HasUserToken() const = 0;

protected:
    ISlackClient() = default;
};

} // namespace slack_mcp
