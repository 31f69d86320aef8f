#pragma once

#include <slack_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// ToolName - validated MCP tool name.
//
// Rules:
//   - 1 to 64 characters
//   - ASCII letters, digits, '_' and '-'
// ---------------------------------------------------------------------------
class ToolName {
public:
    static Result<ToolName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ToolName& other) const { return value_ == other.value_; }
    bool operator!=(const ToolName& other) const { return value_ != other.value_; }

private:
    explicit ToolName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// SlackToken - Slack API token (xoxb-, xoxp-, xoxa-, xoxe-, xapp-).
//
// Redacted() is the only form that may appear in logs.
// ---------------------------------------------------------------------------
class SlackToken {
public:
    static Result<SlackToken, std::string> Create(std::string_view token);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    /// "xoxb-****" - prefix kept, secret part masked.
    [[nodiscard]] std::string Redacted() const;

    bool operator==(const SlackToken& other) const { return value_ == other.value_; }
    bool operator!=(const SlackToken& other) const { return value_ != other.value_; }

private:
    explicit SlackToken(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ChannelId - Slack conversation ID: C (public), G (private/group) or
// D (direct message) followed by at least 8 uppercase letters or digits.
// ---------------------------------------------------------------------------
class ChannelId {
public:
    static Result<ChannelId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ChannelId& other) const { return value_ == other.value_; }
    bool operator!=(const ChannelId& other) const { return value_ != other.value_; }

private:
    explicit ChannelId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// UserId - Slack user ID: U or W followed by at least 8 uppercase letters
// or digits.
// ---------------------------------------------------------------------------
class UserId {
public:
    static Result<UserId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const UserId& other) const { return value_ == other.value_; }
    bool operator!=(const UserId& other) const { return value_ != other.value_; }

private:
    explicit UserId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace slack_mcp

