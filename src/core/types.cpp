#include <slack_mcp/core/types.hpp>

#include <algorithm>
#include <array>

namespace slack_mcp {

namespace {

bool IsToolNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool IsUpperAlphaOrDigit(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

// Prefix letter followed by >= 8 uppercase alphanumerics.
bool HasSlackIdShape(std::string_view id, std::string_view prefixes) {
    if (id.size() < 9) return false;
    if (prefixes.find(id[0]) == std::string_view::npos) return false;
    return std::all_of(id.begin() + 1, id.end(), IsUpperAlphaOrDigit);
}

constexpr std::array<std::string_view, 5> kTokenPrefixes = {
    "xoxb-", "xoxp-", "xoxa-", "xoxe-", "xapp-"};

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolName
// ---------------------------------------------------------------------------
Result<ToolName, std::string> ToolName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ToolName, std::string>::Err("Tool name must not be empty");
    }
    if (name.size() > 64) {
        return Result<ToolName, std::string>::Err(
            "Tool name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!std::all_of(name.begin(), name.end(), IsToolNameChar)) {
        return Result<ToolName, std::string>::Err(
            "Tool name must contain only letters, digits, '_' and '-': " +
            std::string(name));
    }
    return Result<ToolName, std::string>::Ok(ToolName(std::string(name)));
}

// ---------------------------------------------------------------------------
// SlackToken
// ---------------------------------------------------------------------------
Result<SlackToken, std::string> SlackToken::Create(std::string_view token) {
    if (token.empty()) {
        return Result<SlackToken, std::string>::Err("Slack token must not be empty");
    }
    const bool known_prefix = std::any_of(
        kTokenPrefixes.begin(), kTokenPrefixes.end(),
        [token](std::string_view p) { return token.substr(0, p.size()) == p; });
    if (!known_prefix) {
        return Result<SlackToken, std::string>::Err(
            "Slack token must start with xoxb-, xoxp-, xoxa-, xoxe- or xapp-");
    }
    if (token.size() <= 5) {
        return Result<SlackToken, std::string>::Err(
            "Slack token has a prefix but no secret part");
    }
    if (token.find_first_of(" \t\r\n") != std::string_view::npos) {
        return Result<SlackToken, std::string>::Err(
            "Slack token must not contain whitespace");
    }
    return Result<SlackToken, std::string>::Ok(SlackToken(std::string(token)));
}

std::string SlackToken::Redacted() const {
    return value_.substr(0, 5) + "****";
}

// ---------------------------------------------------------------------------
// ChannelId
// ---------------------------------------------------------------------------
Result<ChannelId, std::string> ChannelId::Create(std::string_view id) {
    if (!HasSlackIdShape(id, "CDG")) {
        return Result<ChannelId, std::string>::Err(
            "Not a Slack conversation ID: " + std::string(id));
    }
    return Result<ChannelId, std::string>::Ok(ChannelId(std::string(id)));
}

// ---------------------------------------------------------------------------
// UserId
// ---------------------------------------------------------------------------
Result<UserId, std::string> UserId::Create(std::string_view id) {
    if (!HasSlackIdShape(id, "UW")) {
        return Result<UserId, std::string>::Err(
            "Not a Slack user ID: " + std::string(id));
    }
    return Result<UserId, std::string>::Ok(UserId(std::string(id)));
}

} // namespace slack_mcp
