#include <slack_mcp/slack/slack_errors.hpp>

namespace slack_mcp {

namespace {

struct SlackErrorEntry {
    std::string_view code;
    std::string_view message;
    ErrorCategory category;
};

constexpr SlackErrorEntry kSlackErrors[] = {
    // Authentication
    {"invalid_auth", "Invalid authentication token. Please check your SLACK_BOT_TOKEN.",
     ErrorCategory::Authentication},
    {"not_authed", "No authentication token provided. Please set SLACK_BOT_TOKEN.",
     ErrorCategory::Authentication},
    {"account_inactive", "Slack account is inactive. Please reactivate your account.",
     ErrorCategory::Authentication},
    {"token_revoked", "Authentication token has been revoked. Please generate a new token.",
     ErrorCategory::Authentication},
    {"token_expired", "Authentication token has expired. Please generate a new token.",
     ErrorCategory::Authentication},
    {"no_permission", "Insufficient permissions. Please check your bot token scopes.",
     ErrorCategory::Permission},
    {"missing_scope", "Missing required OAuth scope. Please update your app permissions.",
     ErrorCategory::Permission},
    {"not_allowed_token_type", "This method does not accept this kind of token.",
     ErrorCategory::Permission},

    // Channels
    {"channel_not_found", "Channel not found. Please check the channel ID or name.",
     ErrorCategory::NotFound},
    {"not_in_channel", "Bot is not a member of this channel. Please invite the bot first.",
     ErrorCategory::Permission},
    {"is_archived", "Cannot perform action on archived channel.",
     ErrorCategory::InvalidArgument},
    {"already_archived", "Channel is already archived.",
     ErrorCategory::InvalidArgument},
    {"cant_archive_general", "The general channel cannot be archived.",
     ErrorCategory::Permission},
    {"cant_leave_general", "The general channel cannot be left.",
     ErrorCategory::Permission},
    {"channel_not_im", "This operation requires a direct message channel.",
     ErrorCategory::InvalidArgument},
    {"already_in_channel", "User is already a member of this channel.",
     ErrorCategory::InvalidArgument},
    {"name_taken", "A channel with this name already exists.",
     ErrorCategory::InvalidArgument},
    {"invalid_name_specials", "Channel names may only contain lowercase letters, numbers, hyphens and underscores.",
     ErrorCategory::InvalidArgument},

    // Users
    {"user_not_found", "User not found. Please check the user ID or username.",
     ErrorCategory::NotFound},
    {"users_not_found", "One or more users not found. Please check user IDs.",
     ErrorCategory::NotFound},
    {"user_not_in_channel", "User is not a member of this channel.",
     ErrorCategory::InvalidArgument},
    {"cant_invite_self", "Cannot invite yourself to a channel.",
     ErrorCategory::InvalidArgument},

    // Messages, reactions, pins
    {"message_not_found", "Message not found. It may have been deleted.",
     ErrorCategory::NotFound},
    {"thread_not_found", "Thread not found. Please check the parent message timestamp.",
     ErrorCategory::NotFound},
    {"cant_update_message", "Cannot update this message. You may not have permission.",
     ErrorCategory::Permission},
    {"cant_delete_message", "Cannot delete this message. You may not have permission.",
     ErrorCategory::Permission},
    {"edit_window_closed", "Message edit window has closed.",
     ErrorCategory::Permission},
    {"too_long", "Message is too long. Please shorten your message.",
     ErrorCategory::InvalidArgument},
    {"msg_too_long", "Message is too long. Please shorten your message.",
     ErrorCategory::InvalidArgument},
    {"no_text", "Message text is empty.",
     ErrorCategory::InvalidArgument},
    {"already_reacted", "This reaction has already been added to the message.",
     ErrorCategory::InvalidArgument},
    {"no_reaction", "This reaction is not present on the message.",
     ErrorCategory::InvalidArgument},
    {"invalid_name", "Invalid emoji name.",
     ErrorCategory::InvalidArgument},
    {"already_pinned", "Message is already pinned.",
     ErrorCategory::InvalidArgument},
    {"too_many_pins", "This channel has reached the pin limit.",
     ErrorCategory::InvalidArgument},

    // Files
    {"file_not_found", "File not found or has been deleted.",
     ErrorCategory::NotFound},
    {"file_deleted", "File has been deleted and cannot be accessed.",
     ErrorCategory::NotFound},
    {"over_file_size_limit", "File is too large. Please use a smaller file.",
     ErrorCategory::InvalidArgument},

    // Rate limiting
    {"ratelimited", "API rate limit exceeded. Please wait before making more requests.",
     ErrorCategory::RateLimited},
    {"rate_limited", "API rate limit exceeded. Please wait before making more requests.",
     ErrorCategory::RateLimited},

    // General
    {"invalid_arguments", "Invalid arguments provided. Please check your input.",
     ErrorCategory::InvalidArgument},
    {"invalid_arg_name", "Invalid argument name. Please check your input.",
     ErrorCategory::InvalidArgument},
    {"not_allowed", "This action is not allowed.",
     ErrorCategory::Permission},
    {"compliance_exports_prevent_deletion", "Cannot delete due to compliance export settings.",
     ErrorCategory::Permission},
    {"internal_error", "Slack encountered an internal error. Please try again.",
     ErrorCategory::SlackApi},
    {"fatal_error", "Slack encountered a fatal error. Please try again.",
     ErrorCategory::SlackApi},
    {"service_unavailable", "Slack service is temporarily unavailable.",
     ErrorCategory::Connection},
};

const SlackErrorEntry* FindEntry(std::string_view code) {
    for (const auto& entry : kSlackErrors) {
        if (entry.code == code) return &entry;
    }
    return nullptr;
}

} // anonymous namespace

std::optional<std::string> FriendlySlackMessage(std::string_view code) {
    const auto* entry = FindEntry(code);
    if (entry == nullptr) return std::nullopt;
    return std::string(entry->message);
}

std::string DescribeSlackError(const std::string& code) {
    auto friendly = FriendlySlackMessage(code);
    auto text = friendly.has_value() ? *friendly : "Slack API error: " + code;
    return text + " (" + code + ")";
}

ErrorCategory CategoryForSlackError(std::string_view code) {
    const auto* entry = FindEntry(code);
    return entry == nullptr ? ErrorCategory::SlackApi : entry->category;
}

bool IsRetryableSlackError(std::string_view code) {
    return code == "ratelimited" || code == "rate_limited" ||
           code == "internal_error" || code == "fatal_error" ||
           code == "service_unavailable";
}

Error MakeSlackApiError(const std::string& method, const std::string& code) {
    return Error{"SlackCall", method, std::nullopt, DescribeSlackError(code),
                 code, CategoryForSlackError(code)};
}

} // namespace slack_mcp
