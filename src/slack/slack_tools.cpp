#include <slack_mcp/slack/slack_tools.hpp>

#include <slack_mcp/core/log.hpp>
#include <slack_mcp/slack/slack_errors.hpp>
#include <slack_mcp/slack/slack_resolvers.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <string>
#include <vector>

namespace slack_mcp {

namespace {

using ToolResult = Result<nlohmann::json, Error>;

constexpr long long kMaxStatusMinutes = 10080;  // one week

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

Error ParamError(const std::string& message) {
    return Error{"ValidateArguments", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument};
}

// Get a required, non-empty string param.
Result<std::string, Error> RequireString(const nlohmann::json& params,
                                         const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string() ||
        it->get<std::string>().empty()) {
        return Result<std::string, Error>::Err(
            ParamError("Missing required parameter: " + key));
    }
    return Result<std::string, Error>::Ok(it->get<std::string>());
}

// Get an optional string param with a default value.
std::string OptString(const nlohmann::json& params, const std::string& key,
                      const std::string& default_val = "") {
    auto it = params.find(key);
    if (it != params.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return default_val;
}

// Get an optional integer param. Whole floating-point values are accepted.
long long OptInt(const nlohmann::json& params, const std::string& key,
                 long long default_val) {
    auto it = params.find(key);
    if (it == params.end()) return default_val;
    if (it->is_number_integer()) return it->get<long long>();
    if (it->is_number_float()) {
        // Casting a double outside the long long range is undefined.
        auto value = it->get<double>();
        if (std::isfinite(value) && std::trunc(value) == value &&
            value >= -9223372036854775808.0 && value < 9223372036854775808.0) {
            return static_cast<long long>(value);
        }
    }
    return default_val;
}

bool OptBool(const nlohmann::json& params, const std::string& key,
             bool default_val) {
    auto it = params.find(key);
    if (it != params.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return default_val;
}

std::vector<std::string> OptStringList(const nlohmann::json& params,
                                       const std::string& key) {
    std::vector<std::string> out;
    auto it = params.find(key);
    if (it == params.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string() && !item.get<std::string>().empty()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

void CopyString(const nlohmann::json& from, nlohmann::json& to,
                const std::string& key) {
    auto value = OptString(from, key);
    if (!value.empty()) to[key] = value;
}

void CopyArray(const nlohmann::json& from, nlohmann::json& to,
               const std::string& key) {
    auto it = from.find(key);
    if (it != from.end() && it->is_array()) to[key] = *it;
}

std::string Join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += sep;
        out += part;
    }
    return out;
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return Lower(haystack).find(Lower(needle)) != std::string::npos;
}

// ":thumbsup:" -> "thumbsup"
std::string StripColons(std::string name) {
    if (!name.empty() && name.front() == ':') name.erase(0, 1);
    if (!name.empty() && name.back() == ':') name.pop_back();
    return name;
}

// ---------------------------------------------------------------------------
// Response helpers
// ---------------------------------------------------------------------------

std::string StringField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return "";
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

bool BoolField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return false;
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

const nlohmann::json& ObjectField(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!obj.is_object()) return kEmpty;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return kEmpty;
    return *it;
}

const nlohmann::json& ArrayField(const nlohmann::json& obj, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    if (!obj.is_object()) return kEmpty;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return kEmpty;
    return *it;
}

std::string NextCursor(const nlohmann::json& response) {
    return StringField(ObjectField(response, "response_metadata"), "next_cursor");
}

std::string Permalink(const std::string& channel, std::string ts) {
    ts.erase(std::remove(ts.begin(), ts.end(), '.'), ts.end());
    return "https://slack.com/archives/" + channel + "/p" + ts;
}

nlohmann::json SummarizeMessage(const nlohmann::json& message) {
    nlohmann::json out = {
        {"ts", StringField(message, "ts")},
        {"type", StringField(message, "type")},
        {"user", StringField(message, "user")},
        {"text", StringField(message, "text")},
    };
    for (const char* key : {"subtype", "thread_ts", "bot_id"}) {
        auto value = StringField(message, key);
        if (!value.empty()) out[key] = value;
    }
    auto replies = message.find("reply_count");
    if (replies != message.end() && replies->is_number_integer()) {
        out["reply_count"] = *replies;
    }
    const auto& reactions = ArrayField(message, "reactions");
    if (!reactions.empty()) {
        nlohmann::json summary = nlohmann::json::array();
        for (const auto& r : reactions) {
            if (!r.is_object()) continue;
            summary.push_back({{"name", StringField(r, "name")},
                               {"count", r.value("count", 0)}});
        }
        out["reactions"] = summary;
    }
    return out;
}

nlohmann::json SummarizeUser(const nlohmann::json& user) {
    const auto& profile = ObjectField(user, "profile");
    return {
        {"id", StringField(user, "id")},
        {"name", StringField(user, "name")},
        {"real_name", StringField(user, "real_name")},
        {"display_name", StringField(profile, "display_name")},
        {"email", StringField(profile, "email")},
        {"title", StringField(profile, "title")},
        {"status_text", StringField(profile, "status_text")},
        {"timezone", StringField(user, "tz")},
        {"is_bot", BoolField(user, "is_bot")},
        {"is_admin", BoolField(user, "is_admin")},
        {"deleted", BoolField(user, "deleted")},
    };
}

nlohmann::json SummarizeChannel(const nlohmann::json& channel) {
    nlohmann::json out = {
        {"id", StringField(channel, "id")},
        {"name", StringField(channel, "name")},
        {"is_private", BoolField(channel, "is_private")},
        {"is_archived", BoolField(channel, "is_archived")},
        {"is_member", BoolField(channel, "is_member")},
        {"topic", StringField(ObjectField(channel, "topic"), "value")},
        {"purpose", StringField(ObjectField(channel, "purpose"), "value")},
    };
    auto members = channel.find("num_members");
    if (members != channel.end() && members->is_number_integer()) {
        out["num_members"] = *members;
    }
    return out;
}

nlohmann::json MessagesSummary(const nlohmann::json& messages) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& m : messages) {
        out.push_back(SummarizeMessage(m));
    }
    return out;
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc, long long min, long long max) {
    return {{"type", "integer"}, {"description", desc},
            {"minimum", min}, {"maximum", max}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json EnumProp(const std::string& desc,
                        const std::vector<std::string>& values) {
    return {{"type", "string"}, {"description", desc}, {"enum", values}};
}

nlohmann::json ArrayProp(const std::string& desc, const std::string& item_type) {
    return {{"type", "array"}, {"description", desc},
            {"items", {{"type", item_type}}}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const std::vector<std::string>& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// slack_send_message
ToolResult HandleSendMessage(ISlackClient& slack, const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto text = RequireString(args, "text");
    if (text.IsErr()) return ToolResult::Err(text.Error());

    auto channel_id = ResolveConversationId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    nlohmann::json payload = {
        {"channel", channel_id.Value()},
        {"text", text.Value()},
        {"unfurl_links", OptBool(args, "unfurl_links", true)},
        {"unfurl_media", OptBool(args, "unfurl_media", true)},
        {"parse", OptString(args, "parse", "full")},
        {"link_names", OptBool(args, "link_names", true)},
    };
    auto thread_ts = OptString(args, "thread_ts");
    if (!thread_ts.empty()) {
        payload["thread_ts"] = thread_ts;
        payload["reply_broadcast"] = OptBool(args, "reply_broadcast", false);
    }
    CopyArray(args, payload, "blocks");
    CopyArray(args, payload, "attachments");

    auto response = slack.Call("chat.postMessage", payload);
    if (response.IsErr()) return ToolResult::Err(response.Error());

    auto ts = StringField(response.Value(), "ts");
    auto posted_to = StringField(response.Value(), "channel");
    if (posted_to.empty()) posted_to = channel_id.Value();

    nlohmann::json metadata = {
        {"channel_id", channel_id.Value()},
        {"has_blocks", payload.contains("blocks")},
        {"has_attachments", payload.contains("attachments")},
    };
    if (!thread_ts.empty()) metadata["thread_ts"] = thread_ts;

    return ToolResult::Ok({
        {"success", true},
        {"message", {{"ts", ts},
                     {"channel", posted_to},
                     {"text", text.Value()},
                     {"permalink", Permalink(posted_to, ts)}}},
        {"metadata", metadata},
    });
}

// slack_get_channel_history
ToolResult HandleGetChannelHistory(ISlackClient& slack,
                                   const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    nlohmann::json params = {
        {"channel", channel_id.Value()},
        {"limit", OptInt(args, "limit", 100)},
        {"inclusive", OptBool(args, "inclusive", false)},
    };
    CopyString(args, params, "oldest");
    CopyString(args, params, "latest");
    CopyString(args, params, "cursor");

    auto response = slack.Call("conversations.history", params);
    if (response.IsErr()) return ToolResult::Err(response.Error());

    auto by_user = OptString(args, "filter_by_user");
    auto by_type = OptStringList(args, "filter_by_type");

    nlohmann::json messages = nlohmann::json::array();
    for (const auto& m : ArrayField(response.Value(), "messages")) {
        if (!by_user.empty() && StringField(m, "user") != by_user) continue;
        if (!by_type.empty()) {
            auto kind = StringField(m, "subtype");
            if (kind.empty()) kind = StringField(m, "type");
            if (std::find(by_type.begin(), by_type.end(), kind) == by_type.end()) {
                continue;
            }
        }
        messages.push_back(SummarizeMessage(m));
    }

    return ToolResult::Ok({
        {"success", true},
        {"channel", channel_id.Value()},
        {"messages", messages},
        {"message_count", messages.size()},
        {"has_more", BoolField(response.Value(), "has_more")},
        {"next_cursor", NextCursor(response.Value())},
    });
}

// slack_create_channel
ToolResult HandleCreateChannel(ISlackClient& slack, const nlohmann::json& args) {
    auto name = RequireString(args, "name");
    if (name.IsErr()) return ToolResult::Err(name.Error());

    auto created = slack.Call("conversations.create",
                              {{"name", name.Value()},
                               {"is_private", OptBool(args, "is_private", false)}});
    if (created.IsErr()) return ToolResult::Err(created.Error());

    const auto& channel = ObjectField(created.Value(), "channel");
    const auto channel_id = StringField(channel, "id");
    nlohmann::json warnings = nlohmann::json::array();

    // Follow-up steps are best effort: the channel exists either way.
    bool topic_set = false;
    auto topic = OptString(args, "topic");
    if (!topic.empty()) {
        auto r = slack.Call("conversations.setTopic",
                            {{"channel", channel_id}, {"topic", topic}});
        topic_set = r.IsOk();
        if (r.IsErr()) warnings.push_back("Failed to set topic: " + r.Error().message);
    }

    bool purpose_set = false;
    auto purpose = OptString(args, "purpose");
    if (!purpose.empty()) {
        auto r = slack.Call("conversations.setPurpose",
                            {{"channel", channel_id}, {"purpose", purpose}});
        purpose_set = r.IsOk();
        if (r.IsErr()) warnings.push_back("Failed to set purpose: " + r.Error().message);
    }

    std::vector<std::string> invited;
    for (const auto& user : OptStringList(args, "invite_users")) {
        auto user_id = ResolveUserId(slack, user);
        if (user_id.IsErr()) {
            warnings.push_back("Could not resolve user " + user + ": " +
                               user_id.Error().message);
            continue;
        }
        invited.push_back(user_id.Value());
    }
    if (!invited.empty()) {
        auto r = slack.Call("conversations.invite",
                            {{"channel", channel_id}, {"users", Join(invited, ',')}});
        if (r.IsErr()) {
            warnings.push_back("Failed to invite users: " + r.Error().message);
            invited.clear();
        }
    }

    nlohmann::json result = {
        {"success", true},
        {"channel", SummarizeChannel(channel)},
        {"topic_set", topic_set},
        {"purpose_set", purpose_set},
        {"invited_users", invited},
    };
    if (!warnings.empty()) result["warnings"] = warnings;
    return ToolResult::Ok(result);
}

// slack_get_user_info
ToolResult HandleGetUserInfo(ISlackClient& slack, const nlohmann::json& args) {
    auto user = RequireString(args, "user");
    if (user.IsErr()) return ToolResult::Err(user.Error());
    auto user_id = ResolveUserId(slack, user.Value());
    if (user_id.IsErr()) return ToolResult::Err(user_id.Error());

    auto info = slack.Call("users.info",
                           {{"user", user_id.Value()},
                            {"include_locale", OptBool(args, "include_locale", false)}});
    if (info.IsErr()) return ToolResult::Err(info.Error());

    nlohmann::json result = {
        {"success", true},
        {"user", SummarizeUser(ObjectField(info.Value(), "user"))},
    };

    if (OptBool(args, "include_presence", false)) {
        auto presence = slack.Call("users.getPresence", {{"user", user_id.Value()}});
        if (presence.IsOk()) {
            result["presence"] = StringField(presence.Value(), "presence");
        } else {
            LogWarn("slack", "Presence lookup failed",
                    {{"user", user_id.Value()}, {"error", presence.Error().message}});
        }
    }
    return ToolResult::Ok(result);
}

// slack_list_channels
ToolResult HandleListChannels(ISlackClient& slack, const nlohmann::json& args) {
    auto types = OptStringList(args, "types");
    if (types.empty()) types = {"public_channel", "private_channel"};

    nlohmann::json params = {
        {"types", Join(types, ',')},
        {"limit", OptInt(args, "limit", 100)},
        {"exclude_archived", OptBool(args, "exclude_archived", true)},
    };
    CopyString(args, params, "cursor");
    CopyString(args, params, "team_id");

    auto response = slack.Call("conversations.list", params);
    if (response.IsErr()) return ToolResult::Err(response.Error());

    auto name_filter = OptString(args, "filter_by_name");
    nlohmann::json channels = nlohmann::json::array();
    for (const auto& c : ArrayField(response.Value(), "channels")) {
        if (!name_filter.empty() &&
            !ContainsIgnoreCase(StringField(c, "name"), name_filter)) {
            continue;
        }
        channels.push_back(SummarizeChannel(c));
    }

    return ToolResult::Ok({
        {"success", true},
        {"channels", channels},
        {"count", channels.size()},
        {"next_cursor", NextCursor(response.Value())},
    });
}

// slack_list_users
ToolResult HandleListUsers(ISlackClient& slack, const nlohmann::json& args) {
    nlohmann::json params = {
        {"limit", OptInt(args, "limit", 100)},
        {"include_locale", OptBool(args, "include_locale", false)},
    };
    CopyString(args, params, "cursor");
    CopyString(args, params, "team_id");

    auto response = slack.Call("users.list", params);
    if (response.IsErr()) return ToolResult::Err(response.Error());

    const bool exclude_bots = OptBool(args, "exclude_bots", false);
    const bool exclude_deleted = OptBool(args, "exclude_deleted", true);
    auto name_filter = OptString(args, "filter_by_name");

    nlohmann::json users = nlohmann::json::array();
    for (const auto& u : ArrayField(response.Value(), "members")) {
        auto summary = SummarizeUser(u);
        if (exclude_bots && summary["is_bot"].get<bool>()) continue;
        if (exclude_deleted && summary["deleted"].get<bool>()) continue;
        if (!name_filter.empty() &&
            !ContainsIgnoreCase(summary["name"].get<std::string>(), name_filter) &&
            !ContainsIgnoreCase(summary["real_name"].get<std::string>(), name_filter) &&
            !ContainsIgnoreCase(summary["display_name"].get<std::string>(), name_filter)) {
            continue;
        }
        users.push_back(summary);
    }

    return ToolResult::Ok({
        {"success", true},
        {"users", users},
        {"count", users.size()},
        {"next_cursor", NextCursor(response.Value())},
    });
}

// slack_join_channel
ToolResult HandleJoinChannel(ISlackClient& slack, const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    auto response = slack.Call("conversations.join", {{"channel", channel_id.Value()}});
    if (response.IsErr()) return ToolResult::Err(response.Error());

    auto summary = SummarizeChannel(ObjectField(response.Value(), "channel"));
    if (summary["id"].get<std::string>().empty()) summary["id"] = channel_id.Value();

    return ToolResult::Ok({
        {"success", true},
        {"channel", summary},
        {"already_member",
         StringField(response.Value(), "warning") == "already_in_channel"},
    });
}

// slack_leave_channel
ToolResult HandleLeaveChannel(ISlackClient& slack, const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    if (OptBool(args, "prevent_general_leave", true)) {
        auto info = slack.Call("conversations.info", {{"channel", channel_id.Value()}});
        if (info.IsErr()) return ToolResult::Err(info.Error());
        if (BoolField(ObjectField(info.Value(), "channel"), "is_general")) {
            return ToolResult::Err(MakeSlackApiError("conversations.leave",
                                                     "cant_leave_general"));
        }
    }

    auto response = slack.Call("conversations.leave", {{"channel", channel_id.Value()}});
    if (response.IsErr()) return ToolResult::Err(response.Error());

    return ToolResult::Ok({
        {"success", true},
        {"channel_id", channel_id.Value()},
        {"was_member", !BoolField(response.Value(), "not_in_channel")},
    });
}

// slack_archive_channel
ToolResult HandleArchiveChannel(ISlackClient& slack, const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    auto info = slack.Call("conversations.info", {{"channel", channel_id.Value()}});
    if (info.IsErr()) return ToolResult::Err(info.Error());
    const auto& details = ObjectField(info.Value(), "channel");

    if (BoolField(details, "is_archived")) {
        return ToolResult::Err(MakeSlackApiError("conversations.archive",
                                                 "already_archived"));
    }
    if (OptBool(args, "prevent_general_archive", true) &&
        BoolField(details, "is_general")) {
        return ToolResult::Err(MakeSlackApiError("conversations.archive",
                                                 "cant_archive_general"));
    }

    bool notified = false;
    auto notice = OptString(args, "notification_message");
    if (!notice.empty()) {
        auto posted = slack.Call("chat.postMessage",
                                 {{"channel", channel_id.Value()}, {"text", notice}});
        notified = posted.IsOk();
        if (posted.IsErr()) {
            LogWarn("slack", "Archive notice could not be posted",
                    {{"channel", channel_id.Value()}, {"error", posted.Error().message}});
        }
    }

    auto response = slack.Call("conversations.archive", {{"channel", channel_id.Value()}});
    if (response.IsErr()) return ToolResult::Err(response.Error());

    return ToolResult::Ok({
        {"success", true},
        {"channel", {{"id", channel_id.Value()}, {"name", StringField(details, "name")}}},
        {"notified", notified},
    });
}

// slack_set_status
ToolResult HandleSetStatus(ISlackClient& slack, const nlohmann::json& args) {
    auto text = OptString(args, "status_text");
    auto emoji = OptString(args, "status_emoji");
    if (!emoji.empty()) emoji = ":" + StripColons(emoji) + ":";

    long long expiration = OptInt(args, "status_expiration", 0);
    auto minutes = std::min(OptInt(args, "duration_minutes", 0), kMaxStatusMinutes);
    if (minutes > 0) {
        auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
        expiration = now + minutes * 60;
    }

    auto profile = slack.Call("users.profile.set",
                              {{"profile", {{"status_text", text},
                                            {"status_emoji", emoji},
                                            {"status_expiration", expiration}}}});
    if (profile.IsErr()) return ToolResult::Err(profile.Error());

    nlohmann::json result = {
        {"success", true},
        {"status", {{"text", text}, {"emoji", emoji}, {"expiration", expiration}}},
    };

    auto presence = OptString(args, "presence");
    if (!presence.empty()) {
        auto r = slack.Call("users.setPresence", {{"presence", presence}});
        if (r.IsErr()) return ToolResult::Err(r.Error());
        result["presence"] = presence;
    }
    return ToolResult::Ok(result);
}

// slack_search_messages
ToolResult HandleSearchMessages(ISlackClient& slack, const nlohmann::json& args) {
    auto query = RequireString(args, "query");
    if (query.IsErr()) return ToolResult::Err(query.Error());

    nlohmann::json params = {
        {"query", query.Value()},
        {"sort", OptString(args, "sort", "score")},
        {"sort_dir", OptString(args, "sort_dir", "desc")},
        {"highlight", OptBool(args, "highlight", true)},
        {"count", OptInt(args, "count", 20)},
        {"page", OptInt(args, "page", 1)},
    };

    auto response = slack.Call("search.messages", params, TokenKind::User);
    if (response.IsErr()) return ToolResult::Err(response.Error());

    const auto& messages = ObjectField(response.Value(), "messages");
    nlohmann::json matches = nlohmann::json::array();
    for (const auto& m : ArrayField(messages, "matches")) {
        const auto& channel = ObjectField(m, "channel");
        matches.push_back({
            {"ts", StringField(m, "ts")},
            {"text", StringField(m, "text")},
            {"user", StringField(m, "user")},
            {"username", StringField(m, "username")},
            {"channel", {{"id", StringField(channel, "id")},
                         {"name", StringField(channel, "name")}}},
            {"permalink", StringField(m, "permalink")},
        });
    }

    const auto& paging = ObjectField(messages, "pagination");
    return ToolResult::Ok({
        {"success", true},
        {"query", query.Value()},
        {"total", messages.value("total", 0)},
        {"matches", matches},
        {"pagination", {{"page", paging.value("page", 1)},
                        {"page_count", paging.value("page_count", 1)},
                        {"total_count", paging.value("total_count", 0)}}},
    });
}

// slack_auth_test
ToolResult HandleAuthTest(ISlackClient& slack, const nlohmann::json& /*args*/) {
    auto response = slack.Call("auth.test", nlohmann::json::object());
    if (response.IsErr()) return ToolResult::Err(response.Error());
    const auto& r = response.Value();

    nlohmann::json auth = {
        {"user", StringField(r, "user")},
        {"user_id", StringField(r, "user_id")},
        {"team", StringField(r, "team")},
        {"team_id", StringField(r, "team_id")},
        {"url", StringField(r, "url")},
    };
    auto bot_id = StringField(r, "bot_id");
    if (!bot_id.empty()) auth["bot_id"] = bot_id;

    return ToolResult::Ok({{"success", true}, {"auth", auth}});
}

// slack_get_workspace_info
ToolResult HandleGetWorkspaceInfo(ISlackClient& slack, const nlohmann::json& args) {
    auto auth = slack.Call("auth.test", nlohmann::json::object());
    if (auth.IsErr()) return ToolResult::Err(auth.Error());
    auto team = slack.Call("team.info", nlohmann::json::object());
    if (team.IsErr()) return ToolResult::Err(team.Error());

    const auto& t = ObjectField(team.Value(), "team");
    nlohmann::json result = {
        {"success", true},
        {"workspace", {{"id", StringField(auth.Value(), "team_id")},
                       {"name", StringField(t, "name")},
                       {"domain", StringField(t, "domain")},
                       {"email_domain", StringField(t, "email_domain")},
                       {"url", StringField(auth.Value(), "url")},
                       {"icon", StringField(ObjectField(t, "icon"), "image_132")}}},
        {"bot", {{"id", StringField(auth.Value(), "user_id")},
                 {"name", StringField(auth.Value(), "user")}}},
    };

    if (OptBool(args, "include_stats", false)) {
        nlohmann::json stats = nlohmann::json::object();
        auto channels = slack.Call("conversations.list",
                                   {{"types", "public_channel,private_channel"},
                                    {"exclude_archived", true},
                                    {"limit", 1000}});
        if (channels.IsOk()) {
            stats["channel_count"] = ArrayField(channels.Value(), "channels").size();
        }
        auto users = slack.Call("users.list", {{"limit", 1000}});
        if (users.IsOk()) {
            size_t humans = 0;
            for (const auto& u : ArrayField(users.Value(), "members")) {
                if (!BoolField(u, "is_bot") && !BoolField(u, "deleted")) ++humans;
            }
            stats["member_count"] = humans;
        }
        result["stats"] = stats;
    }
    return ToolResult::Ok(result);
}

// slack_chat_update
ToolResult HandleChatUpdate(ISlackClient& slack, const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto ts = RequireString(args, "ts");
    if (ts.IsErr()) return ToolResult::Err(ts.Error());

    auto text = OptString(args, "text");
    nlohmann::json payload = nlohmann::json::object();
    CopyArray(args, payload, "blocks");
    CopyArray(args, payload, "attachments");
    if (text.empty() && payload.empty()) {
        return ToolResult::Err(
            ParamError("One of text, blocks or attachments is required"));
    }

    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    payload["channel"] = channel_id.Value();
    payload["ts"] = ts.Value();
    if (!text.empty()) payload["text"] = text;
    CopyString(args, payload, "parse");
    for (const char* key : {"link_names", "reply_broadcast"}) {
        auto it = args.find(key);
        if (it != args.end() && it->is_boolean()) payload[key] = *it;
    }

    auto response = slack.Call("chat.update", payload);
    if (response.IsErr()) return ToolResult::Err(response.Error());

    return ToolResult::Ok({
        {"success", true},
        {"channel", channel_id.Value()},
        {"ts", StringField(response.Value(), "ts").empty()
                   ? ts.Value() : StringField(response.Value(), "ts")},
        {"text", StringField(response.Value(), "text").empty()
                     ? text : StringField(response.Value(), "text")},
    });
}

// slack_chat_delete
ToolResult HandleChatDelete(ISlackClient& slack, const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto ts = RequireString(args, "ts");
    if (ts.IsErr()) return ToolResult::Err(ts.Error());
    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    auto response = slack.Call("chat.delete",
                               {{"channel", channel_id.Value()}, {"ts", ts.Value()}});
    if (response.IsErr()) return ToolResult::Err(response.Error());

    return ToolResult::Ok({
        {"success", true},
        {"channel", channel_id.Value()},
        {"ts", ts.Value()},
        {"deleted", true},
    });
}

// slack_reactions_add / slack_reactions_remove
ToolResult HandleReaction(ISlackClient& slack, const nlohmann::json& args,
                          const std::string& method) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto timestamp = RequireString(args, "timestamp");
    if (timestamp.IsErr()) return ToolResult::Err(timestamp.Error());
    auto name = RequireString(args, "name");
    if (name.IsErr()) return ToolResult::Err(name.Error());

    auto reaction = StripColons(name.Value());
    if (reaction.empty()) {
        return ToolResult::Err(ParamError("Reaction name must not be empty"));
    }

    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    auto response = slack.Call(method, {{"channel", channel_id.Value()},
                                        {"timestamp", timestamp.Value()},
                                        {"name", reaction}});
    if (response.IsErr()) return ToolResult::Err(response.Error());

    return ToolResult::Ok({
        {"success", true},
        {"channel", channel_id.Value()},
        {"timestamp", timestamp.Value()},
        {"reaction", reaction},
    });
}

ToolResult HandleReactionsAdd(ISlackClient& slack, const nlohmann::json& args) {
    return HandleReaction(slack, args, "reactions.add");
}

ToolResult HandleReactionsRemove(ISlackClient& slack, const nlohmann::json& args) {
    return HandleReaction(slack, args, "reactions.remove");
}

// slack_pins_add
ToolResult HandlePinsAdd(ISlackClient& slack, const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto timestamp = RequireString(args, "timestamp");
    if (timestamp.IsErr()) return ToolResult::Err(timestamp.Error());
    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    auto response = slack.Call("pins.add", {{"channel", channel_id.Value()},
                                            {"timestamp", timestamp.Value()}});
    if (response.IsErr()) return ToolResult::Err(response.Error());

    return ToolResult::Ok({
        {"success", true},
        {"channel", channel_id.Value()},
        {"timestamp", timestamp.Value()},
        {"pinned", true},
        {"permalink", Permalink(channel_id.Value(), timestamp.Value())},
    });
}

// slack_conversations_replies
ToolResult HandleConversationsReplies(ISlackClient& slack,
                                      const nlohmann::json& args) {
    auto channel = RequireString(args, "channel");
    if (channel.IsErr()) return ToolResult::Err(channel.Error());
    auto ts = RequireString(args, "ts");
    if (ts.IsErr()) return ToolResult::Err(ts.Error());
    auto channel_id = ResolveChannelId(slack, channel.Value());
    if (channel_id.IsErr()) return ToolResult::Err(channel_id.Error());

    nlohmann::json params = {
        {"channel", channel_id.Value()},
        {"ts", ts.Value()},
        {"limit", OptInt(args, "limit", 100)},
        {"inclusive", OptBool(args, "inclusive", false)},
    };
    CopyString(args, params, "cursor");
    CopyString(args, params, "latest");
    CopyString(args, params, "oldest");

    auto response = slack.Call("conversations.replies", params);
    if (response.IsErr()) return ToolResult::Err(response.Error());

    const auto& raw = ArrayField(response.Value(), "messages");
    auto messages = MessagesSummary(raw);

    // The parent message comes first and carries the thread's reply count.
    long long reply_count = 0;
    if (!raw.empty() && raw[0].contains("reply_count") &&
        raw[0]["reply_count"].is_number_integer()) {
        reply_count = raw[0]["reply_count"].get<long long>();
    } else if (!raw.empty()) {
        reply_count = static_cast<long long>(raw.size()) - 1;
    }

    return ToolResult::Ok({
        {"success", true},
        {"channel", channel_id.Value()},
        {"thread_ts", ts.Value()},
        {"messages", messages},
        {"reply_count", reply_count},
        {"has_more", BoolField(response.Value(), "has_more")},
        {"next_cursor", NextCursor(response.Value())},
    });
}

// slack_users_lookup_by_email
ToolResult HandleUsersLookupByEmail(ISlackClient& slack,
                                    const nlohmann::json& args) {
    auto email = RequireString(args, "email");
    if (email.IsErr()) return ToolResult::Err(email.Error());

    auto response = slack.Call("users.lookupByEmail", {{"email", email.Value()}});
    if (response.IsErr()) return ToolResult::Err(response.Error());

    return ToolResult::Ok({
        {"success", true},
        {"user", SummarizeUser(ObjectField(response.Value(), "user"))},
    });
}

// ---------------------------------------------------------------------------
// Tool table
// ---------------------------------------------------------------------------

using SlackHandler = ToolResult (*)(ISlackClient&, const nlohmann::json&);

struct SlackToolDefinition {
    const char* name;
    const char* description;
    nlohmann::json schema;
    SlackHandler handler;
};

std::vector<SlackToolDefinition> SlackToolDefinitions() {
    const auto channel_prop =
        StringProp("Channel ID or name (with or without #)");
    const auto limit_prop = IntProp("Maximum number of items to return (1-1000)", 1, 1000);

    return {
        {"slack_send_message",
         "Send a message to a Slack channel or user, with optional threading, "
         "Block Kit blocks and attachments.",
         MakeSchema(
             {{"channel", StringProp("Channel ID, channel name (with or without #), "
                                     "or user ID/@username for a direct message")},
              {"text", StringProp("Message text (supports Slack markdown formatting)")},
              {"thread_ts", StringProp("Timestamp of the parent message to reply in thread")},
              {"blocks", ArrayProp("Slack Block Kit blocks", "object")},
              {"attachments", ArrayProp("Legacy message attachments", "object")},
              {"unfurl_links", BoolProp("Enable automatic link unfurling (default: true)")},
              {"unfurl_media", BoolProp("Enable automatic media unfurling (default: true)")},
              {"parse", EnumProp("Parse mode for message formatting", {"full", "none"})},
              {"reply_broadcast", BoolProp("Broadcast a thread reply to the channel")},
              {"link_names", BoolProp("Find and link channel names and usernames")}},
             {"channel", "text"}),
         &HandleSendMessage},

        {"slack_get_channel_history",
         "Retrieve message history of a channel with optional time range, "
         "pagination and user/type filters.",
         MakeSchema(
             {{"channel", channel_prop},
              {"limit", limit_prop},
              {"oldest", StringProp("Start of time range (message timestamp)")},
              {"latest", StringProp("End of time range (message timestamp)")},
              {"inclusive", BoolProp("Include messages at oldest and latest")},
              {"cursor", StringProp("Pagination cursor from a previous call")},
              {"filter_by_user", StringProp("Only messages from this user ID")},
              {"filter_by_type", ArrayProp("Only these message types or subtypes", "string")}},
             {"channel"}),
         &HandleGetChannelHistory},

        {"slack_create_channel",
         "Create a public or private channel, optionally setting topic and "
         "purpose and inviting users.",
         MakeSchema(
             {{"name", {{"type", "string"},
                        {"description", "Channel name (lowercase letters, numbers, - and _)"},
                        {"pattern", "^[a-z0-9_-]+$"},
                        {"minLength", 1},
                        {"maxLength", 80}}},
              {"is_private", BoolProp("Create a private channel (default: false)")},
              {"topic", StringProp("Channel topic")},
              {"purpose", StringProp("Channel purpose")},
              {"invite_users", ArrayProp("User IDs or @usernames to invite", "string")}},
             {"name"}),
         &HandleCreateChannel},

        {"slack_get_user_info",
         "Get profile information about a user by ID or username.",
         MakeSchema(
             {{"user", StringProp("User ID or username (with or without @)")},
              {"include_locale", BoolProp("Include the user's locale")},
              {"include_presence", BoolProp("Include the user's presence")}},
             {"user"}),
         &HandleGetUserInfo},

        {"slack_list_channels",
         "List channels in the workspace with optional type and name filters.",
         MakeSchema(
             {{"types", {{"type", "array"},
                         {"description", "Conversation types to include"},
                         {"items", {{"type", "string"},
                                    {"enum", {"public_channel", "private_channel", "mpim", "im"}}}}}},
              {"limit", limit_prop},
              {"cursor", StringProp("Pagination cursor from a previous call")},
              {"exclude_archived", BoolProp("Skip archived channels (default: true)")},
              {"team_id", StringProp("Team ID (Enterprise Grid only)")},
              {"filter_by_name", StringProp("Case-insensitive substring of the channel name")}},
             {}),
         &HandleListChannels},

        {"slack_list_users",
         "List workspace members with optional bot, deleted and name filters.",
         MakeSchema(
             {{"limit", limit_prop},
              {"cursor", StringProp("Pagination cursor from a previous call")},
              {"include_locale", BoolProp("Include each user's locale")},
              {"team_id", StringProp("Team ID (Enterprise Grid only)")},
              {"exclude_bots", BoolProp("Skip bot users (default: false)")},
              {"exclude_deleted", BoolProp("Skip deactivated users (default: true)")},
              {"filter_by_name", StringProp("Case-insensitive substring of name, real name or display name")}},
             {}),
         &HandleListUsers},

        {"slack_join_channel",
         "Join a public channel.",
         MakeSchema({{"channel", channel_prop}}, {"channel"}),
         &HandleJoinChannel},

        {"slack_leave_channel",
         "Leave a channel. Leaving #general is refused unless explicitly allowed.",
         MakeSchema(
             {{"channel", channel_prop},
              {"prevent_general_leave", BoolProp("Refuse to leave the general channel (default: true)")}},
             {"channel"}),
         &HandleLeaveChannel},

        {"slack_archive_channel",
         "Archive a channel, optionally posting a notice first.",
         MakeSchema(
             {{"channel", channel_prop},
              {"prevent_general_archive", BoolProp("Refuse to archive the general channel (default: true)")},
              {"notification_message", StringProp("Message posted to the channel before archiving")}},
             {"channel"}),
         &HandleArchiveChannel},

        {"slack_set_status",
         "Set the custom status and presence of the authenticated user.",
         MakeSchema(
             {{"status_text", {{"type", "string"},
                               {"description", "Status text (empty clears the status)"},
                               {"maxLength", 100}}},
              {"status_emoji", StringProp("Status emoji, e.g. :calendar:")},
              {"status_expiration", {{"type", "integer"},
                                     {"description", "Unix time when the status expires (0 = never)"},
                                     {"minimum", 0}}},
              {"duration_minutes", IntProp("Clear the status after this many minutes", 1, kMaxStatusMinutes)},
              {"presence", EnumProp("Presence to set", {"auto", "away"})}},
             {}),
         &HandleSetStatus},

        {"slack_search_messages",
         "Search messages across the workspace. Requires a user token.",
         MakeSchema(
             {{"query", StringProp("Search query string")},
              {"sort", EnumProp("Sort order for results", {"score", "timestamp"})},
              {"sort_dir", EnumProp("Sort direction", {"asc", "desc"})},
              {"highlight", BoolProp("Highlight search terms in results")},
              {"count", IntProp("Number of results per page (1-1000)", 1, 1000)},
              {"page", {{"type", "integer"},
                        {"description", "Page number for pagination"},
                        {"minimum", 1}}}},
             {"query"}),
         &HandleSearchMessages},

        {"slack_auth_test",
         "Check the bot token and report the authenticated identity.",
         MakeSchema(nlohmann::json::object(), {}),
         &HandleAuthTest},

        {"slack_get_workspace_info",
         "Get workspace (team) information, optionally with channel and member counts.",
         MakeSchema(
             {{"include_stats", BoolProp("Include channel and member counts (default: false)")}},
             {}),
         &HandleGetWorkspaceInfo},

        {"slack_chat_update",
         "Update the text, blocks or attachments of an existing message.",
         MakeSchema(
             {{"channel", channel_prop},
              {"ts", StringProp("Timestamp of the message to update")},
              {"text", StringProp("New message text")},
              {"blocks", ArrayProp("New Block Kit blocks", "object")},
              {"attachments", ArrayProp("New legacy attachments", "object")},
              {"parse", EnumProp("Parse mode for message formatting", {"full", "none"})},
              {"link_names", BoolProp("Find and link channel names and usernames")},
              {"reply_broadcast", BoolProp("Broadcast a thread reply to the channel")}},
             {"channel", "ts"}),
         &HandleChatUpdate},

        {"slack_chat_delete",
         "Delete a message.",
         MakeSchema(
             {{"channel", channel_prop},
              {"ts", StringProp("Timestamp of the message to delete")}},
             {"channel", "ts"}),
         &HandleChatDelete},

        {"slack_reactions_add",
         "Add an emoji reaction to a message.",
         MakeSchema(
             {{"channel", channel_prop},
              {"timestamp", StringProp("Timestamp of the message")},
              {"name", StringProp("Emoji name, with or without colons")}},
             {"channel", "timestamp", "name"}),
         &HandleReactionsAdd},

        {"slack_reactions_remove",
         "Remove an emoji reaction from a message.",
         MakeSchema(
             {{"channel", channel_prop},
              {"timestamp", StringProp("Timestamp of the message")},
              {"name", StringProp("Emoji name, with or without colons")}},
             {"channel", "timestamp", "name"}),
         &HandleReactionsRemove},

        {"slack_pins_add",
         "Pin a message to a channel.",
         MakeSchema(
             {{"channel", channel_prop},
              {"timestamp", StringProp("Timestamp of the message to pin")}},
             {"channel", "timestamp"}),
         &HandlePinsAdd},

        {"slack_conversations_replies",
         "Retrieve the replies of a message thread.",
         MakeSchema(
             {{"channel", channel_prop},
              {"ts", StringProp("Timestamp of the thread's parent message")},
              {"cursor", StringProp("Pagination cursor from a previous call")},
              {"latest", StringProp("End of time range (message timestamp)")},
              {"oldest", StringProp("Start of time range (message timestamp)")},
              {"limit", limit_prop},
              {"inclusive", BoolProp("Include messages at oldest and latest")}},
             {"channel", "ts"}),
         &HandleConversationsReplies},

        {"slack_users_lookup_by_email",
         "Find a user by email address.",
         MakeSchema(
             {{"email", {{"type", "string"},
                         {"description", "Email address to look up"},
                         {"maxLength", 254},
                         {"pattern", "^[^@\\s]+@[^@\\s]+\\.[^@\\s]+$"}}}},
             {"email"}),
         &HandleUsersLookupByEmail},
    };
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterSlackTools
// ---------------------------------------------------------------------------
Result<void, Error> RegisterSlackTools(ToolRegistry& registry,
                                       std::shared_ptr<ISlackClient> slack) {
    if (!slack) {
        return Result<void, Error>::Err(Error{
            "RegisterTool", "", std::nullopt, "Slack client is null",
            std::nullopt, ErrorCategory::Registration});
    }
    for (auto& def : SlackToolDefinitions()) {
        auto handler = def.handler;
        auto registered = registry.Register(
            def.name, def.description, def.schema,
            [slack, handler](const nlohmann::json& args) {
                return handler(*slack, args);
            });
        if (registered.IsErr()) return registered;
    }
    LogDebug("slack", "Slack tools registered",
             {{"count", std::to_string(registry.Size())}});
    return Result<void, Error>::Ok();
}

} // namespace slack_mcp
