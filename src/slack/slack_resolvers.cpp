#include <slack_mcp/slack/slack_resolvers.hpp>

#include <slack_mcp/core/log.hpp>
#include <slack_mcp/core/types.hpp>

#include <functional>

namespace slack_mcp {

namespace {

using IdResult = Result<std::string, Error>;

// Bounds a name lookup in very large workspaces.
constexpr int kMaxLookupPages = 20;

std::string NextCursor(const nlohmann::json& response) {
    auto meta = response.find("response_metadata");
    if (meta == response.end() || !meta->is_object()) return "";
    auto cursor = meta->find("next_cursor");
    if (cursor == meta->end() || !cursor->is_string()) return "";
    return cursor->get<std::string>();
}

std::string StringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

Error NotFoundError(const std::string& operation, const std::string& what) {
    return Error{operation, "", std::nullopt, what + " not found",
                 std::nullopt, ErrorCategory::NotFound};
}

// Walks the pages of a list method until `match` returns an ID.
IdResult FindInPages(ISlackClient& slack,
                     const std::string& method,
                     nlohmann::json params,
                     const char* list_key,
                     const std::function<std::string(const nlohmann::json&)>& match) {
    for (int page = 0; page < kMaxLookupPages; ++page) {
        auto response = slack.Call(method, params);
        if (response.IsErr()) {
            return IdResult::Err(std::move(response).Error());
        }
        const auto& body = response.Value();
        auto items = body.find(list_key);
        if (items != body.end() && items->is_array()) {
            for (const auto& item : *items) {
                if (!item.is_object()) continue;
                auto id = match(item);
                if (!id.empty()) return IdResult::Ok(id);
            }
        }
        auto cursor = NextCursor(body);
        if (cursor.empty()) break;
        params["cursor"] = cursor;
    }
    return IdResult::Ok(std::string());
}

} // anonymous namespace

Result<std::string, Error> ResolveChannelId(ISlackClient& slack,
                                            const std::string& reference) {
    if (ChannelId::Create(reference).IsOk()) {
        return IdResult::Ok(reference);
    }

    auto name = reference;
    if (!name.empty() && name.front() == '#') name.erase(0, 1);
    if (name.empty()) {
        return IdResult::Err(Error{"ResolveChannel", "", std::nullopt,
                                   "Channel name must not be empty", std::nullopt,
                                   ErrorCategory::InvalidArgument});
    }

    auto found = FindInPages(
        slack, "conversations.list",
        {{"types", "public_channel,private_channel"},
         {"exclude_archived", false},
         {"limit", 1000}},
        "channels",
        [&name](const nlohmann::json& channel) {
            return StringField(channel, "name") == name ? StringField(channel, "id")
                                                        : std::string();
        });
    if (found.IsErr()) return found;
    if (found.Value().empty()) {
        return IdResult::Err(NotFoundError("ResolveChannel", "Channel '" + reference + "'"));
    }
    LogDebug("slack", "Resolved channel", {{"name", name}, {"id", found.Value()}});
    return found;
}

Result<std::string, Error> ResolveUserId(ISlackClient& slack,
                                         const std::string& reference) {
    if (UserId::Create(reference).IsOk()) {
        return IdResult::Ok(reference);
    }

    auto name = reference;
    if (!name.empty() && name.front() == '@') name.erase(0, 1);
    if (name.empty()) {
        return IdResult::Err(Error{"ResolveUser", "", std::nullopt,
                                   "User name must not be empty", std::nullopt,
                                   ErrorCategory::InvalidArgument});
    }

    auto found = FindInPages(
        slack, "users.list", {{"limit", 200}}, "members",
        [&name](const nlohmann::json& user) {
            std::string display;
            auto profile = user.find("profile");
            if (profile != user.end() && profile->is_object()) {
                display = StringField(*profile, "display_name");
            }
            if (StringField(user, "name") == name ||
                StringField(user, "real_name") == name ||
                (!display.empty() && display == name)) {
                return StringField(user, "id");
            }
            return std::string();
        });
    if (found.IsErr()) return found;
    if (found.Value().empty()) {
        return IdResult::Err(NotFoundError("ResolveUser", "User '" + reference + "'"));
    }
    LogDebug("slack", "Resolved user", {{"name", name}, {"id", found.Value()}});
    return found;
}

Result<std::string, Error> ResolveConversationId(ISlackClient& slack,
                                                 const std::string& reference) {
    const bool is_user = (!reference.empty() && reference.front() == '@') ||
                         UserId::Create(reference).IsOk();
    if (!is_user) {
        return ResolveChannelId(slack, reference);
    }

    auto user = ResolveUserId(slack, reference);
    if (user.IsErr()) return user;

    auto opened = slack.Call("conversations.open", {{"users", user.Value()}});
    if (opened.IsErr()) {
        return IdResult::Err(std::move(opened).Error());
    }
    auto channel = opened.Value().find("channel");
    if (channel == opened.Value().end() || !channel->is_object() ||
        StringField(*channel, "id").empty()) {
        return IdResult::Err(Error{"OpenDirectMessage", "conversations.open",
                                   std::nullopt,
                                   "Could not open a direct message with " + reference,
                                   std::nullopt, ErrorCategory::SlackApi});
    }
    return IdResult::Ok(StringField(*channel, "id"));
}

} // namespace slack_mcp
