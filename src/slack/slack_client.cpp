#include <slack_mcp/slack/slack_client.hpp>

#include <slack_mcp/core/log.hpp>
#include <slack_mcp/slack/slack_errors.hpp>

#include <httplib.h>

#include <algorithm>
#include <mutex>
#include <thread>
#include <utility>

namespace slack_mcp {

namespace {

using CallResult = Result<nlohmann::json, Error>;

// "https://slack.com/api" -> {"https://slack.com", "/api"}. httplib::Client
// takes scheme://host[:port] only.
std::pair<std::string, std::string> SplitApiUrl(const std::string& url) {
    auto scheme_end = url.find("://");
    auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        return {url, ""};
    }
    auto prefix = url.substr(path_start);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return {url.substr(0, path_start), prefix};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

// Longer waits are cut to max_backoff anyway; this only keeps the
// conversion to milliseconds in range.
constexpr long kMaxRetryAfterSeconds = 86400;

// Retry-After is whole seconds for the Web API.
std::optional<std::chrono::milliseconds> ParseRetryAfter(const std::string& value) {
    if (value.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        auto seconds = std::stol(value, &consumed);
        if (consumed != value.size() || seconds < 0) return std::nullopt;
        seconds = std::min(seconds, kMaxRetryAfterSeconds);
        return std::chrono::milliseconds(static_cast<long long>(seconds) * 1000);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Web API arguments travel form-encoded. Nested objects and arrays (blocks,
// profile, ...) are sent as JSON text, which is what Slack expects for them.
httplib::Params ToFormParams(const nlohmann::json& params) {
    httplib::Params form;
    if (!params.is_object()) return form;
    for (const auto& item : params.items()) {
        const auto& value = item.value();
        if (value.is_null()) continue;
        if (value.is_string()) {
            form.emplace(item.key(), value.get<std::string>());
        } else {
            form.emplace(item.key(),
                         value.dump(-1, ' ', false,
                                    nlohmann::json::error_handler_t::replace));
        }
    }
    return form;
}

bool IsRetryableStatus(int status) {
    return status == 429 || (status >= 500 && status <= 599);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl - pimpl body holding the httplib::Client and credentials.
// ---------------------------------------------------------------------------
struct SlackClient::Impl {
    std::unique_ptr<httplib::Client> client;
    std::mutex client_mutex;
    std::string path_prefix;
    SlackToken bot_token;
    std::optional<SlackToken> user_token;
    SlackClientOptions options;

    Impl(SlackToken bot, std::optional<SlackToken> user,
         const SlackClientOptions& opts)
        : bot_token(std::move(bot)), user_token(std::move(user)), options(opts) {
        auto [origin, prefix] = SplitApiUrl(opts.api_url);
        path_prefix = prefix;
        client = std::make_unique<httplib::Client>(origin);
        client->set_connection_timeout(opts.timeout);
        client->set_read_timeout(opts.timeout);
        client->set_write_timeout(opts.timeout);
        client->set_keep_alive(true);
    }

    std::chrono::milliseconds Backoff(int attempt) const {
        auto delay = options.base_backoff;
        for (int i = 0; i < attempt && delay < options.max_backoff; ++i) {
            delay *= 2;
        }
        return std::min(delay, options.max_backoff);
    }

    void Wait(std::chrono::milliseconds delay, const std::string& method,
              int attempt, const std::string& reason) const {
        LogWarn("slack", "Retrying Slack call",
                {{"method", method},
                 {"attempt", std::to_string(attempt + 1)},
                 {"reason", reason},
                 {"delay_ms", std::to_string(delay.count())}});
        std::this_thread::sleep_for(delay);
    }

    // One HTTP round trip. Serialized: httplib::Client is not meant to be
    // driven from several threads at once.
    httplib::Result Post(const std::string& path, const httplib::Params& form,
                         const SlackToken& token) {
        httplib::Headers headers{
            {"Authorization", "Bearer " + token.Value()},
            {"Accept", "application/json"},
        };
        std::lock_guard<std::mutex> lock(client_mutex);
        return client->Post(path, headers, form);
    }
};

// ---------------------------------------------------------------------------
// SlackClient - constructor / destructor
// ---------------------------------------------------------------------------
SlackClient::SlackClient(SlackToken bot_token,
                         std::optional<SlackToken> user_token,
                         const SlackClientOptions& options)
    : impl_(std::make_unique<Impl>(std::move(bot_token), std::move(user_token),
                                   options)) {
    LogInfo("slack", "Slack client initialized",
            {{"api_url", options.api_url},
             {"bot_token", impl_->bot_token.Redacted()},
             {"user_token", impl_->user_token ? impl_->user_token->Redacted() : "none"},
             {"timeout_ms", std::to_string(options.timeout.count())},
             {"max_retries", std::to_string(options.max_retries)}});
}

SlackClient::~SlackClient() = default;

bool SlackClient::HasUserToken() const {
    return impl_->user_token.has_value();
}

// ---------------------------------------------------------------------------
// Call - POST with retry
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> SlackClient::Call(const std::string& method,
                                                const nlohmann::json& params,
                                                TokenKind token) {
    if (token == TokenKind::User && !impl_->user_token.has_value()) {
        return CallResult::Err(Error{"SlackCall", method, std::nullopt,
                                     kUserTokenMissingMessage, std::nullopt,
                                     ErrorCategory::Authentication});
    }
    const auto& credential =
        token == TokenKind::User ? *impl_->user_token : impl_->bot_token;

    const auto path = impl_->path_prefix + "/" + method;
    const auto form = ToFormParams(params);
    const int max_retries = std::max(0, impl_->options.max_retries);

    for (int attempt = 0;; ++attempt) {
        const bool can_retry = attempt < max_retries;

        LogDebug("http", "POST " + path, {{"attempt", std::to_string(attempt + 1)}});
        auto res = impl_->Post(path, form, credential);

        if (!res) {
            const auto http_error = res.error();
            const auto reason = httplib::to_string(http_error);
            if (can_retry) {
                impl_->Wait(impl_->Backoff(attempt), method, attempt, reason);
                continue;
            }
            return CallResult::Err(Error{
                "SlackCall", method, std::nullopt,
                "Failed to reach the Slack API: " + reason, std::nullopt,
                CategoryFromHttpTransportError(http_error)});
        }

        LogDebug("http", "  < " + std::to_string(res->status));

        if (IsRetryableStatus(res->status)) {
            if (can_retry) {
                auto delay = impl_->Backoff(attempt);
                if (res->status == 429) {
                    auto retry_after =
                        ParseRetryAfter(res->get_header_value("Retry-After"));
                    if (retry_after) {
                        delay = std::min(*retry_after, impl_->options.max_backoff);
                    }
                }
                impl_->Wait(delay, method, attempt,
                            "HTTP " + std::to_string(res->status));
                continue;
            }
            return CallResult::Err(
                Error::FromHttpStatus("SlackCall", method, res->status, res->body));
        }

        if (res->status != 200) {
            return CallResult::Err(
                Error::FromHttpStatus("SlackCall", method, res->status, res->body));
        }

        auto parsed = nlohmann::json::parse(res->body, nullptr,
                                            /*allow_exceptions=*/false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return CallResult::Err(Error{
                "SlackCall", method, res->status,
                "Invalid response from the Slack API", std::nullopt,
                ErrorCategory::SlackApi});
        }

        auto ok = parsed.find("ok");
        if (ok != parsed.end() && ok->is_boolean() && ok->get<bool>()) {
            return CallResult::Ok(std::move(parsed));
        }

        std::string code = "unknown_error";
        auto error_it = parsed.find("error");
        if (error_it != parsed.end() && error_it->is_string()) {
            code = error_it->get<std::string>();
        }
        if (can_retry && IsRetryableSlackError(code)) {
            impl_->Wait(impl_->Backoff(attempt), method, attempt, code);
            continue;
        }
        LogDebug("slack", "Slack call failed", {{"method", method}, {"error", code}});
        return CallResult::Err(MakeSlackApiError(method, code));
    }
}

} // namespace slack_mcp
