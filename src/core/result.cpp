#include <slack_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace slack_mcp {

namespace {

// Slack error bodies look like {"ok":false,"error":"channel_not_found"}.
// Anything else (HTML error pages from a proxy, empty bodies) yields nullopt.
std::optional<std::string> ExtractSlackErrorCode(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    auto it = parsed.find("error");
    if (it == parsed.end() || !it->is_string()) return std::nullopt;

    auto code = it->get<std::string>();
    if (code.empty()) return std::nullopt;
    return code;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto slack_error = ExtractSlackErrorCode(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::InvalidArgument;
            message = slack_error.has_value()
                ? "Bad request: " + *slack_error
                : "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed. Please check your Slack bot token.";
            break;
        case 403:
            category = ErrorCategory::Permission;
            message = "Permission denied. The bot may not have the required permissions.";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Resource not found. Please check the channel or user ID.";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::RateLimited;
            message = "Rate limit exceeded. Please try again later.";
            break;
        case 500:
            category = ErrorCategory::SlackApi;
            message = slack_error.has_value()
                ? "Slack server error: " + *slack_error
                : "Slack server internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Slack API unavailable";
            break;
        default:
            category = ErrorCategory::SlackApi;
            message = "Slack HTTP Error (" + std::to_string(status_code) + ")";
            break;
    }

    return Error{operation, endpoint, status_code, message, slack_error, category};
}

std::string Error::ToJson() const {
    nlohmann::json inner;
    inner["category"] = CategoryName();
    inner["operation"] = operation;
    if (!endpoint.empty()) {
        inner["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        inner["http_status"] = *http_status;
    }
    inner["message"] = message;
    if (slack_error.has_value() && !slack_error->empty()) {
        inner["slack_error"] = *slack_error;
    }
    inner["exit_code"] = ExitCode();
    return nlohmann::json{{"error", inner}}.dump();
}

} // namespace slack_mcp
